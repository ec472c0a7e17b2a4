/**
 * Canopy Hyperparameter Implementation
 */

#include "canopy/params.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace canopy {

// ============================================================================
// Value Access
// ============================================================================

std::string to_string(const ParamValue& value) {
    if (std::holds_alternative<std::monostate>(value)) return "none";
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *d;
        return out.str();
    }
    return std::get<std::string>(value);
}

std::string to_string(const ParamSet& params) {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : params) {
        if (!first) out += ", ";
        out += name + "=" + to_string(value);
        first = false;
    }
    return out + "}";
}

bool is_none(const ParamValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

int64_t param_as_int(const std::string& name, const ParamValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    throw std::invalid_argument("parameter '" + name + "' expects an integer, got " +
                                to_string(value));
}

Float param_as_real(const std::string& name, const ParamValue& value) {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<Float>(*i);
    throw std::invalid_argument("parameter '" + name + "' expects a number, got " +
                                to_string(value));
}

std::string param_as_string(const std::string& name, const ParamValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    throw std::invalid_argument("parameter '" + name + "' expects a string, got " +
                                to_string(value));
}

namespace {

uint64_t as_count(const std::string& name, const ParamValue& value, int64_t min_value) {
    int64_t n = param_as_int(name, value);
    if (n < min_value) {
        throw std::invalid_argument("parameter '" + name + "' must be at least " +
                                    std::to_string(min_value) + ", got " + std::to_string(n));
    }
    return static_cast<uint64_t>(n);
}

MaxFeatures as_max_features(const ParamValue& value) {
    MaxFeatures mf;
    if (is_none(value)) {
        mf = MaxFeatures::all();
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        if (*i < 1) {
            throw std::invalid_argument("max_features count must be at least 1");
        }
        mf = MaxFeatures::fixed(static_cast<Index>(*i));
    } else if (const auto* d = std::get_if<double>(&value)) {
        mf = MaxFeatures::of_fraction(*d);
    } else {
        mf = MaxFeatures::parse(std::get<std::string>(value));
    }
    mf.validate();
    return mf;
}

} // namespace

// ============================================================================
// Config Application
// ============================================================================

bool apply_tree_param(TreeConfig& config, const std::string& name, const ParamValue& value) {
    if (name == "criterion") {
        config.criterion = parse_criterion(param_as_string(name, value));
    } else if (name == "max_depth") {
        if (is_none(value)) {
            config.max_depth.reset();
        } else {
            config.max_depth = static_cast<uint32_t>(as_count(name, value, 0));
        }
    } else if (name == "min_samples_split") {
        config.min_samples_split = static_cast<Index>(as_count(name, value, 1));
    } else if (name == "min_impurity_decrease") {
        Float threshold = param_as_real(name, value);
        if (!std::isfinite(threshold)) {
            throw std::invalid_argument("min_impurity_decrease must be finite");
        }
        config.min_impurity_decrease = threshold;
    } else if (name == "max_features") {
        config.max_features = as_max_features(value);
    } else if (name == "max_candidates") {
        config.max_candidates = static_cast<Index>(as_count(name, value, 1));
    } else if (name == "seed") {
        config.seed = static_cast<uint64_t>(param_as_int(name, value));
    } else {
        return false;
    }
    return true;
}

bool apply_forest_param(ForestConfig& config, const std::string& name, const ParamValue& value) {
    if (name == "n_estimators") {
        config.n_estimators = static_cast<uint32_t>(as_count(name, value, 1));
        return true;
    }
    if (name == "seed") {
        config.seed = static_cast<uint64_t>(param_as_int(name, value));
        return true;
    }
    return apply_tree_param(config.tree, name, value);
}

// ============================================================================
// Grid Expansion
// ============================================================================

std::vector<ParamSet> expand_grid(const ParamGrid& grid) {
    if (grid.empty()) {
        throw std::invalid_argument("hyperparameter grid is empty");
    }
    for (const auto& [name, values] : grid) {
        if (values.empty()) {
            throw std::invalid_argument("hyperparameter '" + name + "' has no candidate values");
        }
    }

    std::vector<ParamSet> combinations{ParamSet{}};
    for (const auto& [name, values] : grid) {
        std::vector<ParamSet> expanded;
        expanded.reserve(combinations.size() * values.size());
        for (const auto& partial : combinations) {
            for (const auto& value : values) {
                ParamSet next = partial;
                next[name] = value;
                expanded.push_back(std::move(next));
            }
        }
        combinations = std::move(expanded);
    }
    return combinations;
}

} // namespace canopy
