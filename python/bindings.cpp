/**
 * Canopy Python Bindings
 *
 * Provides sklearn-compatible API for easy integration.
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <memory>

#include "canopy/canopy.hpp"

namespace py = pybind11;
using namespace canopy;

// ============================================================================
// NumPy Conversion Utilities
// ============================================================================

template<typename T>
py::array_t<T> vector_to_numpy(const std::vector<T>& vec) {
    auto result = py::array_t<T>(vec.size());
    auto buf = result.request();
    std::memcpy(buf.ptr, vec.data(), vec.size() * sizeof(T));
    return result;
}

using FloatArray = py::array_t<Float, py::array::c_style | py::array::forcecast>;
using LabelArray = py::array_t<Label, py::array::c_style | py::array::forcecast>;

Matrix numpy_to_matrix(const FloatArray& X) {
    auto buf = X.request();
    if (buf.ndim != 2) {
        throw std::runtime_error("X must be 2-dimensional");
    }
    return Eigen::Map<const Matrix>(static_cast<const Float*>(buf.ptr),
                                    buf.shape[0], buf.shape[1]);
}

Dataset numpy_to_dataset(const FloatArray& X, const LabelArray& y,
                         const std::vector<int>& cat_features) {
    auto X_buf = X.request();
    auto y_buf = y.request();

    if (X_buf.ndim != 2) {
        throw std::runtime_error("X must be 2-dimensional");
    }
    if (y_buf.ndim != 1) {
        throw std::runtime_error("y must be 1-dimensional");
    }
    if (y_buf.shape[0] != X_buf.shape[0]) {
        throw std::invalid_argument("X and y must have the same number of rows");
    }

    std::vector<FeatureIndex> unordered;
    for (int f : cat_features) {
        if (f < 0) {
            throw std::invalid_argument("cat_features must be non-negative");
        }
        unordered.push_back(static_cast<FeatureIndex>(f));
    }

    return Dataset::from_dense(
        static_cast<const Float*>(X_buf.ptr),
        static_cast<Index>(X_buf.shape[0]),
        static_cast<FeatureIndex>(X_buf.shape[1]),
        static_cast<const Label*>(y_buf.ptr),
        unordered
    );
}

// ============================================================================
// Parameter Conversion
// ============================================================================

ParamValue to_param(const py::handle& obj) {
    if (obj.is_none()) return ParamValue{};
    if (py::isinstance<py::bool_>(obj)) {
        throw std::invalid_argument("boolean hyperparameter values are not supported");
    }
    if (py::isinstance<py::int_>(obj)) return obj.cast<int64_t>();
    if (py::isinstance<py::float_>(obj)) return obj.cast<double>();
    if (py::isinstance<py::str>(obj)) return obj.cast<std::string>();
    throw std::invalid_argument("unsupported hyperparameter value " +
                                py::repr(obj).cast<std::string>());
}

py::object from_param(const ParamValue& value) {
    if (is_none(value)) return py::none();
    if (const auto* i = std::get_if<int64_t>(&value)) return py::int_(*i);
    if (const auto* d = std::get_if<double>(&value)) return py::float_(*d);
    return py::str(std::get<std::string>(value));
}

ParamSet to_param_set(const py::dict& params) {
    ParamSet out;
    for (auto item : params) {
        out[item.first.cast<std::string>()] = to_param(item.second);
    }
    return out;
}

py::dict from_param_set(const ParamSet& params) {
    py::dict out;
    for (const auto& [name, value] : params) {
        out[py::str(name)] = from_param(value);
    }
    return out;
}

py::list flatten_to_python(const DecisionTree& tree) {
    py::list nodes;
    for (const FlatNode& node : tree.flatten()) {
        py::dict d;
        d["is_leaf"] = node.is_leaf;
        d["feature"] = node.feature;
        d["kind"] = node.kind == FeatureKind::Ordered ? "ordered" : "unordered";
        d["value"] = node.value;
        d["prediction"] = node.prediction;
        d["depth"] = node.depth;
        d["gain"] = node.gain;
        d["impurity"] = node.impurity;
        d["n_samples"] = node.n_samples;
        d["left"] = node.left;
        d["right"] = node.right;
        nodes.append(d);
    }
    return nodes;
}

// ============================================================================
// Python Classifier Classes
// ============================================================================

class PyDecisionTreeClassifier {
public:
    explicit PyDecisionTreeClassifier(const py::dict& params)
        : params_(to_param_set(params)), tree_(make_model()) {}

    PyDecisionTreeClassifier(ParamSet params, std::unique_ptr<DecisionTree> fitted)
        : params_(std::move(params)), tree_(std::move(fitted)) {}

    void fit(const FloatArray& X, const LabelArray& y, std::vector<int> cat_features) {
        Dataset data = numpy_to_dataset(X, y, cat_features);
        // Keep the previous model if this fit throws
        std::unique_ptr<DecisionTree> tree = make_model();
        tree->fit(data);
        tree_ = std::move(tree);
    }

    py::array_t<Label> predict(const FloatArray& X) const {
        return vector_to_numpy(tree_->predict(numpy_to_matrix(X)));
    }

    py::array_t<Float> feature_importances() const {
        return vector_to_numpy(tree_->feature_importances());
    }

    py::dict get_params() const { return from_param_set(params_); }

    py::list tree_structure() const { return flatten_to_python(*tree_); }

    uint32_t depth() const { return tree_->depth(); }
    Index n_nodes() const { return tree_->n_nodes(); }
    Index n_leaves() const { return tree_->n_leaves(); }

private:
    ParamSet params_;
    std::unique_ptr<DecisionTree> tree_;

    std::unique_ptr<DecisionTree> make_model() const {
        auto tree = std::make_unique<DecisionTree>();
        for (const auto& [name, value] : params_) {
            tree->set_param(name, value);
        }
        return tree;
    }
};

class PyRandomForestClassifier {
public:
    PyRandomForestClassifier(const py::dict& params, int n_threads, int verbosity)
        : params_(to_param_set(params)), n_threads_(n_threads), verbosity_(verbosity) {
        forest_ = make_model();
    }

    PyRandomForestClassifier(ParamSet params, std::unique_ptr<RandomForest> fitted)
        : params_(std::move(params)), forest_(std::move(fitted)) {
        n_threads_ = forest_->config().n_threads;
        verbosity_ = forest_->config().verbosity;
    }

    void fit(const FloatArray& X, const LabelArray& y, std::vector<int> cat_features) {
        Dataset data = numpy_to_dataset(X, y, cat_features);
        std::unique_ptr<RandomForest> forest = make_model();

        {
            // Release the GIL while members grow
            py::gil_scoped_release release;
            forest->fit(data);
        }
        forest_ = std::move(forest);
    }

    py::array_t<Label> predict(const FloatArray& X) const {
        return vector_to_numpy(forest_->predict(numpy_to_matrix(X)));
    }

    py::array_t<Float> feature_importances() const {
        return vector_to_numpy(forest_->feature_importances());
    }

    py::dict get_params() const { return from_param_set(params_); }

    size_t n_trees() const { return forest_->n_trees(); }

    py::list tree_structure(size_t idx) const {
        if (idx >= forest_->n_trees()) {
            throw py::index_error("tree index out of range");
        }
        return flatten_to_python(forest_->tree(idx));
    }

private:
    ParamSet params_;
    int n_threads_ = -1;
    int verbosity_ = 0;
    std::unique_ptr<RandomForest> forest_;

    std::unique_ptr<RandomForest> make_model() const {
        ForestConfig config;
        config.n_threads = n_threads_;
        config.verbosity = verbosity_;
        auto forest = std::make_unique<RandomForest>(config);
        for (const auto& [name, value] : params_) {
            forest->set_param(name, value);
        }
        return forest;
    }
};

// ============================================================================
// Grid Search
// ============================================================================

py::dict grid_search(
    const std::string& estimator,
    const FloatArray& X,
    const LabelArray& y,
    const py::dict& param_grid,
    const py::dict& fixed_params,
    std::vector<int> cat_features,
    uint32_t n_folds,
    Float acceptable_accuracy,
    bool shuffle,
    uint64_t seed,
    int n_threads,
    int verbosity
) {
    if (estimator != "tree" && estimator != "forest") {
        throw std::invalid_argument("estimator must be 'tree' or 'forest', got '" + estimator + "'");
    }
    const bool is_forest = estimator == "forest";

    ParamGrid grid;
    for (auto item : param_grid) {
        std::vector<ParamValue> values;
        for (auto v : item.second) {
            values.push_back(to_param(v));
        }
        grid[item.first.cast<std::string>()] = std::move(values);
    }
    const ParamSet fixed = to_param_set(fixed_params);

    // Members run serially inside each search unit
    ClassifierFactory factory = [is_forest, fixed]() -> std::unique_ptr<Classifier> {
        std::unique_ptr<Classifier> model;
        if (is_forest) {
            ForestConfig config;
            config.n_threads = 1;
            model = std::make_unique<RandomForest>(config);
        } else {
            model = std::make_unique<DecisionTree>();
        }
        for (const auto& [name, value] : fixed) {
            model->set_param(name, value);
        }
        return model;
    };

    SearchConfig config;
    config.n_folds = n_folds;
    config.acceptable_accuracy = acceptable_accuracy;
    config.shuffle = shuffle;
    config.seed = seed;
    config.n_threads = n_threads;
    config.verbosity = verbosity;

    Dataset data = numpy_to_dataset(X, y, cat_features);
    GridSearch search(factory, grid, config);

    SearchOutcome outcome;
    {
        py::gil_scoped_release release;
        outcome = search.run(data);
    }

    ParamSet best_all = fixed;
    for (const auto& [name, value] : outcome.best_params) {
        best_all[name] = value;
    }

    py::object model;
    if (is_forest) {
        std::unique_ptr<RandomForest> forest(
            static_cast<RandomForest*>(outcome.best_model.release()));
        model = py::cast(PyRandomForestClassifier(best_all, std::move(forest)));
    } else {
        std::unique_ptr<DecisionTree> tree(
            static_cast<DecisionTree*>(outcome.best_model.release()));
        model = py::cast(PyDecisionTreeClassifier(best_all, std::move(tree)));
    }

    py::list results;
    for (const auto& r : outcome.results) {
        py::dict d;
        d["params"] = from_param_set(r.params);
        d["mean_accuracy"] = r.mean_accuracy;
        d["mean_depth"] = r.mean_depth;
        d["mean_n_nodes"] = r.mean_n_nodes;
        d["fold_accuracies"] = r.fold_accuracies;
        results.append(d);
    }

    py::dict out;
    out["best_params"] = from_param_set(outcome.best_params);
    out["best_index"] = outcome.best_index;
    out["used_fallback"] = outcome.used_fallback;
    out["best_model"] = model;
    out["results"] = results;
    return out;
}

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_canopy, m) {
    m.doc() = "Canopy: decision trees, random forests and cross-validated grid search";

    // Version info
    m.attr("__version__") = CANOPY_VERSION_STRING;

    py::class_<PyDecisionTreeClassifier>(m, "DecisionTreeClassifier")
        .def(py::init<const py::dict&>(),
             py::arg("params") = py::dict())
        .def("fit", &PyDecisionTreeClassifier::fit,
             py::arg("X"),
             py::arg("y"),
             py::arg("cat_features") = std::vector<int>())
        .def("predict", &PyDecisionTreeClassifier::predict,
             py::arg("X"))
        .def("feature_importances", &PyDecisionTreeClassifier::feature_importances)
        .def("get_params", &PyDecisionTreeClassifier::get_params)
        .def("tree_structure", &PyDecisionTreeClassifier::tree_structure)
        .def_property_readonly("depth", &PyDecisionTreeClassifier::depth)
        .def_property_readonly("n_nodes", &PyDecisionTreeClassifier::n_nodes)
        .def_property_readonly("n_leaves", &PyDecisionTreeClassifier::n_leaves);

    py::class_<PyRandomForestClassifier>(m, "RandomForestClassifier")
        .def(py::init<const py::dict&, int, int>(),
             py::arg("params") = py::dict(),
             py::arg("n_threads") = -1,
             py::arg("verbosity") = 0)
        .def("fit", &PyRandomForestClassifier::fit,
             py::arg("X"),
             py::arg("y"),
             py::arg("cat_features") = std::vector<int>())
        .def("predict", &PyRandomForestClassifier::predict,
             py::arg("X"))
        .def("feature_importances", &PyRandomForestClassifier::feature_importances)
        .def("get_params", &PyRandomForestClassifier::get_params)
        .def("tree_structure", &PyRandomForestClassifier::tree_structure,
             py::arg("index"))
        .def_property_readonly("n_trees", &PyRandomForestClassifier::n_trees);

    m.def("grid_search", &grid_search,
          py::arg("estimator"),
          py::arg("X"),
          py::arg("y"),
          py::arg("param_grid"),
          py::arg("fixed_params") = py::dict(),
          py::arg("cat_features") = std::vector<int>(),
          py::arg("n_folds") = 5,
          py::arg("acceptable_accuracy") = 0.0,
          py::arg("shuffle") = true,
          py::arg("seed") = 42,
          py::arg("n_threads") = -1,
          py::arg("verbosity") = 0,
          "Cross-validated grid search; returns the winner, every result and the refit model");

    // Utility functions
    m.def("print_info", &print_info, "Print Canopy library information");
}
