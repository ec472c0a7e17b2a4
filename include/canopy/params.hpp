#pragma once

/**
 * Canopy Hyperparameters by Name
 *
 * Grid search addresses hyperparameters by name. A value is none, an integer,
 * a real or a string; the receiving model checks the type and throws
 * std::invalid_argument for unknown names or mismatched types.
 */

#include "types.hpp"
#include "config.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace canopy {

using ParamValue = std::variant<std::monostate, int64_t, double, std::string>;

// One cell of a grid; keys iterate in sorted order
using ParamSet = std::map<std::string, ParamValue>;

// Candidate values per name
using ParamGrid = std::map<std::string, std::vector<ParamValue>>;

// ============================================================================
// Value Access
// ============================================================================

std::string to_string(const ParamValue& value);
std::string to_string(const ParamSet& params);

bool is_none(const ParamValue& value);
int64_t param_as_int(const std::string& name, const ParamValue& value);
Float param_as_real(const std::string& name, const ParamValue& value);
std::string param_as_string(const std::string& name, const ParamValue& value);

// ============================================================================
// Config Application
// ============================================================================

/**
 * Apply a named tree hyperparameter.
 * Returns false when the name is not a tree parameter.
 */
bool apply_tree_param(TreeConfig& config, const std::string& name, const ParamValue& value);

/**
 * Apply a named forest hyperparameter (forest names first, then tree names
 * on the member configuration). Returns false for unknown names.
 */
bool apply_forest_param(ForestConfig& config, const std::string& name, const ParamValue& value);

// ============================================================================
// Grid Expansion
// ============================================================================

/**
 * Cartesian product of the grid, last key varying fastest.
 * Throws std::invalid_argument for an empty grid or an empty value list.
 */
std::vector<ParamSet> expand_grid(const ParamGrid& grid);

} // namespace canopy
