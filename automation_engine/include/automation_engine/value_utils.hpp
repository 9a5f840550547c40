#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

namespace automation_engine
{

/// A value that is not present at all, as opposed to an explicit null.
YAML::Node undefinedValue();

/**
 * @brief Reads a dot-separated path ("meta.owner.name") out of node data.
 *
 * Missing keys, subscripts on scalars and out-of-range sequence indices yield an
 * undefined value instead of an error. Numeric segments index into sequences.
 */
YAML::Node nestedValue(const YAML::Node & data, const std::string & path);

/**
 * @brief String coercion used by every string-based comparison.
 *
 * undefined -> "undefined", null -> "null", scalars -> their text, sequences -> elements
 * joined with ",", maps -> "[object Object]".
 */
std::string valueToString(const YAML::Node & value);

/**
 * @brief Numeric coercion. Returns NaN when the value has no numeric reading.
 *
 * null and "" read as 0, "true"/"false" as 1/0, single-element sequences as their element.
 */
double valueToNumber(const YAML::Node & value);

/// undefined, null, "" and the empty sequence are empty.
bool valueIsEmpty(const YAML::Node & value);

/**
 * @brief Strict equality for trigger value filters.
 *
 * Scalars compare by text, null equals null, undefined equals undefined. Sequences and maps
 * are equal only to themselves.
 */
bool valuesStrictEqual(const YAML::Node & a, const YAML::Node & b);

}  // namespace automation_engine
