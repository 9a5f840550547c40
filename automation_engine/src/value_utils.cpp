#include <automation_engine/value_utils.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace automation_engine
{
namespace
{

bool isIndex(const std::string & segment)
{
  if (segment.empty()) {
    return false;
  }
  for (const char c : segment) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string trim(const std::string & text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

double parseNumber(const std::string & raw)
{
  const auto text = trim(raw);
  if (text.empty()) {
    return 0.0;
  }
  if (text == "true") {
    return 1.0;
  }
  if (text == "false") {
    return 0.0;
  }
  if (text == "Infinity" || text == "+Infinity") {
    return std::numeric_limits<double>::infinity();
  }
  if (text == "-Infinity") {
    return -std::numeric_limits<double>::infinity();
  }
  const char * begin = text.c_str();
  char * end = nullptr;
  const double value = std::strtod(begin, &end);
  // strtod also accepts "inf"/"nan" spellings and hex floats; only plain decimals count.
  if (end != begin + text.size() || std::isinf(value) || std::isnan(value)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  for (const char c : text) {
    if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') {
      return std::numeric_limits<double>::quiet_NaN();
    }
  }
  return value;
}

}  // namespace

YAML::Node undefinedValue()
{
  return YAML::Node(YAML::NodeType::Undefined);
}

YAML::Node nestedValue(const YAML::Node & data, const std::string & path)
{
  if (!data.IsDefined()) {
    return undefinedValue();
  }

  YAML::Node current = data;
  std::stringstream parts(path);
  std::string segment;
  while (std::getline(parts, segment, '.')) {
    if (!current.IsDefined() || current.IsNull()) {
      return undefinedValue();
    }

    // const operator[] yields an invalid node for a missing key, and reset() throws on one.
    YAML::Node next;
    if (current.IsMap()) {
      const YAML::Node & map = current;
      const YAML::Node child = map[segment];
      if (!child) {
        return undefinedValue();
      }
      next.reset(child);
    } else if (current.IsSequence() && isIndex(segment)) {
      const auto index = std::strtoul(segment.c_str(), nullptr, 10);
      if (index >= current.size()) {
        return undefinedValue();
      }
      const YAML::Node & sequence = current;
      const YAML::Node element = sequence[index];
      if (!element) {
        return undefinedValue();
      }
      next.reset(element);
    } else {
      return undefinedValue();
    }

    if (!next.IsDefined()) {
      return undefinedValue();
    }
    // reset() rebinds the handle; plain assignment would write into the tree.
    current.reset(next);
  }
  return current;
}

std::string valueToString(const YAML::Node & value)
{
  if (!value.IsDefined()) {
    return "undefined";
  }
  switch (value.Type()) {
    case YAML::NodeType::Null:
      return "null";
    case YAML::NodeType::Scalar:
      return value.Scalar();
    case YAML::NodeType::Sequence: {
      std::string out;
      bool first = true;
      for (const auto & element : value) {
        if (!first) {
          out += ",";
        }
        first = false;
        // Array join renders null/undefined elements as empty strings.
        if (element.IsDefined() && !element.IsNull()) {
          out += valueToString(element);
        }
      }
      return out;
    }
    case YAML::NodeType::Map:
      return "[object Object]";
    default:
      return "undefined";
  }
}

double valueToNumber(const YAML::Node & value)
{
  if (!value.IsDefined()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  switch (value.Type()) {
    case YAML::NodeType::Null:
      return 0.0;
    case YAML::NodeType::Scalar:
      return parseNumber(value.Scalar());
    case YAML::NodeType::Sequence:
      if (value.size() == 0) {
        return 0.0;
      }
      if (value.size() == 1) {
        return valueToNumber(value[0]);
      }
      return std::numeric_limits<double>::quiet_NaN();
    default:
      return std::numeric_limits<double>::quiet_NaN();
  }
}

bool valueIsEmpty(const YAML::Node & value)
{
  if (!value.IsDefined() || value.IsNull()) {
    return true;
  }
  if (value.IsScalar()) {
    return value.Scalar().empty();
  }
  if (value.IsSequence()) {
    return value.size() == 0;
  }
  return false;
}

bool valuesStrictEqual(const YAML::Node & a, const YAML::Node & b)
{
  if (!a.IsDefined() || !b.IsDefined()) {
    return !a.IsDefined() && !b.IsDefined();
  }
  if (a.IsNull() || b.IsNull()) {
    return a.IsNull() && b.IsNull();
  }
  if (a.IsScalar() && b.IsScalar()) {
    return a.Scalar() == b.Scalar();
  }
  return a.is(b);
}

}  // namespace automation_engine
