#pragma once

#include <nlohmann/json.hpp>
#include <string>

// nlohmann::json is the value model.  Parsed documents only ever hold
// strings, numbers, booleans, null, objects and arrays; objects are
// key-sorted maps, so equality ignores the source order of keys.
using json = nlohmann::json;

// One of "string", "number", "boolean", "null", "object", "array".
std::string typeDescription(const json &v);
bool isContainer(const json &v);
size_t childCount(const json &v);

// Text for a number: integral values without a fraction, everything
// else in the shortest form that reads back to the same double.
std::string numberText(double d);

// numberText for a parsed number; integers keep their exact digits.
std::string jsonNumberText(const json &v);

// Canonical JSON text with sorted keys.  The pretty form puts one
// element per line, writes keys as "key" : value and indents by
// `indent` spaces per level.
std::string toJsonString(const json &v, bool pretty = true, int indent = 4);

// Parse `text` and pretty print it; invalid JSON comes back unchanged.
std::string formatJsonText(const std::string &text, int indent = 4);

// Parse JSON while accepting the NaN/Infinity/-Infinity literals.
// Throws json::parse_error on malformed input.
json parseJsonWithSpecialNumbers(const std::string &contents);

// Escape control characters, quotes and backslashes for display.
std::string escapeForDisplay(const std::string &s);

std::string displayValue(const json &v);
std::string copyValue(const json &v);
std::string plainValue(const json &v);
