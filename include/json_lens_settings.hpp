#pragma once

#include "json_diff.hpp"

#include <cstddef>
#include <string>

// User preferences shared by the viewer and the comparison.
struct LensSettings
{
    int defaultFoldDepth = 2;
    int indentSize = 4;            // 2 or 4
    bool ignoreEscapeSequences = false;
    CompareOptions compare;
    int collapseContext = 3;
    size_t maxDisplayLines = 10000;
};

// Missing fields keep their defaults.  A field of the wrong type throws
// json::type_error; a document that is not an object throws
// std::runtime_error.
LensSettings settingsFromJson(const json &j);
json settingsToJson(const LensSettings &settings);

// Whole file as a string.  Throws std::runtime_error when it cannot be
// opened.
std::string readTextFile(const std::string &path);

// Read and parse a JSON settings file.
LensSettings loadSettings(const std::string &path);
