// Settings file handling
#include "json_lens_settings.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

static int normalizedIndent(int indent)
{
    return (indent == 2 || indent == 4) ? indent : 4;
}

LensSettings settingsFromJson(const json &j)
{
    if (!j.is_object())
        throw std::runtime_error("settings must be a JSON object, got " + typeDescription(j));

    LensSettings settings;
    settings.defaultFoldDepth = std::max(0, j.value("defaultFoldDepth", settings.defaultFoldDepth));
    settings.indentSize = normalizedIndent(j.value("indentSize", settings.indentSize));
    settings.ignoreEscapeSequences =
        j.value("ignoreEscapeSequences", settings.ignoreEscapeSequences);
    settings.collapseContext = std::max(0, j.value("collapseContext", settings.collapseContext));
    long long maxLines =
        j.value("maxDisplayLines", static_cast<long long>(settings.maxDisplayLines));
    settings.maxDisplayLines = static_cast<size_t>(std::max(0LL, maxLines));

    auto it = j.find("compare");
    if (it != j.end())
    {
        const json &c = *it;
        if (!c.is_object())
            throw std::runtime_error("\"compare\" must be a JSON object, got " +
                                     typeDescription(c));
        CompareOptions &options = settings.compare;
        options.ignoreKeyOrder = c.value("ignoreKeyOrder", options.ignoreKeyOrder);
        options.ignoreArrayOrder = c.value("ignoreArrayOrder", options.ignoreArrayOrder);
        options.strictType = c.value("strictType", options.strictType);
        options.matchKeys = c.value("matchKeys", options.matchKeys);
    }
    return settings;
}

json settingsToJson(const LensSettings &settings)
{
    json j;
    j["defaultFoldDepth"] = settings.defaultFoldDepth;
    j["indentSize"] = settings.indentSize;
    j["ignoreEscapeSequences"] = settings.ignoreEscapeSequences;
    j["collapseContext"] = settings.collapseContext;
    j["maxDisplayLines"] = settings.maxDisplayLines;
    j["compare"] = {
        {"ignoreKeyOrder", settings.compare.ignoreKeyOrder},
        {"ignoreArrayOrder", settings.compare.ignoreArrayOrder},
        {"strictType", settings.compare.strictType},
        {"matchKeys", settings.compare.matchKeys},
    };
    return j;
}

std::string readTextFile(const std::string &path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Failed to open file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

LensSettings loadSettings(const std::string &path)
{
    return settingsFromJson(json::parse(readTextFile(path)));
}
