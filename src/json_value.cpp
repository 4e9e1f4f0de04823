// Value helpers: type names, canonical text and the tolerant parser
#include "json_value.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>

std::string typeDescription(const json &v)
{
    switch (v.type())
    {
    case json::value_t::string:
        return "string";
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        return "number";
    case json::value_t::boolean:
        return "boolean";
    case json::value_t::object:
        return "object";
    case json::value_t::array:
        return "array";
    default:
        return "null";
    }
}

bool isContainer(const json &v)
{
    return v.is_object() || v.is_array();
}

size_t childCount(const json &v)
{
    return isContainer(v) ? v.size() : 0;
}

std::string numberText(double d)
{
    if (std::isnan(d))
        return "NaN";
    if (std::isinf(d))
        return d > 0 ? "Infinity" : "-Infinity";

    // 1e308 printed in full needs 309 digits
    char buf[400];
    if (d == std::trunc(d))
    {
        std::snprintf(buf, sizeof(buf), "%.0f", d);
        return buf;
    }
    for (int precision = 1; precision <= 17; ++precision)
    {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d)
            break;
    }
    return buf;
}

std::string jsonNumberText(const json &j)
{
    if (j.is_number_float())
        return numberText(j.get<double>());
    return j.dump();
}

static std::string quoted(const std::string &s)
{
    return json(s).dump(-1, ' ', false, json::error_handler_t::replace);
}

// Write `j` in canonical form.  Object iteration is already key-sorted.
static void writeJson(std::ostream &out, const json &j, bool pretty, int indent, int level)
{
    std::string pad(pretty ? indent * level : 0, ' ');
    std::string childPad(pretty ? indent * (level + 1) : 0, ' ');
    switch (j.type())
    {
    case json::value_t::object:
        if (j.empty())
        {
            out << "{}";
            return;
        }
        out << (pretty ? "{\n" : "{");
        for (auto it = j.cbegin(); it != j.cend(); ++it)
        {
            out << childPad << quoted(it.key()) << (pretty ? " : " : ":");
            writeJson(out, it.value(), pretty, indent, level + 1);
            if (std::next(it) != j.cend())
                out << ",";
            if (pretty)
                out << "\n";
        }
        out << pad << "}";
        break;
    case json::value_t::array:
        if (j.empty())
        {
            out << "[]";
            return;
        }
        out << (pretty ? "[\n" : "[");
        for (size_t i = 0; i < j.size(); ++i)
        {
            out << childPad;
            writeJson(out, j[i], pretty, indent, level + 1);
            if (i + 1 < j.size())
                out << ",";
            if (pretty)
                out << "\n";
        }
        out << pad << "]";
        break;
    case json::value_t::string:
        out << quoted(j.get_ref<const json::string_t &>());
        break;
    case json::value_t::boolean:
        out << (j.get<bool>() ? "true" : "false");
        break;
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        out << jsonNumberText(j);
        break;
    default:
        out << "null";
        break;
    }
}

std::string toJsonString(const json &v, bool pretty, int indent)
{
    std::ostringstream oss;
    writeJson(oss, v, pretty, indent, 0);
    return oss.str();
}

std::string formatJsonText(const std::string &text, int indent)
{
    try
    {
        return toJsonString(parseJsonWithSpecialNumbers(text), true, indent);
    }
    catch (const json::parse_error &)
    {
        return text;
    }
}

// Replace placeholder strings with special floating-point values
static void replaceSpecialStrings(json &j)
{
    if (j.is_string())
    {
        auto &s = j.get_ref<json::string_t &>();
        if (s == "__JSON_LENS_NaN__")
            j = std::numeric_limits<double>::quiet_NaN();
        else if (s == "__JSON_LENS_INF__")
            j = std::numeric_limits<double>::infinity();
        else if (s == "__JSON_LENS_NEG_INF__")
            j = -std::numeric_limits<double>::infinity();
    }
    else if (j.is_object())
    {
        for (auto &el : j.items())
            replaceSpecialStrings(el.value());
    }
    else if (j.is_array())
    {
        for (auto &el : j)
            replaceSpecialStrings(el);
    }
}

// Parse JSON while preserving NaN/Infinity literals by using placeholders
json parseJsonWithSpecialNumbers(const std::string &contents)
{
    std::string processed;
    processed.reserve(contents.size());
    bool inString = false;
    for (size_t i = 0; i < contents.size();)
    {
        char c = contents[i];
        if (inString)
        {
            processed.push_back(c);
            if (c == '\\')
            {
                ++i;
                if (i < contents.size())
                    processed.push_back(contents[i]);
                ++i;
            }
            else if (c == '"')
            {
                inString = false;
                ++i;
            }
            else
            {
                ++i;
            }
        }
        else
        {
            if (c == '"')
            {
                inString = true;
                processed.push_back(c);
                ++i;
            }
            else if (contents.compare(i, 3, "NaN") == 0)
            {
                processed += "\"__JSON_LENS_NaN__\"";
                i += 3;
            }
            else if (contents.compare(i, 9, "-Infinity") == 0)
            {
                processed += "\"__JSON_LENS_NEG_INF__\"";
                i += 9;
            }
            else if (contents.compare(i, 8, "Infinity") == 0)
            {
                processed += "\"__JSON_LENS_INF__\"";
                i += 8;
            }
            else
            {
                processed.push_back(c);
                ++i;
            }
        }
    }

    json j = json::parse(processed);
    replaceSpecialStrings(j);
    return j;
}

std::string escapeForDisplay(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (c == '\\')
            out += "\\\\";
        else if (c == '\"')
            out += "\\\"";
        else if (c == '\n')
            out += "\\n";
        else if (c == '\r')
            out += "\\r";
        else if (c == '\t')
            out += "\\t";
        else if (static_cast<unsigned char>(c) < 0x20)
        {
            char buf[7];
            std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c);
            out += buf;
        }
        else
            out += c;
    }
    return out;
}

std::string displayValue(const json &v)
{
    if (v.is_string())
        return "\"" + v.get<std::string>() + "\"";
    if (v.is_object())
        return "{ " + std::to_string(v.size()) + " keys }";
    if (v.is_array())
        return "[ " + std::to_string(v.size()) + " elements ]";
    return plainValue(v);
}

std::string copyValue(const json &v)
{
    if (isContainer(v))
        return toJsonString(v, true);
    return displayValue(v);
}

std::string plainValue(const json &v)
{
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number())
        return jsonNumberText(v);
    if (v.is_boolean())
        return v.get<bool>() ? "true" : "false";
    if (isContainer(v))
        return toJsonString(v, true);
    return "null";
}
