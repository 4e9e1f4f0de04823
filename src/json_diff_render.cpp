// Line-level diff classification for pretty-printed JSON
#include "json_diff_render.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

static std::string trim(const std::string &s)
{
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Split a trimmed `"key" : rest` line.  Backslash escapes inside the key
// are skipped over, so an escaped quote does not end it.
static bool splitKeyedLine(const std::string &t, std::string &rawKey, std::string &rest)
{
    if (t.empty() || t[0] != '"')
        return false;
    size_t i = 1;
    while (i < t.size() && t[i] != '"')
    {
        i += (t[i] == '\\') ? 2 : 1;
    }
    if (i >= t.size())
        return false;
    size_t colon = t.find_first_not_of(" \t", i + 1);
    if (colon == std::string::npos || t[colon] != ':')
        return false;
    rawKey = t.substr(1, i - 1);
    rest = trim(t.substr(colon + 1));
    return true;
}

std::optional<std::string> extractKey(const std::string &line)
{
    std::string rawKey;
    std::string rest;
    if (!splitKeyedLine(trim(line), rawKey, rest))
        return std::nullopt;
    return rawKey;
}

// Turn the raw key text back into the field name the diff engine uses.
static std::string decodeKey(const std::string &rawKey)
{
    try
    {
        return json::parse("\"" + rawKey + "\"").get<std::string>();
    }
    catch (const json::exception &)
    {
        return rawKey;
    }
}

namespace
{
struct Frame
{
    DiffPath path;
    size_t nextIndex = 0;
    bool isArray = false;
};
}

std::vector<std::optional<DiffPath>> buildLinePathMap(const std::vector<std::string> &lines)
{
    std::vector<std::optional<DiffPath>> paths;
    paths.reserve(lines.size());
    // The bottom frame is the document level and is never popped.
    std::vector<Frame> stack(1);

    for (const std::string &line : lines)
    {
        std::string t = trim(line);
        if (!t.empty() && t.back() == ',')
            t = trim(t.substr(0, t.size() - 1));

        if (t.empty())
        {
            paths.push_back(std::nullopt);
            continue;
        }

        if (t == "}" || t == "]")
        {
            if (stack.size() > 1)
            {
                paths.push_back(stack.back().path);
                stack.pop_back();
            }
            else
            {
                paths.push_back(std::nullopt);
            }
            continue;
        }

        // Position of an element without a key: the next index inside an
        // array, the container's own path at document level.
        Frame &top = stack.back();
        std::string rawKey;
        std::string rest;
        if (t == "{" || t == "[")
        {
            DiffPath path = top.path;
            if (top.isArray)
                path.push_back(std::to_string(top.nextIndex++));
            stack.push_back(Frame{path, 0, t == "["});
            paths.push_back(std::move(path));
        }
        else if (splitKeyedLine(t, rawKey, rest))
        {
            DiffPath path = top.path;
            path.push_back(decodeKey(rawKey));
            if (rest == "{" || rest == "[")
                stack.push_back(Frame{path, 0, rest == "["});
            paths.push_back(std::move(path));
        }
        else if (top.isArray)
        {
            DiffPath path = top.path;
            path.push_back(std::to_string(top.nextIndex++));
            paths.push_back(std::move(path));
        }
        else if (stack.size() == 1)
        {
            paths.push_back(top.path);
        }
        else
        {
            paths.push_back(std::nullopt);
        }
    }
    return paths;
}

namespace
{
struct LineMarks
{
    std::map<DiffPath, DiffType> exact;
    std::map<DiffPath, DiffType> subtree;
};
}

static void collectMarks(const DiffItem &item, CompareSide side, LineMarks &marks)
{
    const DiffPath &path = item.pathFor(side);
    switch (item.type)
    {
    case DiffType::Added:
        if (side == CompareSide::Right)
            marks.subtree.emplace(path, DiffType::Added);
        break;
    case DiffType::Removed:
        if (side == CompareSide::Left)
            marks.subtree.emplace(path, DiffType::Removed);
        break;
    case DiffType::Modified:
    {
        marks.exact.emplace(path, DiffType::Modified);
        // A value replaced by one of another type has no counterpart
        // below it, so the whole container is marked.
        const json *value = side == CompareSide::Left ? item.leftValue : item.rightValue;
        if (item.children.empty() && value != nullptr && isContainer(*value))
            marks.subtree.emplace(path, DiffType::Modified);
        break;
    }
    default:
        break;
    }
    for (const DiffItem &child : item.children)
    {
        collectMarks(child, side, marks);
    }
}

std::vector<DiffType> classifyLines(const std::vector<std::optional<DiffPath>> &paths,
                                    const CompareDiffResult &diff, CompareSide side)
{
    LineMarks marks;
    collectMarks(diff.root(), side, marks);

    std::vector<DiffType> result(paths.size(), DiffType::Unchanged);
    for (size_t i = 0; i < paths.size(); ++i)
    {
        if (!paths[i])
            continue;
        const DiffPath &path = *paths[i];

        // The outermost wholly marked ancestor decides for its subtree.
        bool decided = false;
        if (!marks.subtree.empty())
        {
            DiffPath prefix;
            prefix.reserve(path.size());
            for (size_t depth = 0; depth <= path.size() && !decided; ++depth)
            {
                auto it = marks.subtree.find(prefix);
                if (it != marks.subtree.end())
                {
                    result[i] = it->second;
                    decided = true;
                }
                else if (depth < path.size())
                {
                    prefix.push_back(path[depth]);
                }
            }
        }
        if (decided)
            continue;

        auto it = marks.exact.find(path);
        if (it != marks.exact.end())
            result[i] = it->second;
    }
    return result;
}

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string::npos)
        {
            if (start < text.size())
                lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    for (std::string &line : lines)
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
    }
    return lines;
}

static std::vector<RenderedLine> renderSide(const std::string &text, const CompareDiffResult &diff,
                                            CompareSide side)
{
    std::vector<std::string> lines = splitLines(text);
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    std::vector<DiffType> types = classifyLines(paths, diff, side);

    std::vector<RenderedLine> rendered;
    rendered.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i)
    {
        rendered.push_back(RenderedLine{std::move(lines[i]), std::move(paths[i]), types[i]});
    }
    return rendered;
}

CompareRenderResult buildRenderResult(const std::string &leftText, const std::string &rightText,
                                      const CompareDiffResult &diff)
{
    CompareRenderResult result;
    result.leftLines = renderSide(leftText, diff, CompareSide::Left);
    result.rightLines = renderSide(rightText, diff, CompareSide::Right);
    return result;
}

// ---------------------------------------------------------------------------
// Side-by-side presentation

static RenderLine contentLine(const std::vector<RenderedLine> &lines, size_t i)
{
    RenderLine line;
    line.lineIndex = static_cast<int>(i);
    line.kind = RenderLineKind::Content;
    line.diffType = lines[i].classification;
    line.text = lines[i].text;
    return line;
}

static RenderLine paddingLine()
{
    RenderLine line;
    line.kind = RenderLineKind::Padding;
    return line;
}

void buildPairedLines(const CompareRenderResult &result, std::vector<RenderLine> &left,
                      std::vector<RenderLine> &right)
{
    size_t maxCount = std::max(result.leftLines.size(), result.rightLines.size());
    left.clear();
    right.clear();
    left.reserve(maxCount);
    right.reserve(maxCount);
    for (size_t i = 0; i < maxCount; ++i)
    {
        left.push_back(i < result.leftLines.size() ? contentLine(result.leftLines, i)
                                                   : paddingLine());
        right.push_back(i < result.rightLines.size() ? contentLine(result.rightLines, i)
                                                     : paddingLine());
    }
}

static bool showsDiff(const RenderLine &line)
{
    return line.kind == RenderLineKind::Content && line.diffType != DiffType::Unchanged;
}

void applyCollapse(std::vector<RenderLine> &left, std::vector<RenderLine> &right, int context,
                   const std::set<int> &expandedSections)
{
    if (left.size() != right.size())
        return;

    size_t count = left.size();
    size_t reach = static_cast<size_t>(std::max(context, 0));
    std::vector<bool> visible(count, false);
    for (size_t i = 0; i < count; ++i)
    {
        if (showsDiff(left[i]) || showsDiff(right[i]))
        {
            size_t start = i > reach ? i - reach : 0;
            size_t end = std::min(count - 1, i + reach);
            for (size_t j = start; j <= end; ++j)
                visible[j] = true;
        }
    }

    std::vector<RenderLine> outLeft;
    std::vector<RenderLine> outRight;
    int sectionIndex = 0;
    size_t i = 0;
    while (i < count)
    {
        if (visible[i])
        {
            outLeft.push_back(std::move(left[i]));
            outRight.push_back(std::move(right[i]));
            ++i;
            continue;
        }

        size_t sectionStart = i;
        while (i < count && !visible[i])
            ++i;

        if (expandedSections.count(sectionIndex))
        {
            for (size_t j = sectionStart; j < i; ++j)
            {
                outLeft.push_back(std::move(left[j]));
                outRight.push_back(std::move(right[j]));
            }
        }
        else
        {
            RenderLine marker;
            marker.lineIndex = static_cast<int>(sectionStart);
            marker.kind = RenderLineKind::Collapse;
            marker.sectionIndex = sectionIndex;
            marker.text = "··· " + std::to_string(i - sectionStart) + " unchanged lines ···";
            outLeft.push_back(marker);
            outRight.push_back(marker);
        }
        ++sectionIndex;
    }

    left = std::move(outLeft);
    right = std::move(outRight);
}

std::vector<size_t> buildDiffLocations(const std::vector<RenderLine> &left,
                                       const std::vector<RenderLine> &right)
{
    std::vector<size_t> locations;
    size_t count = std::max(left.size(), right.size());
    for (size_t i = 0; i < count; ++i)
    {
        if ((i < left.size() && showsDiff(left[i])) || (i < right.size() && showsDiff(right[i])))
            locations.push_back(i);
    }
    return locations;
}

SideBySideView buildSideBySide(const CompareRenderResult &result, const SideBySideOptions &options)
{
    SideBySideView view;
    buildPairedLines(result, view.left, view.right);
    if (options.collapseUnchanged)
        applyCollapse(view.left, view.right, options.collapseContext, options.expandedSections);

    if (view.left.size() > options.maxDisplayLines)
    {
        view.left.resize(options.maxDisplayLines);
        view.right.resize(options.maxDisplayLines);
        view.truncated = true;
    }

    view.diffLocations = buildDiffLocations(view.left, view.right);
    return view;
}
