#include <gtest/gtest.h>

#include "json_diff_render.hpp"

#include <optional>
#include <string>
#include <vector>

namespace
{

// Format both documents the way the renderer expects and classify them.
struct Rendered
{
    CompareRenderResult lines;
    std::vector<std::string> leftText;
    std::vector<std::string> rightText;
};

Rendered render(const std::string &leftJson, const std::string &rightJson,
                const CompareOptions &options = CompareOptions())
{
    json left = json::parse(leftJson);
    json right = json::parse(rightJson);
    CompareDiffResult diff = compareJson(left, right, options);
    Rendered out;
    out.lines = buildRenderResult(toJsonString(left), toJsonString(right), diff);
    for (const RenderedLine &line : out.lines.leftLines)
        out.leftText.push_back(line.text);
    for (const RenderedLine &line : out.lines.rightLines)
        out.rightText.push_back(line.text);
    return out;
}

// Classification of the first line containing `needle`.
std::optional<DiffType> typeOf(const std::vector<RenderedLine> &lines, const std::string &needle)
{
    for (const RenderedLine &line : lines)
    {
        if (line.text.find(needle) != std::string::npos)
            return line.classification;
    }
    return std::nullopt;
}

std::optional<DiffPath> path(std::initializer_list<std::string> segments)
{
    return DiffPath(segments);
}

} // namespace

// extractKey

TEST(RenderTest, ExtractKeyFromKeyValueLines)
{
    EXPECT_EQ(extractKey("    \"name\" : \"Alice\","), std::optional<std::string>("name"));
    EXPECT_EQ(extractKey("    \"config\" : {"), std::optional<std::string>("config"));
    EXPECT_EQ(extractKey("    \"items\" : ["), std::optional<std::string>("items"));
}

TEST(RenderTest, ExtractKeyIgnoresUnkeyedLines)
{
    EXPECT_FALSE(extractKey("{").has_value());
    EXPECT_FALSE(extractKey("    },").has_value());
    EXPECT_FALSE(extractKey("    42,").has_value());
    EXPECT_FALSE(extractKey("    \"hello\",").has_value());
    EXPECT_FALSE(extractKey("    \"a : b\"").has_value());
}

TEST(RenderTest, ExtractKeyHonorsEscapedQuotes)
{
    EXPECT_EQ(extractKey(R"(    "key\"name" : 1)"), std::optional<std::string>(R"(key\"name)"));
}

// buildLinePathMap

TEST(RenderTest, LinePathsForFlatObject)
{
    std::vector<std::string> lines = {"{", "    \"age\" : 30,", "    \"name\" : \"Alice\"", "}"};
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    ASSERT_EQ(paths.size(), 4u);
    EXPECT_EQ(paths[0], path({}));
    EXPECT_EQ(paths[1], path({"age"}));
    EXPECT_EQ(paths[2], path({"name"}));
    EXPECT_EQ(paths[3], path({}));
}

TEST(RenderTest, LinePathsForNestedObject)
{
    std::vector<std::string> lines = {
        "{", "    \"app\" : {", "        \"id\" : 1,", "        \"version\" : \"1.0.0\"", "    }", "}",
    };
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    EXPECT_EQ(paths[1], path({"app"}));
    EXPECT_EQ(paths[2], path({"app", "id"}));
    EXPECT_EQ(paths[3], path({"app", "version"}));
    EXPECT_EQ(paths[4], path({"app"}));
    EXPECT_EQ(paths[5], path({}));
}

TEST(RenderTest, LinePathsForPrimitiveArray)
{
    std::vector<std::string> lines = {"[", "    1,", "    2,", "    3", "]"};
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    EXPECT_EQ(paths[0], path({}));
    EXPECT_EQ(paths[1], path({"0"}));
    EXPECT_EQ(paths[2], path({"1"}));
    EXPECT_EQ(paths[3], path({"2"}));
    EXPECT_EQ(paths[4], path({}));
}

TEST(RenderTest, LinePathsForArrayOfObjects)
{
    std::vector<std::string> lines = {
        "{",
        "    \"items\" : [",
        "        {",
        "            \"name\" : \"A\"",
        "        },",
        "        {",
        "            \"name\" : \"B\"",
        "        }",
        "    ]",
        "}",
    };
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    std::vector<std::optional<DiffPath>> expected = {
        path({}),
        path({"items"}),
        path({"items", "0"}),
        path({"items", "0", "name"}),
        path({"items", "0"}),
        path({"items", "1"}),
        path({"items", "1", "name"}),
        path({"items", "1"}),
        path({"items"}),
        path({}),
    };
    EXPECT_EQ(paths, expected);
}

TEST(RenderTest, LinePathsForRootArrayAndDeepNesting)
{
    std::vector<std::string> rootArray = {"[", "    {", "        \"id\" : 1", "    }", "]"};
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(rootArray);
    EXPECT_EQ(paths[1], path({"0"}));
    EXPECT_EQ(paths[2], path({"0", "id"}));
    EXPECT_EQ(paths[3], path({"0"}));
    EXPECT_EQ(paths[4], path({}));

    std::vector<std::string> deep = {
        "{", "    \"a\" : {", "        \"b\" : {", "            \"c\" : 1", "        }", "    }", "}",
    };
    paths = buildLinePathMap(deep);
    EXPECT_EQ(paths[3], path({"a", "b", "c"}));
    EXPECT_EQ(paths[4], path({"a", "b"}));
    EXPECT_EQ(paths[5], path({"a"}));
}

TEST(RenderTest, LinePathsForEmptyContainers)
{
    std::vector<std::string> lines = {"{", "}"};
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    EXPECT_EQ(paths[0], path({}));
    EXPECT_EQ(paths[1], path({}));

    std::vector<std::string> inline_ = {"{", "    \"a\" : {},", "    \"b\" : []", "}"};
    paths = buildLinePathMap(inline_);
    EXPECT_EQ(paths[1], path({"a"}));
    EXPECT_EQ(paths[2], path({"b"}));
    EXPECT_EQ(paths[3], path({}));
}

TEST(RenderTest, LinePathsDecodeEscapedKeys)
{
    std::vector<std::string> lines = {"{", R"(    "say \"hi\"" : 1,)", R"(    "tab\tkey" : 2)", "}"};
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    EXPECT_EQ(paths[1], path({"say \"hi\""}));
    EXPECT_EQ(paths[2], path({"tab\tkey"}));
}

TEST(RenderTest, MalformedLinesHaveNoPath)
{
    std::vector<std::string> lines = {"}", "{", "    garbage here", "", "}", "]"};
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap(lines);
    ASSERT_EQ(paths.size(), 6u);
    EXPECT_FALSE(paths[0].has_value());
    EXPECT_EQ(paths[1], path({}));
    EXPECT_FALSE(paths[2].has_value());
    EXPECT_FALSE(paths[3].has_value());
    EXPECT_EQ(paths[4], path({}));
    EXPECT_FALSE(paths[5].has_value());
}

TEST(RenderTest, ScalarDocumentLineHasRootPath)
{
    std::vector<std::optional<DiffPath>> paths = buildLinePathMap({"\"just a string\""});
    EXPECT_EQ(paths[0], path({}));
}

TEST(RenderTest, SplitLines)
{
    EXPECT_EQ(splitLines("a\nb"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(splitLines("a\r\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(splitLines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_TRUE(splitLines("").empty());
}

// Classification

TEST(RenderTest, KeyRenameDoesNotTouchNeighbouringLines)
{
    Rendered r = render(R"({"app": {"id": 1, "version": "1.0.0"}})",
                        R"({"app": {"name": 1, "version": "1.0.0"}})");
    EXPECT_EQ(typeOf(r.lines.leftLines, "version"), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.rightLines, "version"), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"id\""), DiffType::Removed);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"name\""), DiffType::Added);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"app\""), DiffType::Unchanged);
}

TEST(RenderTest, OverlappingValueTextDoesNotLeak)
{
    Rendered r = render(R"({"id": 1, "version": "1.0.0"})", R"({"id": 2, "version": "1.0.0"})");
    EXPECT_EQ(typeOf(r.lines.leftLines, "version"), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.rightLines, "version"), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"id\""), DiffType::Modified);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"id\""), DiffType::Modified);
}

TEST(RenderTest, SameValueOnDifferentPaths)
{
    Rendered r = render(R"({"a": 1, "b": 1})", R"({"a": 1, "b": 2})");
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"a\""), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"a\""), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"b\""), DiffType::Modified);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"b\""), DiffType::Modified);
}

TEST(RenderTest, AddedObjectMarksItsWholeSubtree)
{
    Rendered r = render(R"({"name": "x"})", R"({"info": {"id": 1, "type": "A"}, "name": "x"})");
    // {, "info" : {, "id" : 1, "type" : "A", }, "name" : "x", }
    ASSERT_EQ(r.lines.rightLines.size(), 7u);
    for (size_t i = 1; i <= 4; ++i)
    {
        EXPECT_EQ(r.lines.rightLines[i].classification, DiffType::Added) << r.rightText[i];
    }
    EXPECT_EQ(r.lines.rightLines[0].classification, DiffType::Unchanged);
    EXPECT_EQ(r.lines.rightLines[5].classification, DiffType::Unchanged);
    EXPECT_EQ(r.lines.rightLines[6].classification, DiffType::Unchanged);
    for (const RenderedLine &line : r.lines.leftLines)
    {
        EXPECT_EQ(line.classification, DiffType::Unchanged) << line.text;
    }
}

TEST(RenderTest, RemovedObjectMarksItsWholeSubtree)
{
    Rendered r = render(R"({"config": {"debug": true, "port": 8080}, "name": "app"})",
                        R"({"name": "app"})");
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"config\""), DiffType::Removed);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"debug\""), DiffType::Removed);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"port\""), DiffType::Removed);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"name\""), DiffType::Unchanged);
    for (const RenderedLine &line : r.lines.rightLines)
    {
        EXPECT_EQ(line.classification, DiffType::Unchanged);
    }
}

TEST(RenderTest, RenamedContainerIsRemovedAndAddedWhole)
{
    Rendered r = render(R"({"features": [1, 2, 3], "name": "test"})",
                        R"({"feat~~res": [1, 2, 3], "name": "test"})");
    // {, "features" : [, 1, 2, 3, ], "name" : "test", }
    ASSERT_EQ(r.lines.leftLines.size(), 8u);
    for (size_t i = 1; i <= 5; ++i)
    {
        EXPECT_EQ(r.lines.leftLines[i].classification, DiffType::Removed) << r.leftText[i];
        EXPECT_EQ(r.lines.rightLines[i].classification, DiffType::Added) << r.rightText[i];
    }
    EXPECT_EQ(r.lines.leftLines[6].classification, DiffType::Unchanged);
    EXPECT_EQ(r.lines.rightLines[6].classification, DiffType::Unchanged);
}

TEST(RenderTest, AddedArrayElement)
{
    Rendered r = render(R"({"list": [1, 2]})", R"({"list": [1, 2, {"x": 1}]})");
    // {, "list" : [, 1, 2, {, "x" : 1, }, ], }
    ASSERT_EQ(r.lines.rightLines.size(), 9u);
    EXPECT_EQ(r.lines.rightLines[2].classification, DiffType::Unchanged);
    EXPECT_EQ(r.lines.rightLines[3].classification, DiffType::Unchanged);
    EXPECT_EQ(r.lines.rightLines[4].classification, DiffType::Added);
    EXPECT_EQ(r.lines.rightLines[5].classification, DiffType::Added);
    EXPECT_EQ(r.lines.rightLines[6].classification, DiffType::Added);
    EXPECT_EQ(r.lines.rightLines[7].classification, DiffType::Unchanged);
    EXPECT_EQ(r.lines.rightLines[4].structuralPath, path({"list", "2"}));
}

TEST(RenderTest, TypeChangeMarksTheReplacedContainer)
{
    Rendered r = render(R"({"v": {"a": 1}})", R"({"v": "flat"})");
    // {, "v" : {, "a" : 1, }, }
    ASSERT_EQ(r.lines.leftLines.size(), 5u);
    EXPECT_EQ(r.lines.leftLines[1].classification, DiffType::Modified);
    EXPECT_EQ(r.lines.leftLines[2].classification, DiffType::Modified);
    EXPECT_EQ(r.lines.leftLines[3].classification, DiffType::Modified);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"v\""), DiffType::Modified);
}

TEST(RenderTest, IdenticalDocumentsHaveNoMarks)
{
    std::string doc = R"({"users": [{"id": 1, "name": "Alice"}], "count": 1, "meta": null})";
    Rendered r = render(doc, doc);
    for (const RenderedLine &line : r.lines.leftLines)
        EXPECT_EQ(line.classification, DiffType::Unchanged);
    for (const RenderedLine &line : r.lines.rightLines)
        EXPECT_EQ(line.classification, DiffType::Unchanged);
}

TEST(RenderTest, UnorderedMatchMarksEachSideAtItsOwnPosition)
{
    CompareOptions options;
    options.ignoreArrayOrder = true;
    Rendered r = render(R"([{"id": 1, "name": "Alice"}, {"id": 2, "name": "Bob"}])",
                        R"([{"id": 2, "name": "Bob"}, {"id": 1, "name": "Alice Updated"}])",
                        options);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"Alice\""), DiffType::Modified);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"Alice Updated\""), DiffType::Modified);
    EXPECT_EQ(typeOf(r.lines.leftLines, "\"Bob\""), DiffType::Unchanged);
    EXPECT_EQ(typeOf(r.lines.rightLines, "\"Bob\""), DiffType::Unchanged);

    size_t marked = 0;
    for (const RenderedLine &line : r.lines.rightLines)
    {
        if (line.classification != DiffType::Unchanged)
            ++marked;
    }
    EXPECT_EQ(marked, 1u);
}

TEST(RenderTest, LinesCarryTheirStructuralPath)
{
    Rendered r = render(R"({"a": [true]})", R"({"a": [false]})");
    ASSERT_EQ(r.lines.leftLines.size(), 5u);
    EXPECT_EQ(r.lines.leftLines[2].text, "        true");
    EXPECT_EQ(r.lines.leftLines[2].structuralPath, path({"a", "0"}));
    EXPECT_EQ(r.lines.leftLines[2].classification, DiffType::Modified);
    EXPECT_EQ(r.lines.rightLines[2].classification, DiffType::Modified);
}

// Side-by-side presentation

TEST(RenderTest, PairedLinesPadTheShorterSide)
{
    Rendered r = render(R"({"a": 1})", R"({"a": 1, "b": {"c": 2}})");
    std::vector<RenderLine> left;
    std::vector<RenderLine> right;
    buildPairedLines(r.lines, left, right);
    ASSERT_EQ(left.size(), right.size());
    ASSERT_EQ(left.size(), r.lines.rightLines.size());
    EXPECT_EQ(left[2].kind, RenderLineKind::Content);
    EXPECT_EQ(left[3].kind, RenderLineKind::Padding);
    EXPECT_EQ(left[3].lineIndex, -1);
    EXPECT_EQ(right[3].kind, RenderLineKind::Content);
    EXPECT_EQ(right[3].lineIndex, 3);
}

static CompareRenderResult plainLines(const std::vector<DiffType> &types)
{
    CompareRenderResult result;
    for (size_t i = 0; i < types.size(); ++i)
    {
        RenderedLine line;
        line.text = "line " + std::to_string(i);
        line.classification = types[i];
        result.leftLines.push_back(line);
        result.rightLines.push_back(line);
    }
    return result;
}

TEST(RenderTest, CollapseKeepsContextAroundDiffs)
{
    std::vector<DiffType> types(20, DiffType::Unchanged);
    types[10] = DiffType::Modified;
    CompareRenderResult lines = plainLines(types);

    std::vector<RenderLine> left;
    std::vector<RenderLine> right;
    buildPairedLines(lines, left, right);
    applyCollapse(left, right, 3, {});

    // 7 hidden, 7 shown (7..13), 6 hidden
    ASSERT_EQ(left.size(), 9u);
    EXPECT_EQ(left[0].kind, RenderLineKind::Collapse);
    EXPECT_EQ(left[0].text, "··· 7 unchanged lines ···");
    EXPECT_EQ(left[0].sectionIndex, 0);
    EXPECT_EQ(left[1].lineIndex, 7);
    EXPECT_EQ(left[7].lineIndex, 13);
    EXPECT_EQ(left[8].kind, RenderLineKind::Collapse);
    EXPECT_EQ(left[8].text, "··· 6 unchanged lines ···");
    EXPECT_EQ(left[8].sectionIndex, 1);
    EXPECT_EQ(right.size(), left.size());
}

TEST(RenderTest, ExpandedSectionsStayOpen)
{
    std::vector<DiffType> types(20, DiffType::Unchanged);
    types[10] = DiffType::Added;
    CompareRenderResult lines = plainLines(types);

    std::vector<RenderLine> left;
    std::vector<RenderLine> right;
    buildPairedLines(lines, left, right);
    applyCollapse(left, right, 3, {1});

    ASSERT_EQ(left.size(), 1u + 7u + 6u);
    EXPECT_EQ(left[0].kind, RenderLineKind::Collapse);
    EXPECT_EQ(left.back().kind, RenderLineKind::Content);
    EXPECT_EQ(left.back().lineIndex, 19);
}

TEST(RenderTest, IdenticalDocumentsCollapseToOneSection)
{
    CompareRenderResult lines = plainLines(std::vector<DiffType>(5, DiffType::Unchanged));
    SideBySideView view = buildSideBySide(lines);
    ASSERT_EQ(view.left.size(), 1u);
    EXPECT_EQ(view.left[0].text, "··· 5 unchanged lines ···");
    EXPECT_TRUE(view.diffLocations.empty());
}

TEST(RenderTest, SideBySideReportsDiffLocations)
{
    Rendered r = render(R"({"a": 1, "b": 1})", R"({"a": 1, "b": 2})");
    SideBySideOptions options;
    options.collapseUnchanged = false;
    SideBySideView view = buildSideBySide(r.lines, options);
    EXPECT_EQ(view.diffLocations, (std::vector<size_t>{2}));
    EXPECT_FALSE(view.truncated);
}

TEST(RenderTest, SideBySideTruncates)
{
    std::vector<DiffType> types(50, DiffType::Modified);
    SideBySideOptions options;
    options.maxDisplayLines = 10;
    SideBySideView view = buildSideBySide(plainLines(types), options);
    EXPECT_TRUE(view.truncated);
    EXPECT_EQ(view.left.size(), 10u);
    EXPECT_EQ(view.right.size(), 10u);
    EXPECT_EQ(view.diffLocations.size(), 10u);
}
