#pragma once

#include "json_diff.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

// Maps a comparison result onto two pretty-printed texts.  Each line is
// given the structural path of the element it shows, and a line is
// classified only when that path equals (or, for a wholly added,
// removed or replaced container, lies under) the path of a diff item.
// Line text is never compared with values, so two lines that merely
// look alike cannot pick up each other's classification.
//
// The texts are expected in the canonical layout of toJsonString: one
// element per line, sorted keys, brackets of non-empty containers on
// their own lines.

struct RenderedLine
{
    std::string text;
    std::optional<DiffPath> structuralPath; // absent when the line has no shape
    DiffType classification = DiffType::Unchanged;
};

struct CompareRenderResult
{
    std::vector<RenderedLine> leftLines;
    std::vector<RenderedLine> rightLines;
};

// Raw key text of a `"key" : ...` line, escapes kept.  Lines that are
// not keyed (brackets, bare array elements) give nothing.
std::optional<std::string> extractKey(const std::string &line);

// Structural path of every line.
std::vector<std::optional<DiffPath>> buildLinePathMap(const std::vector<std::string> &lines);

// Classification of every line of one side.
std::vector<DiffType> classifyLines(const std::vector<std::optional<DiffPath>> &paths,
                                    const CompareDiffResult &diff, CompareSide side);

// Split on '\n'; a trailing newline does not produce an empty last line.
std::vector<std::string> splitLines(const std::string &text);

CompareRenderResult buildRenderResult(const std::string &leftText, const std::string &rightText,
                                      const CompareDiffResult &diff);

// ---------------------------------------------------------------------------
// Side-by-side presentation

enum class RenderLineKind
{
    Content,  // a line of one document
    Padding,  // filler where the other side is longer
    Collapse  // stands for a run of hidden unchanged lines
};

struct RenderLine
{
    int lineIndex = -1;       // index into the side's lines; -1 for padding
    RenderLineKind kind = RenderLineKind::Content;
    DiffType diffType = DiffType::Unchanged;
    int sectionIndex = -1;    // collapse markers only
    std::string text;
};

struct SideBySideOptions
{
    bool collapseUnchanged = true;
    int collapseContext = 3;
    std::set<int> expandedSections;
    size_t maxDisplayLines = 10000;
};

struct SideBySideView
{
    std::vector<RenderLine> left;
    std::vector<RenderLine> right;
    std::vector<size_t> diffLocations;
    bool truncated = false;
};

// Pair lines by index, padding the shorter side.
void buildPairedLines(const CompareRenderResult &result, std::vector<RenderLine> &left,
                      std::vector<RenderLine> &right);

// Replace every run of lines more than `context` lines away from a diff
// by one collapse line per side, except sections listed in
// `expandedSections`.  Both sides must have the same length.
void applyCollapse(std::vector<RenderLine> &left, std::vector<RenderLine> &right, int context,
                   const std::set<int> &expandedSections);

// Indices of rows where either side shows a diff.
std::vector<size_t> buildDiffLocations(const std::vector<RenderLine> &left,
                                       const std::vector<RenderLine> &right);

SideBySideView buildSideBySide(const CompareRenderResult &result,
                               const SideBySideOptions &options = SideBySideOptions());
