#pragma once

#include "json_tree.hpp"
#include "json_value.hpp"

#include <optional>
#include <string>
#include <vector>

// Search works on the parsed value directly so that counting and
// locating matches never builds tree nodes.  Queries and candidate texts
// are compared in lowercase.  Keys are searched as-is; string values are
// searched in their escaped display form unless ignoreEscapeSequences is
// set, in which case the raw string is used.

using MatchPath = std::vector<int>;

std::string toLowerAscii(const std::string &s);

// Text searched for a scalar value; nothing for objects and arrays.
std::optional<std::string> searchText(const json &value, bool ignoreEscapeSequences);

// Single-position check: the key or the scalar text contains the query.
// `queryLowercased` must already be lowercase.
bool leafMatches(const json &value, const std::optional<std::string> &key,
                 const std::string &queryLowercased, bool ignoreEscapeSequences);

// Number of matching positions in the subtree rooted at `value`, which
// sits under `key` (nullopt for a document root).
size_t countMatches(const json &value, const std::optional<std::string> &key,
                    const std::string &query, bool ignoreEscapeSequences = false);

// Child-index path of every matching position, in pre-order.  Object
// children are indexed by sorted key position, arrays by element index;
// a matching root yields the empty path.
std::vector<MatchPath> searchMatchPaths(const json &value, const std::optional<std::string> &key,
                                        const std::string &query,
                                        bool ignoreEscapeSequences = false);

// Non-overlapping occurrences of the query in the key plus scalar text.
size_t leafOccurrenceCount(const json &value, const std::optional<std::string> &key,
                           const std::string &query, bool ignoreEscapeSequences = false);

// leafOccurrenceCount summed over the subtree.
size_t countOccurrences(const json &value, const std::optional<std::string> &key,
                        const std::string &query, bool ignoreEscapeSequences = false);

struct SearchOccurrence
{
    TreeNode *node = nullptr;
    size_t localIndex = 0; // which occurrence within the node's texts
};

// One entry per textual occurrence at each path.  Only the nodes on the
// given paths are materialized; paths that do not resolve are skipped.
std::vector<SearchOccurrence> resolveSearchOccurrences(TreeNode &root,
                                                       const std::vector<MatchPath> &paths,
                                                       const std::string &query,
                                                       bool ignoreEscapeSequences = false);

struct SearchState
{
    std::string term;
    bool ignoreEscapeSequences = false;
    std::vector<MatchPath> paths;
    std::vector<SearchOccurrence> matches;
    size_t currentIndex = 0;
};

// Run state.term against the tree and reset the cursor.
void runSearch(TreeNode &root, SearchState &state);
// Move the cursor by `delta`, wrapping at both ends.
void stepSearch(SearchState &state, int delta);
// Expand the ancestors of the current match.  Returns its node, or
// nullptr when there are no matches.
TreeNode *revealCurrentMatch(TreeNode &root, SearchState &state);
