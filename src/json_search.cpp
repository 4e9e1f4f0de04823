// Match counting and locating over parsed values
#include "json_search.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

std::string toLowerAscii(const std::string &s)
{
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::optional<std::string> searchText(const json &value, bool ignoreEscapeSequences)
{
    if (value.is_string())
    {
        const std::string &s = value.get_ref<const json::string_t &>();
        return ignoreEscapeSequences ? s : escapeForDisplay(s);
    }
    if (value.is_number())
        return jsonNumberText(value);
    if (value.is_boolean())
        return std::string(value.get<bool>() ? "true" : "false");
    if (value.is_null())
        return std::string("null");
    return std::nullopt;
}

static bool containsLower(const std::string &text, const std::string &queryLowercased)
{
    return toLowerAscii(text).find(queryLowercased) != std::string::npos;
}

bool leafMatches(const json &value, const std::optional<std::string> &key,
                 const std::string &queryLowercased, bool ignoreEscapeSequences)
{
    if (queryLowercased.empty())
        return false;
    if (key && containsLower(*key, queryLowercased))
        return true;
    std::optional<std::string> text = searchText(value, ignoreEscapeSequences);
    return text && containsLower(*text, queryLowercased);
}

static void countMatchesRecursive(const json &value, const std::optional<std::string> &key,
                                  const std::string &query, bool ignoreEscapes, size_t &count)
{
    if (leafMatches(value, key, query, ignoreEscapes))
        ++count;

    if (value.is_object())
    {
        for (auto it = value.begin(); it != value.end(); ++it)
        {
            countMatchesRecursive(it.value(), it.key(), query, ignoreEscapes, count);
        }
    }
    else if (value.is_array())
    {
        for (size_t i = 0; i < value.size(); ++i)
        {
            countMatchesRecursive(value[i], "[" + std::to_string(i) + "]", query, ignoreEscapes,
                                  count);
        }
    }
}

size_t countMatches(const json &value, const std::optional<std::string> &key,
                    const std::string &query, bool ignoreEscapeSequences)
{
    size_t count = 0;
    countMatchesRecursive(value, key, toLowerAscii(query), ignoreEscapeSequences, count);
    return count;
}

// `currentPath` is extended in place and restored before returning.
static void searchMatchPathsRecursive(const json &value, const std::optional<std::string> &key,
                                      const std::string &query, bool ignoreEscapes,
                                      MatchPath &currentPath, std::vector<MatchPath> &results)
{
    if (leafMatches(value, key, query, ignoreEscapes))
        results.push_back(currentPath);

    if (value.is_object())
    {
        int index = 0;
        for (auto it = value.begin(); it != value.end(); ++it, ++index)
        {
            currentPath.push_back(index);
            searchMatchPathsRecursive(it.value(), it.key(), query, ignoreEscapes, currentPath,
                                      results);
            currentPath.pop_back();
        }
    }
    else if (value.is_array())
    {
        for (size_t i = 0; i < value.size(); ++i)
        {
            currentPath.push_back(static_cast<int>(i));
            searchMatchPathsRecursive(value[i], "[" + std::to_string(i) + "]", query,
                                      ignoreEscapes, currentPath, results);
            currentPath.pop_back();
        }
    }
}

std::vector<MatchPath> searchMatchPaths(const json &value, const std::optional<std::string> &key,
                                        const std::string &query, bool ignoreEscapeSequences)
{
    std::vector<MatchPath> results;
    MatchPath currentPath;
    searchMatchPathsRecursive(value, key, toLowerAscii(query), ignoreEscapeSequences,
                              currentPath, results);
    return results;
}

static size_t substringCount(const std::string &text, const std::string &queryLowercased)
{
    if (queryLowercased.empty())
        return 0;
    std::string lower = toLowerAscii(text);
    size_t count = 0;
    size_t pos = lower.find(queryLowercased);
    while (pos != std::string::npos)
    {
        ++count;
        pos = lower.find(queryLowercased, pos + queryLowercased.size());
    }
    return count;
}

size_t leafOccurrenceCount(const json &value, const std::optional<std::string> &key,
                           const std::string &query, bool ignoreEscapeSequences)
{
    std::string lowerQuery = toLowerAscii(query);
    size_t count = 0;
    if (key)
        count += substringCount(*key, lowerQuery);
    std::optional<std::string> text = searchText(value, ignoreEscapeSequences);
    if (text)
        count += substringCount(*text, lowerQuery);
    return count;
}

size_t countOccurrences(const json &value, const std::optional<std::string> &key,
                        const std::string &query, bool ignoreEscapeSequences)
{
    size_t count = leafOccurrenceCount(value, key, query, ignoreEscapeSequences);
    if (value.is_object())
    {
        for (auto it = value.begin(); it != value.end(); ++it)
        {
            count += countOccurrences(it.value(), it.key(), query, ignoreEscapeSequences);
        }
    }
    else if (value.is_array())
    {
        for (size_t i = 0; i < value.size(); ++i)
        {
            count += countOccurrences(value[i], "[" + std::to_string(i) + "]", query,
                                      ignoreEscapeSequences);
        }
    }
    return count;
}

std::vector<SearchOccurrence> resolveSearchOccurrences(TreeNode &root,
                                                       const std::vector<MatchPath> &paths,
                                                       const std::string &query,
                                                       bool ignoreEscapeSequences)
{
    std::vector<SearchOccurrence> occurrences;
    for (const MatchPath &path : paths)
    {
        TreeNode *node = root.nodeAt(path);
        if (node == nullptr)
            continue;
        size_t count = leafOccurrenceCount(node->value(), node->key(), query,
                                           ignoreEscapeSequences);
        for (size_t i = 0; i < count; ++i)
        {
            occurrences.push_back(SearchOccurrence{node, i});
        }
    }
    return occurrences;
}

void runSearch(TreeNode &root, SearchState &state)
{
    state.currentIndex = 0;
    state.paths.clear();
    state.matches.clear();
    if (state.term.empty())
        return;
    state.paths = searchMatchPaths(root.value(), root.key(), state.term,
                                   state.ignoreEscapeSequences);
    state.matches = resolveSearchOccurrences(root, state.paths, state.term,
                                             state.ignoreEscapeSequences);
}

void stepSearch(SearchState &state, int delta)
{
    if (state.matches.empty())
        return;
    long long size = static_cast<long long>(state.matches.size());
    long long next = (static_cast<long long>(state.currentIndex) + delta) % size;
    if (next < 0)
        next += size;
    state.currentIndex = static_cast<size_t>(next);
}

TreeNode *revealCurrentMatch(TreeNode &root, SearchState &state)
{
    if (state.matches.empty())
        return nullptr;
    if (state.currentIndex >= state.matches.size())
        state.currentIndex = 0;
    TreeNode *target = state.matches[state.currentIndex].node;
    root.expandPathTo(target);
    return target;
}
