// Recursive structural comparison of two JSON documents
#include "json_diff.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

std::string diffTypeName(DiffType type)
{
    switch (type)
    {
    case DiffType::Added:
        return "added";
    case DiffType::Removed:
        return "removed";
    case DiffType::Modified:
        return "modified";
    default:
        return "unchanged";
    }
}

bool DiffItem::hasDiff() const
{
    if (type != DiffType::Unchanged)
        return true;
    for (const DiffItem &child : children)
    {
        if (child.hasDiff())
            return true;
    }
    return false;
}

std::string jsonPointer(const DiffPath &path)
{
    std::string pointer;
    for (const std::string &segment : path)
    {
        pointer += '/';
        for (char c : segment)
        {
            if (c == '~')
                pointer += "~0";
            else if (c == '/')
                pointer += "~1";
            else
                pointer += c;
        }
    }
    return pointer;
}

std::string DiffItem::jsonPointerPath() const
{
    return jsonPointer(path);
}

std::string canonicalText(const json &value)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_number())
        return jsonNumberText(value);
    if (value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    if (isContainer(value))
        return toJsonString(value, false);
    return "null";
}

static void countTypes(const DiffItem &item, size_t &added, size_t &removed, size_t &modified)
{
    if (item.type == DiffType::Added)
        ++added;
    else if (item.type == DiffType::Removed)
        ++removed;
    else if (item.type == DiffType::Modified)
        ++modified;
    for (const DiffItem &child : item.children)
    {
        countTypes(child, added, removed, modified);
    }
}

CompareDiffResult::CompareDiffResult(DiffItem root, std::shared_ptr<const json> left,
                                     std::shared_ptr<const json> right)
    : root_(std::move(root)), left_(std::move(left)), right_(std::move(right))
{
    countTypes(root_, added_, removed_, modified_);
}

static void flattenItems(const DiffItem &item, std::vector<const DiffItem *> &out)
{
    if (item.type != DiffType::Unchanged)
        out.push_back(&item);
    for (const DiffItem &child : item.children)
    {
        flattenItems(child, out);
    }
}

std::vector<const DiffItem *> CompareDiffResult::flattenedDiffItems() const
{
    std::vector<const DiffItem *> out;
    flattenItems(root_, out);
    return out;
}

json CompareDiffResult::serializeDiff() const
{
    json out = json::array();
    for (const DiffItem *item : flattenedDiffItems())
    {
        json entry = {
            {"type", diffTypeName(item->type)},
            {"path", item->jsonPointerPath()},
        };
        bool hasLeft = item->type == DiffType::Removed || item->type == DiffType::Modified;
        bool hasRight = item->type == DiffType::Added || item->type == DiffType::Modified;
        if (hasLeft && item->leftValue)
            entry["left"] = *item->leftValue;
        if (hasRight && item->rightValue)
            entry["right"] = *item->rightValue;
        out.push_back(std::move(entry));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Comparison

static DiffItem makeItem(DiffPath path, DiffPath rightPath, DiffType type, const json *left,
                         const json *right, int depth)
{
    DiffItem item;
    if (!path.empty())
        item.key = path.back();
    item.path = std::move(path);
    item.rightPath = std::move(rightPath);
    item.type = type;
    item.leftValue = left;
    item.rightValue = right;
    item.depth = depth;
    return item;
}

static DiffPath extended(const DiffPath &path, const std::string &segment)
{
    DiffPath out = path;
    out.push_back(segment);
    return out;
}

static bool areSameType(const json &left, const json &right)
{
    if (left.is_number() && right.is_number())
        return true;
    return left.type() == right.type();
}

// Exact scalar equality.  Two NaN literals count as the same value so
// that every document compares identical to itself.
static bool scalarsEqual(const json &left, const json &right)
{
    if (left.is_number_float() && right.is_number_float() &&
        std::isnan(left.get<double>()) && std::isnan(right.get<double>()))
        return true;
    return left == right;
}

static bool valuesEqual(const json &left, const json &right, const CompareOptions &options)
{
    if (options.strictType)
        return scalarsEqual(left, right);
    return canonicalText(left) == canonicalText(right);
}

static DiffItem compareValues(const json &left, const json &right, const DiffPath &path,
                              const DiffPath &rightPath, int depth,
                              const CompareOptions &options);

static DiffItem compareObjects(const json &left, const json &right, const DiffPath &path,
                               const DiffPath &rightPath, int depth,
                               const CompareOptions &options)
{
    DiffItem item = makeItem(path, rightPath, DiffType::Unchanged, &left, &right, depth);

    // Both maps iterate in sorted key order.  With ignoreKeyOrder the
    // union is merged in sorted order; otherwise the left document's
    // keys come first and keys only on the right follow.
    std::vector<std::pair<const std::string *, int>> keys; // 0 both, 1 left only, 2 right only
    if (options.ignoreKeyOrder)
    {
        auto l = left.begin();
        auto r = right.begin();
        while (l != left.end() || r != right.end())
        {
            if (r == right.end() || (l != left.end() && l.key() < r.key()))
            {
                keys.emplace_back(&l.key(), 1);
                ++l;
            }
            else if (l == left.end() || r.key() < l.key())
            {
                keys.emplace_back(&r.key(), 2);
                ++r;
            }
            else
            {
                keys.emplace_back(&l.key(), 0);
                ++l;
                ++r;
            }
        }
    }
    else
    {
        for (auto l = left.begin(); l != left.end(); ++l)
        {
            keys.emplace_back(&l.key(), right.contains(l.key()) ? 0 : 1);
        }
        for (auto r = right.begin(); r != right.end(); ++r)
        {
            if (!left.contains(r.key()))
                keys.emplace_back(&r.key(), 2);
        }
    }

    item.children.reserve(keys.size());
    for (const auto &entry : keys)
    {
        const std::string &key = *entry.first;
        DiffPath childPath = extended(path, key);
        DiffPath childRightPath = extended(rightPath, key);
        if (entry.second == 1)
        {
            item.children.push_back(makeItem(std::move(childPath), std::move(childRightPath),
                                             DiffType::Removed, &left.at(key), nullptr,
                                             depth + 1));
        }
        else if (entry.second == 2)
        {
            item.children.push_back(makeItem(std::move(childPath), std::move(childRightPath),
                                             DiffType::Added, nullptr, &right.at(key),
                                             depth + 1));
        }
        else
        {
            item.children.push_back(compareValues(left.at(key), right.at(key), childPath,
                                                  childRightPath, depth + 1, options));
        }
    }
    return item;
}

static void compareArraysOrdered(const json &left, const json &right, DiffItem &parent,
                                 const CompareOptions &options)
{
    size_t maxCount = std::max(left.size(), right.size());
    for (size_t i = 0; i < maxCount; ++i)
    {
        std::string index = std::to_string(i);
        DiffPath childPath = extended(parent.path, index);
        DiffPath childRightPath = extended(parent.rightPath, index);
        if (i < left.size() && i < right.size())
        {
            parent.children.push_back(compareValues(left[i], right[i], childPath, childRightPath,
                                                    parent.depth + 1, options));
        }
        else if (i < left.size())
        {
            parent.children.push_back(makeItem(std::move(childPath), std::move(childRightPath),
                                               DiffType::Removed, &left[i], nullptr,
                                               parent.depth + 1));
        }
        else
        {
            parent.children.push_back(makeItem(std::move(childPath), std::move(childRightPath),
                                               DiffType::Added, nullptr, &right[i],
                                               parent.depth + 1));
        }
    }
}

// Append a child for a left element paired with right element `ri`, or
// Removed when `ri` is absent; then Added for every unpaired right element.
static void emitPairing(const json &left, const json &right, DiffItem &parent,
                        const std::vector<std::optional<size_t>> &pairing, bool recurse,
                        const CompareOptions &options)
{
    std::vector<bool> rightMatched(right.size(), false);
    for (size_t li = 0; li < left.size(); ++li)
    {
        DiffPath childPath = extended(parent.path, std::to_string(li));
        if (pairing[li])
        {
            size_t ri = *pairing[li];
            rightMatched[ri] = true;
            DiffPath childRightPath = extended(parent.rightPath, std::to_string(ri));
            if (recurse)
            {
                parent.children.push_back(compareValues(left[li], right[ri], childPath,
                                                        childRightPath, parent.depth + 1,
                                                        options));
            }
            else
            {
                parent.children.push_back(makeItem(std::move(childPath),
                                                   std::move(childRightPath),
                                                   DiffType::Unchanged, &left[li], &right[ri],
                                                   parent.depth + 1));
            }
        }
        else
        {
            DiffPath childRightPath = extended(parent.rightPath, std::to_string(li));
            parent.children.push_back(makeItem(std::move(childPath), std::move(childRightPath),
                                               DiffType::Removed, &left[li], nullptr,
                                               parent.depth + 1));
        }
    }
    for (size_t ri = 0; ri < right.size(); ++ri)
    {
        if (rightMatched[ri])
            continue;
        std::string index = std::to_string(ri);
        parent.children.push_back(makeItem(extended(parent.path, index),
                                           extended(parent.rightPath, index), DiffType::Added,
                                           nullptr, &right[ri], parent.depth + 1));
    }
}

// Pair every left element with the first unpaired right element whose
// bucket text matches and that `equal` accepts.
template <typename Equal>
static std::vector<std::optional<size_t>> pairByText(const json &left, const json &right,
                                                     const std::vector<std::string> &leftText,
                                                     const std::vector<std::string> &rightText,
                                                     Equal equal)
{
    std::unordered_map<std::string, std::vector<size_t>> buckets;
    for (size_t ri = 0; ri < right.size(); ++ri)
    {
        buckets[rightText[ri]].push_back(ri);
    }
    std::vector<bool> taken(right.size(), false);
    std::vector<std::optional<size_t>> pairing(left.size());
    for (size_t li = 0; li < left.size(); ++li)
    {
        auto bucket = buckets.find(leftText[li]);
        if (bucket == buckets.end())
            continue;
        for (size_t ri : bucket->second)
        {
            if (!taken[ri] && equal(left[li], right[ri]))
            {
                taken[ri] = true;
                pairing[li] = ri;
                break;
            }
        }
    }
    return pairing;
}

static std::vector<std::string> canonicalTexts(const json &array)
{
    std::vector<std::string> texts;
    texts.reserve(array.size());
    for (const json &element : array)
    {
        texts.push_back(canonicalText(element));
    }
    return texts;
}

// `key` identifies elements when every element has it as a scalar field
// and no two elements of one array share its value.
static bool isValidMatchingKey(const std::string &key, const json &array)
{
    std::unordered_set<std::string> seen;
    for (const json &element : array)
    {
        auto field = element.find(key);
        if (field == element.end() || isContainer(*field))
            return false;
        if (!seen.insert(canonicalText(*field)).second)
            return false;
    }
    return true;
}

static std::optional<std::string> inferMatchingKey(const json &left, const json &right,
                                                   const CompareOptions &options)
{
    if (left.empty() || right.empty())
        return std::nullopt;
    for (const std::string &candidate : options.matchKeys)
    {
        if (isValidMatchingKey(candidate, left) && isValidMatchingKey(candidate, right))
            return candidate;
    }
    return std::nullopt;
}

static std::vector<std::string> keyTexts(const json &array, const std::string &key)
{
    std::vector<std::string> texts;
    texts.reserve(array.size());
    for (const json &element : array)
    {
        texts.push_back(canonicalText(element.at(key)));
    }
    return texts;
}

static void compareArraysUnordered(const json &left, const json &right, DiffItem &parent,
                                   const CompareOptions &options)
{
    bool allPrimitive = true;
    bool allObjects = true;
    for (const json *array : {&left, &right})
    {
        for (const json &element : *array)
        {
            if (isContainer(element))
                allPrimitive = false;
            if (!element.is_object())
                allObjects = false;
        }
    }

    if (allPrimitive)
    {
        auto pairing = pairByText(left, right, canonicalTexts(left), canonicalTexts(right),
                                  [&options](const json &l, const json &r) {
                                      return valuesEqual(l, r, options);
                                  });
        emitPairing(left, right, parent, pairing, false, options);
        return;
    }

    if (allObjects)
    {
        auto acceptAny = [](const json &, const json &) { return true; };
        std::optional<std::string> matchingKey = inferMatchingKey(left, right, options);
        if (matchingKey)
        {
            auto pairing = pairByText(left, right, keyTexts(left, *matchingKey),
                                      keyTexts(right, *matchingKey), acceptAny);
            emitPairing(left, right, parent, pairing, true, options);
        }
        else
        {
            auto pairing = pairByText(left, right, canonicalTexts(left), canonicalTexts(right),
                                      acceptAny);
            emitPairing(left, right, parent, pairing, true, options);
        }
        return;
    }

    compareArraysOrdered(left, right, parent, options);
}

static DiffItem compareArrays(const json &left, const json &right, const DiffPath &path,
                              const DiffPath &rightPath, int depth,
                              const CompareOptions &options)
{
    DiffItem item = makeItem(path, rightPath, DiffType::Unchanged, &left, &right, depth);
    item.children.reserve(std::max(left.size(), right.size()));
    if (options.ignoreArrayOrder)
        compareArraysUnordered(left, right, item, options);
    else
        compareArraysOrdered(left, right, item, options);
    return item;
}

static DiffItem compareValues(const json &left, const json &right, const DiffPath &path,
                              const DiffPath &rightPath, int depth,
                              const CompareOptions &options)
{
    if (!areSameType(left, right))
    {
        bool looselyEqual = !options.strictType && !isContainer(left) && !isContainer(right) &&
                            canonicalText(left) == canonicalText(right);
        return makeItem(path, rightPath, looselyEqual ? DiffType::Unchanged : DiffType::Modified,
                        &left, &right, depth);
    }

    if (left.is_object())
        return compareObjects(left, right, path, rightPath, depth, options);
    if (left.is_array())
        return compareArrays(left, right, path, rightPath, depth, options);

    bool equal = valuesEqual(left, right, options);
    return makeItem(path, rightPath, equal ? DiffType::Unchanged : DiffType::Modified, &left,
                    &right, depth);
}

CompareDiffResult compareJson(std::shared_ptr<const json> left, std::shared_ptr<const json> right,
                              const CompareOptions &options)
{
    DiffItem root = compareValues(*left, *right, DiffPath(), DiffPath(), 0, options);
    return CompareDiffResult(std::move(root), std::move(left), std::move(right));
}

CompareDiffResult compareJson(const json &left, const json &right, const CompareOptions &options)
{
    return compareJson(std::make_shared<const json>(left), std::make_shared<const json>(right),
                       options);
}
