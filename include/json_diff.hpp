#pragma once

#include "json_value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class DiffType
{
    Added,     // only in the right document
    Removed,   // only in the left document
    Modified,  // in both, with different values
    Unchanged
};

std::string diffTypeName(DiffType type);

enum class CompareSide
{
    Left,
    Right
};

using DiffPath = std::vector<std::string>;

// One node of the comparison tree.  Containers present on both sides are
// Unchanged themselves and report changes through their children; an
// Added, Removed or type-changed Modified container has no children.
struct DiffItem
{
    DiffPath path;          // field names and array indices from the root
    DiffPath rightPath;     // same element's position in the right document
    DiffType type = DiffType::Unchanged;
    std::optional<std::string> key; // last path segment
    const json *leftValue = nullptr;  // points into the compared documents
    const json *rightValue = nullptr;
    std::vector<DiffItem> children;
    int depth = 0;

    bool hasDiff() const;
    // RFC 6901 pointer for `path`; the root is "".
    std::string jsonPointerPath() const;
    const DiffPath &pathFor(CompareSide side) const
    {
        return side == CompareSide::Left ? path : rightPath;
    }
};

std::string jsonPointer(const DiffPath &path);

struct CompareOptions
{
    // Objects are key-sorted maps, so key order never takes part in
    // equality; the flag is kept for callers that record it.
    bool ignoreKeyOrder = true;
    bool ignoreArrayOrder = false;
    bool strictType = true;
    // Identity fields tried in order when pairing object elements of
    // unordered arrays.  Structural equality is the last resort.
    std::vector<std::string> matchKeys{"id", "name"};
};

class CompareDiffResult
{
public:
    CompareDiffResult(DiffItem root, std::shared_ptr<const json> left,
                      std::shared_ptr<const json> right);

    const DiffItem &root() const { return root_; }
    const json &left() const { return *left_; }
    const json &right() const { return *right_; }

    size_t addedCount() const { return added_; }
    size_t removedCount() const { return removed_; }
    size_t modifiedCount() const { return modified_; }
    size_t totalDiffCount() const { return added_ + removed_ + modified_; }
    bool isIdentical() const { return totalDiffCount() == 0; }

    // Every item that is not Unchanged, in pre-order.  The pointers refer
    // into this result and are only valid while it lives.
    std::vector<const DiffItem *> flattenedDiffItems() const;

    // [{"type", "path", "left"?, "right"?}, ...] for the flattened items.
    json serializeDiff() const;

private:
    DiffItem root_;
    std::shared_ptr<const json> left_;
    std::shared_ptr<const json> right_;
    size_t added_ = 0;
    size_t removed_ = 0;
    size_t modified_ = 0;
};

CompareDiffResult compareJson(std::shared_ptr<const json> left, std::shared_ptr<const json> right,
                              const CompareOptions &options = CompareOptions());
CompareDiffResult compareJson(const json &left, const json &right,
                              const CompareOptions &options = CompareOptions());

// Text form of a scalar used for loose comparisons and identity keys.
// Containers produce their compact canonical JSON.
std::string canonicalText(const json &value);
