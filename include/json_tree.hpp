#pragma once

#include "json_value.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A TreeNode represents a single entry in the tree.  Each node holds a
// pointer into the parsed document and builds its child nodes the first
// time they are asked for, so collapsed branches of a large document
// never allocate anything.  Children are owned by their parent; the
// parent link is a plain back pointer.
class TreeNode
{
public:
    using ChildList = std::vector<std::unique_ptr<TreeNode>>;

    // Build the root of a tree over `document`.  Only the root is created;
    // the root keeps the document alive for the lifetime of the tree.
    static std::unique_ptr<TreeNode> from(std::shared_ptr<const json> document,
                                          int defaultFoldDepth = 2);
    static std::unique_ptr<TreeNode> from(const json &value, int defaultFoldDepth = 2);

    // `expanded` overrides the default of depth < defaultFoldDepth.
    TreeNode(const json *value, std::optional<std::string> key, int depth,
             std::optional<size_t> indexInParent, bool isLastChild, TreeNode *parent,
             int defaultFoldDepth, std::optional<bool> expanded = std::nullopt);

    TreeNode(const TreeNode &) = delete;
    TreeNode &operator=(const TreeNode &) = delete;

    const std::optional<std::string> &key() const { return key_; }
    const json &value() const { return *value_; }
    int depth() const { return depth_; }
    std::optional<size_t> indexInParent() const { return indexInParent_; }
    bool isLastChild() const { return isLastChild_; }
    TreeNode *parent() const { return parent_; }
    int defaultFoldDepth() const { return defaultFoldDepth_; }

    bool isExpanded() const { return expanded_; }
    void setExpanded(bool expanded) { expanded_ = expanded; }
    void toggleExpanded() { expanded_ = !expanded_; }

    // Child nodes in sorted key order for objects and index order for
    // arrays.  Built once, on first call; scalars always return an empty
    // list without building anything.
    const ChildList &children();
    bool isMaterialized() const { return materialized_.load(); }

    // Set the expand flag on the whole subtree.  Both walk every element.
    void expandAll();
    void collapseAll();
    // Expand the nodes less than `level` levels below this one and
    // collapse everything deeper.  Level 0 collapses this node as well.
    void expandToLevel(int level);

    // Pre-order list of this node and every node under an expanded chain.
    std::vector<TreeNode *> allNodes();
    void collectVisible(std::vector<TreeNode *> &out);
    // Pre-order list of the whole subtree regardless of expand state.
    std::vector<TreeNode *> allNodesIncludingCollapsed();
    // Number of nodes allNodes() lists below this one.
    size_t visibleDescendantCount();

    // Walk one child index per level.  Returns nullptr for an index out of
    // range.  Only the levels on the path are materialized.
    TreeNode *nodeAt(const std::vector<int> &childIndices);

    // Expand every ancestor of `target` up to and including this node.
    // Returns false, touching nothing, when `target` is not below this node.
    bool expandPathTo(TreeNode *target);

    // True if the key or, for scalars, the value text contains the query.
    bool matches(const std::string &queryLowercased, bool ignoreEscapeSequences = false) const;

    std::string displayKey() const;
    std::string displayValue() const;
    std::string copyValue() const;
    std::string plainValue() const;

private:
    void materializeChildren();

    std::shared_ptr<const json> document_;
    const json *value_ = nullptr;
    std::optional<std::string> key_;
    int depth_ = 0;
    std::optional<size_t> indexInParent_;
    bool isLastChild_ = true;
    TreeNode *parent_ = nullptr;
    int defaultFoldDepth_ = 2;
    bool expanded_ = false;

    ChildList children_;
    std::once_flag materializeOnce_;
    std::atomic<bool> materialized_{false};
};

// Branch drawing prefix ("│   ", "├── ", ...) for a node, relative to
// the root of its tree.
std::string connectorPrefix(const TreeNode *node);

// "key: value" for scalars, "key (dictionary, N keys)" for containers.
std::string nodeLabel(const TreeNode *node);

// Toggle the node at `index` of a list previously produced by allNodes()
// and patch the list in place: the newly visible descendants are
// inserted after it, or its visible descendants are removed.  Returns
// false when `index` is out of range.
bool toggleInVisibleList(std::vector<TreeNode *> &visible, size_t index);
