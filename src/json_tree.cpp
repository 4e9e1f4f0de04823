// Lazily materialized tree over a parsed JSON document
#include "json_tree.hpp"
#include "json_search.hpp"

#include <algorithm>
#include <string>
#include <vector>

std::unique_ptr<TreeNode> TreeNode::from(std::shared_ptr<const json> document, int defaultFoldDepth)
{
    auto root = std::make_unique<TreeNode>(document.get(), std::nullopt, 0, std::nullopt,
                                           true, nullptr, defaultFoldDepth);
    root->document_ = std::move(document);
    return root;
}

std::unique_ptr<TreeNode> TreeNode::from(const json &value, int defaultFoldDepth)
{
    return from(std::make_shared<const json>(value), defaultFoldDepth);
}

TreeNode::TreeNode(const json *value, std::optional<std::string> key, int depth,
                   std::optional<size_t> indexInParent, bool isLastChild, TreeNode *parent,
                   int defaultFoldDepth, std::optional<bool> expanded)
    : value_(value),
      key_(std::move(key)),
      depth_(depth),
      indexInParent_(indexInParent),
      isLastChild_(isLastChild),
      parent_(parent),
      defaultFoldDepth_(defaultFoldDepth),
      expanded_(expanded ? *expanded : depth < defaultFoldDepth)
{
}

const TreeNode::ChildList &TreeNode::children()
{
    static const ChildList noChildren;
    if (!isContainer(*value_))
        return noChildren;
    std::call_once(materializeOnce_, [this] { materializeChildren(); });
    return children_;
}

// Create one node per element.  nlohmann objects iterate in sorted key
// order, which gives the stable alphabetical child order.
void TreeNode::materializeChildren()
{
    const json &j = *value_;
    children_.reserve(j.size());
    if (j.is_object())
    {
        size_t idx = 0;
        for (auto it = j.begin(); it != j.end(); ++it, ++idx)
        {
            children_.push_back(std::make_unique<TreeNode>(&it.value(), it.key(), depth_ + 1, idx,
                                                           idx + 1 == j.size(), this,
                                                           defaultFoldDepth_));
        }
    }
    else
    {
        for (size_t idx = 0; idx < j.size(); ++idx)
        {
            std::string childKey = "[" + std::to_string(idx) + "]";
            children_.push_back(std::make_unique<TreeNode>(&j[idx], childKey, depth_ + 1, idx,
                                                           idx + 1 == j.size(), this,
                                                           defaultFoldDepth_));
        }
    }
    materialized_.store(true);
}

void TreeNode::expandAll()
{
    expanded_ = true;
    for (auto &child : children())
    {
        child->expandAll();
    }
}

void TreeNode::collapseAll()
{
    expanded_ = false;
    for (auto &child : children())
    {
        child->collapseAll();
    }
}

void TreeNode::expandToLevel(int level)
{
    if (level <= 0)
    {
        collapseAll();
        return;
    }
    expanded_ = true;
    for (auto &child : children())
    {
        child->expandToLevel(level - 1);
    }
}

std::vector<TreeNode *> TreeNode::allNodes()
{
    std::vector<TreeNode *> out;
    collectVisible(out);
    return out;
}

// A node is visible if it is the root or its parent is expanded.
void TreeNode::collectVisible(std::vector<TreeNode *> &out)
{
    out.push_back(this);
    if (expanded_)
    {
        for (auto &child : children())
        {
            child->collectVisible(out);
        }
    }
}

static void collectAll(TreeNode *node, std::vector<TreeNode *> &out)
{
    out.push_back(node);
    for (auto &child : node->children())
    {
        collectAll(child.get(), out);
    }
}

std::vector<TreeNode *> TreeNode::allNodesIncludingCollapsed()
{
    std::vector<TreeNode *> out;
    collectAll(this, out);
    return out;
}

size_t TreeNode::visibleDescendantCount()
{
    if (!expanded_)
        return 0;
    size_t count = 0;
    for (auto &child : children())
    {
        count += 1 + child->visibleDescendantCount();
    }
    return count;
}

TreeNode *TreeNode::nodeAt(const std::vector<int> &childIndices)
{
    TreeNode *current = this;
    for (int index : childIndices)
    {
        const ChildList &kids = current->children();
        if (index < 0 || static_cast<size_t>(index) >= kids.size())
            return nullptr;
        current = kids[index].get();
    }
    return current;
}

bool TreeNode::expandPathTo(TreeNode *target)
{
    if (target == nullptr)
        return false;
    // Walk up from the target first so nothing changes when it lies
    // outside this subtree.
    std::vector<TreeNode *> ancestors;
    TreeNode *cur = target;
    while (cur != this)
    {
        cur = cur->parent_;
        if (cur == nullptr)
            return false;
        ancestors.push_back(cur);
    }
    for (TreeNode *ancestor : ancestors)
    {
        ancestor->expanded_ = true;
    }
    return true;
}

bool TreeNode::matches(const std::string &queryLowercased, bool ignoreEscapeSequences) const
{
    return leafMatches(*value_, key_, queryLowercased, ignoreEscapeSequences);
}

std::string TreeNode::displayKey() const
{
    return key_ ? *key_ : "root";
}

std::string TreeNode::displayValue() const
{
    return ::displayValue(*value_);
}

std::string TreeNode::copyValue() const
{
    return ::copyValue(*value_);
}

std::string TreeNode::plainValue() const
{
    return ::plainValue(*value_);
}

// Build the tree prefix for a node.  This string contains the
// vertical bar and branch characters needed to draw a proper tree.
std::string connectorPrefix(const TreeNode *node)
{
    std::string prefix;
    const TreeNode *cur = node;
    while (cur->parent() != nullptr)
    {
        const TreeNode *parent = cur->parent();
        // the root has no branch of its own, so its isLastChild flag
        // doesn't affect vertical lines for deeper levels
        if (parent->parent() != nullptr)
        {
            if (!parent->isLastChild())
            {
                prefix = std::string("│   ") + prefix;
            }
            else
            {
                prefix = std::string("    ") + prefix;
            }
        }
        cur = parent;
    }
    if (node->parent() != nullptr)
    {
        prefix += node->isLastChild() ? "└── " : "├── ";
    }
    return prefix;
}

std::string nodeLabel(const TreeNode *node)
{
    const json &v = node->value();
    std::string key = node->displayKey();
    if (v.is_object())
    {
        size_t count = v.size();
        return key + " (dictionary, " + std::to_string(count) + (count == 1 ? " key)" : " keys)");
    }
    if (v.is_array())
    {
        size_t count = v.size();
        return key + " (list, " + std::to_string(count) + (count == 1 ? " item)" : " items)");
    }
    if (v.is_string())
    {
        return key + ": \"" + escapeForDisplay(v.get<std::string>()) + "\"";
    }
    return key + ": " + node->plainValue();
}

bool toggleInVisibleList(std::vector<TreeNode *> &visible, size_t index)
{
    if (index >= visible.size())
        return false;

    TreeNode *node = visible[index];
    node->toggleExpanded();
    if (node->isExpanded())
    {
        std::vector<TreeNode *> subtree = node->allNodes();
        visible.insert(visible.begin() + index + 1, subtree.begin() + 1, subtree.end());
    }
    else
    {
        // Descendants follow the node directly and are all deeper than it
        size_t end = index + 1;
        while (end < visible.size() && visible[end]->depth() > node->depth())
        {
            ++end;
        }
        visible.erase(visible.begin() + index + 1, visible.begin() + end);
    }
    return true;
}
