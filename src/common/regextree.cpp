#include <common/regextree.h>

TreeNode::~TreeNode() {
    if (children.empty())
        return;
    // Detach the grandchildren so that every node is freed childless
    std::vector<TreeNode> pending;
    for (auto &child : children) {
        if (!child.isLeaf())
            pending.push_back(std::move(child));
    }
    children.clear();
    while (!pending.empty()) {
        TreeNode node = std::move(pending.back());
        pending.pop_back();
        for (auto &child : node.children) {
            if (!child.isLeaf())
                pending.push_back(std::move(child));
        }
        node.children.clear();
    }
}

TreeNode TreeNode::of(std::string l, TreeNode child) {
    TreeNode node(std::move(l));
    node.children.push_back(std::move(child));
    return node;
}

TreeNode TreeNode::of(std::string l, TreeNode first, TreeNode second) {
    TreeNode node(std::move(l));
    node.children.reserve(2);
    node.children.push_back(std::move(first));
    node.children.push_back(std::move(second));
    return node;
}

TreeNode TreeNode::of(std::string l, TreeNode first, TreeNode second, TreeNode third) {
    TreeNode node(std::move(l));
    node.children.reserve(3);
    node.children.push_back(std::move(first));
    node.children.push_back(std::move(second));
    node.children.push_back(std::move(third));
    return node;
}

std::string toString(TreeNode const &tree) {
    std::string out = "";
    std::vector<TreeNode const *> pending = {&tree};
    while (!pending.empty()) {
        TreeNode const *node = pending.back();
        pending.pop_back();
        if (node->isLeaf()) {
            out += node->label;
            continue;
        }
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            pending.push_back(&*it);
        }
    }
    return out;
}

void dump(std::ostream &out, TreeNode const &tree, unsigned int depth) {
    std::vector<std::pair<TreeNode const *, unsigned int>> pending = {{&tree, depth}};
    while (!pending.empty()) {
        TreeNode const *node = pending.back().first;
        unsigned int level = pending.back().second;
        pending.pop_back();
        out << std::string(2 * level, ' ');
        if (node->isLeaf()) {
            out << "'" << node->label << "'\n";
            continue;
        }
        out << node->label << "\n";
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            pending.emplace_back(&*it, level + 1);
        }
    }
}
