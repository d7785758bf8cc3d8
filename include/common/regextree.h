#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <utility>

/* Labels of the grammar rules. Leaves are labeled with the literal
   character they come from (a one char string). */
#define TREE_EXPR "Expr"
#define TREE_TERM "Term"
#define TREE_FACTOR "Factor"
#define TREE_ATOM "Atom"
#define TREE_CHAR "Char"

/**
 * A node of the parse tree of a regex.
 *
 * Inner nodes are labeled with the name of the grammar rule that produced
 * them and hold the matched alternative as children, literal tokens
 * (`|`, `(`, `)`, `\`, quantifiers) included. Leaves have no children.
 */
struct TreeNode {
    std::string label;
    std::vector<TreeNode> children;

    TreeNode() {}
    TreeNode(std::string l): label(std::move(l)) {}
    TreeNode(std::string l, std::vector<TreeNode> c):
        label(std::move(l)), children(std::move(c)) {}

    TreeNode(TreeNode const &) = default;
    TreeNode(TreeNode &&) = default;
    TreeNode &operator=(TreeNode const &) = default;
    TreeNode &operator=(TreeNode &&) = default;

    /* Frees deep chains without recursing once per level */
    ~TreeNode();

    /** Build an inner node, taking ownership of the children. */
    static TreeNode of(std::string l, TreeNode child);
    static TreeNode of(std::string l, TreeNode first, TreeNode second);
    static TreeNode of(std::string l, TreeNode first, TreeNode second, TreeNode third);

    /** Build a leaf labeled by a single character. */
    static TreeNode leaf(char c) {
        return TreeNode(std::string(1, c));
    }

    bool isLeaf() const {
        return children.empty();
    }

    bool operator==(TreeNode const &other) const {
        return label == other.label && children == other.children;
    }
    bool operator!=(TreeNode const &other) const {
        return !(*this == other);
    }
};

/** Return the regex spelled by the leaves of the tree, left to right. */
std::string toString(TreeNode const &tree);

/** Write an indented listing of the tree, one node per line. */
void dump(std::ostream &out, TreeNode const &tree, unsigned int depth = 0);
