#include <common/regexcompiler.h>
#include <common/regexparser.h>
#include <common/log.h>

#include <deque>
#include <string>
#include <utility>
#include <vector>

/* Grammar rules, from the loosest to the tightest binding one */
enum TreeRank {
    RANK_EXPR = 0,
    RANK_TERM = 1,
    RANK_FACTOR = 2,
    RANK_ATOM = 3,
    RANK_CHAR = 4,
};

static const char *rankLabels[] = {TREE_EXPR, TREE_TERM, TREE_FACTOR, TREE_ATOM, TREE_CHAR};

static bool isQuantifier(std::string const &label) {
    return label == "*" || label == "+" || label == "?";
}

static bool isLiteralLeaf(TreeNode const &node) {
    return node.isLeaf() && node.label.size() == 1;
}

/* Return the literal matched by a Char node */
static char charSymbol(TreeNode const &node) {
    if (node.children.size() == 2 && node.children[0].label == "\\"
        && isLiteralLeaf(node.children[0]) && isLiteralLeaf(node.children[1])) {
        return node.children[1].label[0];
    }
    if (node.children.size() == 1 && isLiteralLeaf(node.children[0])) {
        return node.children[0].label[0];
    }
    throw UnrecognizedNode(node.label);
}

/**
 * Collect the operands of a chain of `Expr -> Term '|' Expr` or of
 * `Term -> Factor Term` nodes, walking the right spine in a loop.
 *
 * The chain ends on a one child node, or on a link child with another
 * label, which is then the last operand.
 *
 * @throw UnrecognizedNode If a node of the chain has the wrong shape.
 */
static std::vector<TreeNode const *> chainOperands(TreeNode const &node) {
    std::vector<TreeNode const *> operands;
    TreeNode const *current = &node;
    while (true) {
        size_t n = current->children.size();
        if (n == 1) {
            operands.push_back(&current->children[0]);
            return operands;
        }
        bool linked = current->label == TREE_EXPR
            ? n == 3 && current->children[1].label == "|"
            : n == 2;
        if (!linked)
            throw UnrecognizedNode(current->label);
        operands.push_back(&current->children[0]);
        TreeNode const &link = current->children[n - 1];
        if (link.label != current->label) {
            operands.push_back(&link);
            return operands;
        }
        current = &link;
    }
}

/* Compile one node of the tree into a fragment of `builder` */
static Fragment compileNode(NfaBuilder &builder, TreeNode const &node) {
    size_t n = node.children.size();
    if (node.isLeaf()) {
        throw UnrecognizedNode(node.label);
    } else if (node.label == TREE_EXPR || node.label == TREE_TERM) {
        // Compile the operands left to right, then join them from the right
        std::vector<Fragment> fragments;
        for (TreeNode const *operand : chainOperands(node)) {
            fragments.push_back(compileNode(builder, *operand));
        }
        Fragment result = fragments.back();
        for (size_t i = fragments.size() - 1; i-- > 0;) {
            if (node.label == TREE_EXPR)
                result = builder.unite(fragments[i], result);
            else
                result = builder.concat(fragments[i], result);
        }
        return result;
    } else if (node.label == TREE_FACTOR) {
        if (n == 2) {
            // Factor -> Atom MetaChar
            std::string const &meta = node.children[1].label;
            if (!isQuantifier(meta))
                throw UnrecognizedNode(meta);
            Fragment operand = compileNode(builder, node.children[0]);
            if (meta == "*")
                return builder.closure(operand);
            if (meta == "+")
                return builder.oneOrMore(operand);
            return builder.zeroOrOne(operand);
        } else if (n == 1) {
            return compileNode(builder, node.children[0]);
        }
    } else if (node.label == TREE_ATOM) {
        if (n == 3 && node.children[0].label == "(" && node.children[2].label == ")") {
            // Atom -> '(' Expr ')'
            return compileNode(builder, node.children[1]);
        } else if (n == 1) {
            return compileNode(builder, node.children[0]);
        }
    } else if (node.label == TREE_CHAR) {
        return builder.fromSymbol(charSymbol(node));
    }
    throw UnrecognizedNode(node.label);
}

RegexNfa compileFromTree(TreeNode const &tree) {
    NfaBuilder builder;
    Fragment fragment = compileNode(builder, tree);
    RegexNfa nfa = builder.finish(fragment);
    if (Log::level >= LOG_DEBUG) {
        Log::debug("Compiled `" + toString(tree) + "` into "
                   + std::to_string(nfa.size()) + " states.");
    }
    return nfa;
}

RegexNfa compileFromInfix(std::string const &pattern) {
    if (pattern.empty()) {
        NfaBuilder builder;
        return builder.finish(builder.fromEpsilon());
    }
    return compileFromTree(parse(pattern));
}

RegexNfa compileFromPostfix(std::string const &tokens) {
    if (tokens.empty()) {
        NfaBuilder builder;
        return builder.finish(builder.fromEpsilon());
    }
    return compileFromTree(postfixToTree(tokens));
}

/* The postfix form is turned into a tree that the infix parser could
   have produced. Operands are lifted to the rule the operator expects,
   adding a group only where the grammar needs one. */

static int rankOf(TreeNode const &node) {
    for (int r = RANK_EXPR; r <= RANK_CHAR; ++r) {
        if (node.label == rankLabels[r])
            return r;
    }
    throw UnrecognizedNode(node.label);
}

/* Wrap `node` until it is derived from the rule of rank `target` */
static TreeNode lift(TreeNode node, int target) {
    int rank = rankOf(node);
    while (rank != target) {
        if (rank > target) {
            node = TreeNode::of(rankLabels[rank - 1], std::move(node));
            rank--;
        } else {
            if (target == RANK_CHAR)
                throw RegexException("[Postfix] A group can't be used as a char.");
            // Looser than needed: put it in a group
            node = TreeNode::of(TREE_ATOM, TreeNode::leaf('('), lift(std::move(node), RANK_EXPR),
                                TreeNode::leaf(')'));
            rank = RANK_ATOM;
        }
    }
    return node;
}

static TreeNode symbolTree(char c) {
    static const std::string grammarChars = "|*+?()\\";
    if (grammarChars.find(c) != std::string::npos)
        return TreeNode::of(TREE_CHAR, TreeNode::leaf('\\'), TreeNode::leaf(c));
    return TreeNode::of(TREE_CHAR, TreeNode::leaf(c));
}

enum PostfixChain {
    CHAIN_NONE,
    CHAIN_CONCAT,
    CHAIN_UNION,
};

/**
 * A value of the postfix stack.
 *
 * Runs of `.` (or of `|`) are kept as a flat list of Factors (or Terms)
 * and only folded into nested nodes when another operator uses them, so
 * `ab.c.d.` reads as `abcd` and long runs never nest.
 */
struct PostfixOperand {
    PostfixChain chain;
    std::deque<TreeNode> parts;

    PostfixOperand(PostfixChain c, std::deque<TreeNode> p): chain(c), parts(std::move(p)) {}
    PostfixOperand(TreeNode node): chain(CHAIN_NONE) {
        parts.push_back(std::move(node));
    }
};

/* Build the tree of an operand, right spine first */
static TreeNode fold(PostfixOperand operand) {
    if (operand.chain == CHAIN_NONE)
        return std::move(operand.parts.front());
    std::deque<TreeNode> &parts = operand.parts;
    bool isUnion = operand.chain == CHAIN_UNION;
    TreeNode node = TreeNode::of(isUnion ? TREE_EXPR : TREE_TERM, std::move(parts.back()));
    for (size_t i = parts.size() - 1; i-- > 0;) {
        if (isUnion)
            node = TreeNode::of(TREE_EXPR, std::move(parts[i]), TreeNode::leaf('|'), std::move(node));
        else
            node = TreeNode::of(TREE_TERM, std::move(parts[i]), std::move(node));
    }
    return node;
}

/* The parts `operand` brings to a `chain`, lifted to `rank` */
static std::deque<TreeNode> partsOf(PostfixOperand operand, PostfixChain chain, int rank) {
    if (operand.chain == chain)
        return std::move(operand.parts);
    std::deque<TreeNode> parts;
    parts.push_back(lift(fold(std::move(operand)), rank));
    return parts;
}

/* Join two operands with `.` (parts lifted to Factor) or `|` (parts
   lifted to Term) */
static PostfixOperand join(PostfixOperand left, PostfixOperand right,
                           PostfixChain chain, int rank) {
    std::deque<TreeNode> first = partsOf(std::move(left), chain, rank);
    std::deque<TreeNode> second = partsOf(std::move(right), chain, rank);
    // Move the shorter list into the longer one
    if (first.size() >= second.size()) {
        for (auto &part : second) {
            first.push_back(std::move(part));
        }
    } else {
        for (auto it = first.rbegin(); it != first.rend(); ++it) {
            second.push_front(std::move(*it));
        }
        first.swap(second);
    }
    return PostfixOperand(chain, std::move(first));
}

/* Pop an operand safely */
static PostfixOperand popOperand(std::deque<PostfixOperand> &operands, size_t position, char op) {
    if (operands.empty()) {
        throw PostfixError(position, std::string("Operator `") + op + "` is missing an operand");
    }
    PostfixOperand operand = std::move(operands.back());
    operands.pop_back();
    return operand;
}

TreeNode postfixToTree(std::string const &tokens) {
    std::deque<PostfixOperand> operands;

    for (size_t i = 0; i < tokens.size(); ++i) {
        char c = tokens[i];
        switch (c) {
        case POSTFIX_ZERO_OR_MORE:
        case POSTFIX_ONE_OR_MORE:
        case POSTFIX_ZERO_OR_ONE: {
            TreeNode operand = fold(popOperand(operands, i, c));
            operands.emplace_back(TreeNode::of(TREE_FACTOR, lift(std::move(operand), RANK_ATOM),
                                               TreeNode::leaf(c)));
            break;
        }
        case POSTFIX_PIPE: {
            PostfixOperand right = popOperand(operands, i, c);
            PostfixOperand left = popOperand(operands, i, c);
            operands.push_back(join(std::move(left), std::move(right), CHAIN_UNION, RANK_TERM));
            break;
        }
        case POSTFIX_CONCAT: {
            PostfixOperand right = popOperand(operands, i, c);
            PostfixOperand left = popOperand(operands, i, c);
            operands.push_back(join(std::move(left), std::move(right), CHAIN_CONCAT, RANK_FACTOR));
            break;
        }
        default:
            operands.emplace_back(symbolTree(c));
            break;
        }
    }

    if (operands.empty())
        throw PostfixError(0, "Empty postfix expression");
    if (operands.size() > 1)
        throw PostfixError(tokens.size(), std::to_string(operands.size() - 1)
                           + " operand(s) are missing an operator");
    return lift(fold(std::move(operands.back())), RANK_EXPR);
}

/* Emit the postfix form of `node` into `out` */
static void writePostfix(TreeNode const &node, std::string &out) {
    size_t n = node.children.size();
    if (node.isLeaf()) {
        throw UnrecognizedNode(node.label);
    } else if (node.label == TREE_EXPR || node.label == TREE_TERM) {
        // a b c ... then one operator per link
        std::vector<TreeNode const *> operands = chainOperands(node);
        for (TreeNode const *operand : operands) {
            writePostfix(*operand, out);
        }
        char op = node.label == TREE_EXPR ? POSTFIX_PIPE : POSTFIX_CONCAT;
        out.append(operands.size() - 1, op);
    } else if (node.label == TREE_FACTOR && (n == 1 || n == 2)) {
        writePostfix(node.children[0], out);
        if (n == 2) {
            if (!isQuantifier(node.children[1].label))
                throw UnrecognizedNode(node.children[1].label);
            out += node.children[1].label;
        }
    } else if (node.label == TREE_ATOM && (n == 1 || n == 3)) {
        writePostfix(node.children[n == 3 ? 1 : 0], out);
    } else if (node.label == TREE_CHAR) {
        char c = charSymbol(node);
        static const std::string operators = ".|*+?";
        if (operators.find(c) != std::string::npos) {
            throw RegexException(std::string("[Postfix] Symbol `") + c
                                 + "` can't be written in postfix form.");
        }
        out += c;
    } else {
        throw UnrecognizedNode(node.label);
    }
}

std::string toPostfix(TreeNode const &tree) {
    std::string out = "";
    writePostfix(tree, out);
    return out;
}
