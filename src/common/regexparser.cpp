#include <common/regexparser.h>

#include <utility>
#include <vector>

static std::string quoteChar(char c) {
    return std::string("`") + c + "`";
}

TreeNode RegexParser::parse() {
    m_pos = 0;
    TreeNode root = expr();
    // expr() stops on the first char it can't use, which is only
    // legal at the end of the pattern
    if (hasMoreChars())
        throw SyntaxError(m_pos, "Unexpected symbol " + quoteChar(m_pattern[m_pos]));
    return root;
}

char RegexParser::peek() const {
    if (!hasMoreChars())
        throw UnexpectedEndOfInput(m_pos);
    return m_pattern[m_pos];
}

void RegexParser::match(char c) {
    char current = peek();
    if (current != c) {
        throw SyntaxError(m_pos, "Unexpected symbol " + quoteChar(current)
                          + ", expected " + quoteChar(c));
    }
    m_pos++;
}

char RegexParser::next() {
    char c = peek();
    match(c);
    return c;
}

/* Expr -> Term | Term '|' Expr

   The alternatives are read in a loop and folded from the right, so a
   long chain of `|` doesn't recurse. */
TreeNode RegexParser::expr() {
    std::vector<TreeNode> terms;
    terms.push_back(term());
    while (hasMoreChars() && peek() == '|') {
        match('|');
        terms.push_back(term());
    }
    TreeNode node = TreeNode::of(TREE_EXPR, std::move(terms.back()));
    for (size_t i = terms.size() - 1; i-- > 0;) {
        node = TreeNode::of(TREE_EXPR, std::move(terms[i]), TreeNode::leaf('|'), std::move(node));
    }
    return node;
}

/* Term -> Factor | Factor Term */
TreeNode RegexParser::term() {
    std::vector<TreeNode> factors;
    factors.push_back(factor());
    while (hasMoreChars() && peek() != ')' && peek() != '|') {
        factors.push_back(factor());
    }
    TreeNode node = TreeNode::of(TREE_TERM, std::move(factors.back()));
    for (size_t i = factors.size() - 1; i-- > 0;) {
        node = TreeNode::of(TREE_TERM, std::move(factors[i]), std::move(node));
    }
    return node;
}

/* Factor -> Atom | Atom MetaChar */
TreeNode RegexParser::factor() {
    TreeNode operand = atom();
    if (hasMoreChars() && isMetaChar(peek())) {
        char meta = next();
        return TreeNode::of(TREE_FACTOR, std::move(operand), TreeNode::leaf(meta));
    }
    return TreeNode::of(TREE_FACTOR, std::move(operand));
}

/* Atom -> Char | '(' Expr ')' */
TreeNode RegexParser::atom() {
    if (peek() == '(') {
        match('(');
        TreeNode inner = expr();
        match(')');
        return TreeNode::of(TREE_ATOM, TreeNode::leaf('('), std::move(inner), TreeNode::leaf(')'));
    }
    return TreeNode::of(TREE_ATOM, character());
}

/* Char -> AnyCharExceptMeta | '\' AnyChar */
TreeNode RegexParser::character() {
    char c = peek();
    if (isMetaChar(c)) {
        // A quantifier needs an atom on its left
        throw SyntaxError(m_pos, "Unexpected meta char " + quoteChar(c));
    }
    if (c == ')' || c == '|') {
        throw SyntaxError(m_pos, "Unexpected symbol " + quoteChar(c));
    }
    if (c == '\\') {
        match('\\');
        return TreeNode::of(TREE_CHAR, TreeNode::leaf('\\'), TreeNode::leaf(next()));
    }
    return TreeNode::of(TREE_CHAR, TreeNode::leaf(next()));
}

TreeNode parse(std::string const &pattern) {
    RegexParser parser(pattern);
    return parser.parse();
}
