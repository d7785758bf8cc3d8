#pragma once

#include <common/regexcommon.h>
#include <common/regextree.h>

/**
 * Recursive descent parser for regular expressions.
 *
 * Implements the following LL(1) grammar, one method per rule:
 *
 *     Expr     -> Term | Term '|' Expr
 *     Term     -> Factor | Factor Term
 *     Factor   -> Atom | Atom MetaChar
 *     Atom     -> Char | '(' Expr ')'
 *     Char     -> AnyCharExceptMeta | '\' AnyChar
 *     MetaChar -> '?' | '*' | '+'
 *
 * A parser holds the pattern and its scan position, so a fresh instance
 * is needed for every pattern. Use the free function parse() unless the
 * position is needed afterwards.
 */
class RegexParser {
public:
    RegexParser(std::string const &pattern): m_pattern(pattern), m_pos(0) {
    }

    /**
     * Parse the whole pattern.
     *
     * @throw SyntaxError          On a symbol that doesn't fit the grammar,
     *                             including trailing input.
     * @throw UnexpectedEndOfInput If the pattern stops in the middle of a rule.
     */
    TreeNode parse();

    /** Number of characters consumed so far. */
    size_t position() const {
        return m_pos;
    }

private:
    std::string m_pattern;
    size_t m_pos;

    TreeNode expr();
    TreeNode term();
    TreeNode factor();
    TreeNode atom();
    TreeNode character();

    bool hasMoreChars() const {
        return m_pos < m_pattern.size();
    }

    /* Return the current char. Looking past the end of the pattern
       is an error, never a sentinel value. */
    char peek() const;

    /* Consume `c` or fail */
    void match(char c);

    /* Consume and return the current char */
    char next();

    static bool isMetaChar(char c) {
        return c == '*' || c == '+' || c == '?';
    }
};

/** Parse an infix regex into its parse tree. */
TreeNode parse(std::string const &pattern);
