#pragma once

#include <common/regexnfa.h>
#include <common/regextree.h>

/* Tokens of the postfix form. Any other char is a symbol. In the
   postfix form '.' is the explicit concatenation, never a wildcard. */
#define POSTFIX_CONCAT '.'
#define POSTFIX_PIPE '|'
#define POSTFIX_ZERO_OR_MORE '*'
#define POSTFIX_ONE_OR_MORE '+'
#define POSTFIX_ZERO_OR_ONE '?'

/**
 * Build an nfa from a parse tree, bottom-up, applying one Thompson
 * operator per grammar node. This is the reference compiler: the other
 * entry points go through it.
 *
 * @throw UnrecognizedNode If a node is not part of the grammar.
 */
RegexNfa compileFromTree(TreeNode const &tree);

/**
 * Build an nfa from a postfix token string such as "ab|*c.".
 * An empty string gives the automaton of the empty word.
 *
 * @throw PostfixError If an operator lacks operands, or several
 *                     operands are left at the end.
 */
RegexNfa compileFromPostfix(std::string const &tokens);

/**
 * Parse an infix pattern and compile it. The empty pattern gives the
 * automaton of the empty word without going through the parser.
 */
RegexNfa compileFromInfix(std::string const &pattern);

/**
 * Convert a postfix token string to the parse tree of an equivalent
 * infix regex. Parentheses are added only where the grammar needs them.
 *
 * @throw PostfixError On malformed input, the empty string included.
 */
TreeNode postfixToTree(std::string const &tokens);

/**
 * Write a parse tree in postfix form, with '.' for concatenation.
 *
 * @throw RegexException If a literal is one of the postfix operators,
 *                       the postfix form having no escape.
 */
std::string toPostfix(TreeNode const &tree);
