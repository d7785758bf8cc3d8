#pragma once

#include <common/regexnfa.h>

#include <functional>
#include <memory>
#include <string>

/**
 * Return the states reachable from `state` through epsilon transitions
 * only, `state` included, skipping the pure epsilon relays: what is left
 * are the states that consume a symbol or accept.
 */
statelist epsilonClosure(RegexNfa const &nfa, stateptr state);

/**
 * Simulate the nfa on `word`, keeping the set of every state the nfa
 * can be in after each symbol. Never backtracks: the cost is linear in
 * the length of the word and in the size of the nfa.
 */
bool matches(RegexNfa const &nfa, std::string const &word);

typedef std::function<bool(std::string const &)> Matcher;

/** Compile `pattern` once and return a function matching words against it. */
Matcher makeMatcher(std::string const &pattern);

/**
 * A compiled pattern. Copies share the same immutable automaton, so a
 * Regex can be handed to several threads.
 */
class Regex {
public:
    /* Build a regex from a given infix pattern */
    Regex(std::string const &pattern);

    /* Return true if the regex matches the whole string */
    bool match(std::string const &string) const;

    std::string const &pattern() const {
        return m_pattern;
    }

    RegexNfa const &nfa() const {
        return *m_nfa;
    }

private:
    std::string m_pattern;
    std::shared_ptr<const RegexNfa> m_nfa;
};
