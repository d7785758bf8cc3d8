#include <common/regexnfa.h>

#include <limits>
#include <utility>

size_t RegexNfa::countTransitions() const {
    size_t n = 0;
    for (auto const &s : m_states) {
        n += s.transitions.size() + s.epsilons.size();
    }
    return n;
}

stateptr NfaBuilder::allocateState(bool accept) {
    if (m_states.size() >= std::numeric_limits<stateptr>::max())
        throw RegexException("[Nfa] Too many states.");
    m_states.emplace_back();
    m_states.back().accept = accept;
    return static_cast<stateptr>(m_states.size() - 1);
}

Fragment NfaBuilder::fromEpsilon() {
    stateptr start = allocateState(false);
    stateptr end = allocateState(true);
    addEpsilonTransition(start, end);
    return {start, end};
}

Fragment NfaBuilder::fromSymbol(char c) {
    stateptr start = allocateState(false);
    stateptr end = allocateState(true);
    addTransition(start, end, c);
    return {start, end};
}

Fragment NfaBuilder::concat(Fragment first, Fragment second) {
    addEpsilonTransition(first.end, second.start);
    release(first.end);
    return {first.start, second.end};
}

Fragment NfaBuilder::unite(Fragment first, Fragment second) {
    stateptr start = allocateState(false);
    addEpsilonTransition(start, first.start);
    addEpsilonTransition(start, second.start);

    stateptr end = allocateState(true);
    addEpsilonTransition(first.end, end);
    release(first.end);
    addEpsilonTransition(second.end, end);
    release(second.end);

    return {start, end};
}

Fragment NfaBuilder::closure(Fragment fragment) {
    stateptr start = allocateState(false);
    stateptr end = allocateState(true);

    addEpsilonTransition(start, end);
    addEpsilonTransition(start, fragment.start);

    addEpsilonTransition(fragment.end, end);
    addEpsilonTransition(fragment.end, fragment.start);
    release(fragment.end);

    return {start, end};
}

Fragment NfaBuilder::zeroOrOne(Fragment fragment) {
    stateptr start = allocateState(false);
    stateptr end = allocateState(true);

    addEpsilonTransition(start, end);
    addEpsilonTransition(start, fragment.start);

    addEpsilonTransition(fragment.end, end);
    release(fragment.end);

    return {start, end};
}

Fragment NfaBuilder::oneOrMore(Fragment fragment) {
    stateptr start = allocateState(false);
    stateptr end = allocateState(true);

    addEpsilonTransition(start, fragment.start);
    addEpsilonTransition(fragment.end, end);
    addEpsilonTransition(fragment.end, fragment.start);
    release(fragment.end);

    return {start, end};
}

RegexNfa NfaBuilder::finish(Fragment fragment) {
    if (fragment.start >= m_states.size() || fragment.end >= m_states.size())
        throw RegexException("[Nfa] Fragment doesn't belong to this builder.");
    RegexNfa nfa;
    nfa.m_states = std::move(m_states);
    nfa.m_start = fragment.start;
    nfa.m_end = fragment.end;
    m_states.clear();
    return nfa;
}
