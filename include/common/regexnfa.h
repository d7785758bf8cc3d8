#pragma once
#include <common/regexcommon.h>

#include <cstdint>
#include <map>
#include <vector>

/* Nfa automata built with Thompson's construction, inspired by
   https://swtch.com/~rsc/regexp/regexp1.html

   Every automaton has exactly one start state and one accept state.
   A state either carries symbol transitions (at most one target per
   symbol) or epsilon transitions ("teleportation gates" that consume
   nothing). The model allows both on one state; the construction
   never produces such a state.
*/

/* We are allocating our own memory space. Each
   state is represented by an index in this memory space */
typedef uint32_t stateptr;
/* A list of states */
typedef std::vector<stateptr> statelist;

struct NfaState {
    bool accept = false;
    /* Target of the transition on a given symbol */
    std::map<char, stateptr> transitions;
    statelist epsilons;

    bool isEpsilonRelay() const {
        return !epsilons.empty() && transitions.empty() && !accept;
    }
};

/* A fragment is a partially built nfa: its entry state and its
   unique accept state */
struct Fragment {
    stateptr start;
    stateptr end;
};

/**
 * A compiled automaton. Immutable: it can only be produced by
 * NfaBuilder::finish() and is safe to share between threads.
 */
class RegexNfa {
public:
    RegexNfa(): m_start(0), m_end(0) {}

    stateptr start() const {
        return m_start;
    }

    stateptr end() const {
        return m_end;
    }

    size_t size() const {
        return m_states.size();
    }

    NfaState const &state(stateptr s) const {
        return m_states[s];
    }

    /** Number of symbol and epsilon transitions, all states included. */
    size_t countTransitions() const;

private:
    friend class NfaBuilder;

    std::vector<NfaState> m_states;
    stateptr m_start;
    stateptr m_end;
};

/**
 * Arena in which fragments are allocated and combined.
 *
 * Each operator allocates fresh states and only touches the states of
 * the fragments it receives to add edges from their accept state and
 * to clear its accept flag. Fragments must come from the same builder,
 * and a fragment must not be used again once it has been combined.
 */
class NfaBuilder {
public:
    NfaBuilder() {}

    /* (s) --e--> [e] */
    Fragment fromEpsilon();

    /* (s) --c--> [e] */
    Fragment fromSymbol(char c);

    /* (a.s) ... (a.e) --e--> (b.s) ... [b.e] */
    Fragment concat(Fragment first, Fragment second);

    /*      /--e--> (a.s) ... (a.e) --e--\
       (s) <                              > [e]
            \--e--> (b.s) ... (b.e) --e--/
    */
    Fragment unite(Fragment first, Fragment second);

    /*                /<-------e-------\
       (s) --e--> (a.s) ... (a.e) --e--> [e]
          \-------------e--------------/^
    */
    Fragment closure(Fragment fragment);

    /* (s) --e--> (a.s) ... (a.e) --e--> [e]
          \-------------e--------------/^
    */
    Fragment zeroOrOne(Fragment fragment);

    /*                /<-------e-------\
       (s) --e--> (a.s) ... (a.e) --e--> [e]
    */
    Fragment oneOrMore(Fragment fragment);

    /** Number of states allocated so far. */
    size_t size() const {
        return m_states.size();
    }

    /**
     * Turn `fragment` into a standalone automaton. The builder gives its
     * states away and is empty afterwards.
     */
    RegexNfa finish(Fragment fragment);

private:
    std::vector<NfaState> m_states;

    stateptr allocateState(bool accept);

    void addEpsilonTransition(stateptr from, stateptr to) {
        m_states[from].epsilons.push_back(to);
    }

    /* A state goes to exactly one state for a given symbol */
    void addTransition(stateptr from, stateptr to, char symbol) {
        m_states[from].transitions[symbol] = to;
    }

    /* Accept state of a fragment being absorbed by a bigger one */
    void release(stateptr end) {
        m_states[end].accept = false;
    }
};
