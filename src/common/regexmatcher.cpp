#include <common/regexmatcher.h>
#include <common/regexcompiler.h>

#include <algorithm>

/* Add the closure of `state` to `states`. A state is visited in the
   current step when its `seen` stamp equals `step`, so a state is added
   once and epsilon cycles (from * and +) are only walked once. Bumping
   `step` starts a new step without clearing `seen`. */
static void addClosure(RegexNfa const &nfa, stateptr state, statelist &states,
                       std::vector<size_t> &seen, size_t step) {
    if (seen[state] == step)
        return;
    seen[state] = step;
    statelist worklist = {state};
    while (!worklist.empty()) {
        stateptr current = worklist.back();
        worklist.pop_back();
        NfaState const &s = nfa.state(current);
        if (!s.isEpsilonRelay())
            states.push_back(current);
        // Push in reverse to visit the targets in insertion order
        for (auto it = s.epsilons.rbegin(); it != s.epsilons.rend(); ++it) {
            if (seen[*it] != step) {
                seen[*it] = step;
                worklist.push_back(*it);
            }
        }
    }
}

static bool containsAcceptState(RegexNfa const &nfa, statelist const &states) {
    return std::find_if(states.begin(),
                        states.end(),
                        [&nfa](const stateptr x) {
                            return nfa.state(x).accept;
                        }) != states.end();
}

statelist epsilonClosure(RegexNfa const &nfa, stateptr state) {
    statelist out;
    if (state >= nfa.size())
        return out;
    std::vector<size_t> seen(nfa.size(), 0);
    addClosure(nfa, state, out, seen, 1);
    return out;
}

bool matches(RegexNfa const &nfa, std::string const &word) {
    if (nfa.size() == 0)
        return false;

    std::vector<size_t> seen(nfa.size(), 0);
    size_t step = 1;
    statelist current_states;
    addClosure(nfa, nfa.start(), current_states, seen, step);

    statelist next_states;
    for (char c : word) {
        if (current_states.empty())
            return false;
        step++;
        next_states.clear();
        for (stateptr state_id : current_states) {
            auto const &transitions = nfa.state(state_id).transitions;
            auto it = transitions.find(c);
            if (it != transitions.end()) {
                addClosure(nfa, it->second, next_states, seen, step);
            }
        }
        current_states.swap(next_states);
    }

    return containsAcceptState(nfa, current_states);
}

Matcher makeMatcher(std::string const &pattern) {
    auto nfa = std::make_shared<const RegexNfa>(compileFromInfix(pattern));
    return [nfa](std::string const &word) {
        return matches(*nfa, word);
    };
}

Regex::Regex(std::string const &pattern):
    m_pattern(pattern),
    m_nfa(std::make_shared<const RegexNfa>(compileFromInfix(pattern))) {
}

bool Regex::match(std::string const &s) const {
    return matches(*m_nfa, s);
}
