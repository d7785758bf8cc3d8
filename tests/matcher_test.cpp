#include <common/regexmatcher.h>
#include <common/regexcompiler.h>
#include <common/regexparser.h>

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

typedef std::set<size_t> Positions;
typedef std::function<Fragment(NfaBuilder &)> FragmentBuild;

/* Reference matcher working on the parse tree: the positions of `word`
   where a match of `node` starting at one of `from` can end. */
Positions ends(TreeNode const &node, std::string const &word, Positions const &from) {
    if (node.label == TREE_EXPR) {
        Positions out = ends(node.children[0], word, from);
        if (node.children.size() == 3) {
            Positions right = ends(node.children[2], word, from);
            out.insert(right.begin(), right.end());
        }
        return out;
    } else if (node.label == TREE_TERM) {
        Positions out = ends(node.children[0], word, from);
        if (node.children.size() == 2)
            out = ends(node.children[1], word, out);
        return out;
    } else if (node.label == TREE_FACTOR) {
        TreeNode const &operand = node.children[0];
        if (node.children.size() == 1)
            return ends(operand, word, from);
        std::string meta = node.children[1].label;
        Positions once = ends(operand, word, from);
        if (meta == "?") {
            once.insert(from.begin(), from.end());
            return once;
        }
        // Repeat until no new position shows up
        Positions out = once;
        Positions frontier = once;
        while (!frontier.empty()) {
            Positions next = ends(operand, word, frontier);
            frontier.clear();
            for (size_t p : next) {
                if (out.insert(p).second)
                    frontier.insert(p);
            }
        }
        if (meta == "*")
            out.insert(from.begin(), from.end());
        return out;
    } else if (node.label == TREE_ATOM) {
        return ends(node.children[node.children.size() == 3 ? 1 : 0], word, from);
    } else if (node.label == TREE_CHAR) {
        char c = node.children.back().label[0];
        Positions out;
        for (size_t p : from) {
            if (p < word.size() && word[p] == c)
                out.insert(p + 1);
        }
        return out;
    }
    ADD_FAILURE() << "unexpected node " << node.label;
    return Positions();
}

bool referenceMatch(std::string const &pattern, std::string const &word) {
    if (pattern.empty())
        return word.empty();
    Positions out = ends(parse(pattern), word, {0});
    return out.count(word.size()) > 0;
}

std::vector<std::string> allWords(std::string const &alphabet, size_t length) {
    std::vector<std::string> words = {""};
    std::vector<std::string> last = {""};
    for (size_t l = 1; l <= length; ++l) {
        std::vector<std::string> next;
        for (auto const &w : last) {
            for (char c : alphabet) {
                next.push_back(w + c);
            }
        }
        words.insert(words.end(), next.begin(), next.end());
        last = next;
    }
    return words;
}

bool matchFragment(FragmentBuild const &build, std::string const &word) {
    NfaBuilder builder;
    Fragment f = build(builder);
    return matches(builder.finish(f), word);
}

/* Small fragments used to check the operators against their definition */
std::vector<FragmentBuild> sampleFragments() {
    return {
        [](NfaBuilder &b) { return b.fromSymbol('a'); },
        [](NfaBuilder &b) { return b.fromEpsilon(); },
        [](NfaBuilder &b) { return b.concat(b.fromSymbol('a'), b.fromSymbol('b')); },
        [](NfaBuilder &b) { return b.unite(b.fromSymbol('b'), b.fromEpsilon()); },
        [](NfaBuilder &b) { return b.closure(b.fromSymbol('b')); },
        [](NfaBuilder &b) { return b.oneOrMore(b.unite(b.fromSymbol('a'), b.fromSymbol('b'))); },
    };
}

TEST(MatcherTest, SymbolAndEpsilon) {
    NfaBuilder symbol;
    RegexNfa a = symbol.finish(symbol.fromSymbol('a'));
    EXPECT_TRUE(matches(a, "a"));
    EXPECT_FALSE(matches(a, "b"));

    NfaBuilder epsilon;
    RegexNfa e = epsilon.finish(epsilon.fromEpsilon());
    EXPECT_TRUE(matches(e, ""));
    EXPECT_FALSE(matches(e, "x"));
}

TEST(MatcherTest, UnionIsEitherOperand) {
    auto fragments = sampleFragments();
    auto words = allWords("ab", 4);
    for (size_t i = 0; i < fragments.size(); ++i) {
        for (size_t j = 0; j < fragments.size(); ++j) {
            FragmentBuild united = [&](NfaBuilder &b) {
                Fragment left = fragments[i](b);
                Fragment right = fragments[j](b);
                return b.unite(left, right);
            };
            for (auto const &w : words) {
                EXPECT_EQ(matchFragment(united, w),
                          matchFragment(fragments[i], w) || matchFragment(fragments[j], w))
                    << i << " | " << j << " on `" << w << "`";
            }
        }
    }
}

TEST(MatcherTest, ConcatIsSomeSplit) {
    auto fragments = sampleFragments();
    auto words = allWords("ab", 4);
    for (size_t i = 0; i < fragments.size(); ++i) {
        for (size_t j = 0; j < fragments.size(); ++j) {
            FragmentBuild joined = [&](NfaBuilder &b) {
                Fragment left = fragments[i](b);
                Fragment right = fragments[j](b);
                return b.concat(left, right);
            };
            for (auto const &w : words) {
                bool expected = false;
                for (size_t k = 0; k <= w.size() && !expected; ++k) {
                    expected = matchFragment(fragments[i], w.substr(0, k))
                        && matchFragment(fragments[j], w.substr(k));
                }
                EXPECT_EQ(matchFragment(joined, w), expected)
                    << i << " . " << j << " on `" << w << "`";
            }
        }
    }
}

/* True if `w` splits into non empty pieces each matched by `build` */
bool splitsInto(FragmentBuild const &build, std::string const &w) {
    if (w.empty())
        return true;
    for (size_t k = 1; k <= w.size(); ++k) {
        if (matchFragment(build, w.substr(0, k)) && splitsInto(build, w.substr(k)))
            return true;
    }
    return false;
}

TEST(MatcherTest, ClosureIsAnyNumberOfRepetitions) {
    auto fragments = sampleFragments();
    auto words = allWords("ab", 5);
    for (size_t i = 0; i < fragments.size(); ++i) {
        FragmentBuild star = [&](NfaBuilder &b) {
            return b.closure(fragments[i](b));
        };
        for (auto const &w : words) {
            EXPECT_EQ(matchFragment(star, w), splitsInto(fragments[i], w))
                << i << "* on `" << w << "`";
        }
    }
}

TEST(MatcherTest, Alternation) {
    RegexNfa nfa = compileFromInfix("a|b");
    EXPECT_TRUE(matches(nfa, "a"));
    EXPECT_TRUE(matches(nfa, "b"));
    EXPECT_FALSE(matches(nfa, "ab"));
    EXPECT_FALSE(matches(nfa, ""));
}

TEST(MatcherTest, StarThenSymbol) {
    RegexNfa nfa = compileFromInfix("(a|b)*c");
    EXPECT_TRUE(matches(nfa, "c"));
    EXPECT_TRUE(matches(nfa, "ac"));
    EXPECT_TRUE(matches(nfa, "bbac"));
    EXPECT_FALSE(matches(nfa, "d"));
    EXPECT_FALSE(matches(nfa, "ca"));
}

TEST(MatcherTest, EscapedStarIsLiteral) {
    RegexNfa nfa = compileFromInfix("a\\*");
    EXPECT_TRUE(matches(nfa, "a*"));
    EXPECT_FALSE(matches(nfa, "aaaa"));
    EXPECT_FALSE(matches(nfa, "a"));
    EXPECT_FALSE(matches(nfa, ""));
}

TEST(MatcherTest, MatchesTheWholeWord) {
    RegexNfa nfa = compileFromInfix("ab");
    EXPECT_FALSE(matches(nfa, "abab"));
    EXPECT_FALSE(matches(nfa, "xab"));
    EXPECT_TRUE(matches(nfa, "ab"));
}

TEST(MatcherTest, AgreesWithReference) {
    std::vector<std::string> patterns = {
        "a", "ab", "a|b", "a*", "a+", "a?", "(a|b)*c", "(ab)*", "(a*)*", "(a?)+",
        "a(b|c)*a", "((a|b)c?)+", "a*b*c*",
        "(a|ab)(c|bcd)", "\\(a\\)", "(a|b|c)?(a|b|c)", "((a*)+b?)*c",
    };
    auto words = allWords("abc", 6);
    for (auto const &pattern : patterns) {
        RegexNfa nfa = compileFromInfix(pattern);
        for (auto const &w : words) {
            EXPECT_EQ(matches(nfa, w), referenceMatch(pattern, w))
                << "pattern `" << pattern << "` word `" << w << "`";
        }
    }
}

TEST(MatcherTest, ClosureOfStartStateSkipsRelays) {
    RegexNfa nfa = compileFromInfix("a*");
    statelist closure = epsilonClosure(nfa, nfa.start());
    // The symbol state of `a` and the accept state
    ASSERT_EQ(closure.size(), 2u);
    bool sawAccept = false;
    for (stateptr s : closure) {
        EXPECT_FALSE(nfa.state(s).isEpsilonRelay());
        sawAccept |= nfa.state(s).accept;
    }
    EXPECT_TRUE(sawAccept);
}

TEST(MatcherTest, StateWithoutEpsilonIsItsOwnClosure) {
    NfaBuilder builder;
    RegexNfa nfa = builder.finish(builder.fromSymbol('a'));
    EXPECT_EQ(epsilonClosure(nfa, nfa.start()), statelist({nfa.start()}));
    EXPECT_EQ(epsilonClosure(nfa, nfa.end()), statelist({nfa.end()}));
    EXPECT_TRUE(epsilonClosure(nfa, 42).empty());
}

TEST(MatcherTest, ClosureSurvivesEpsilonCycles) {
    // (a*)* builds epsilon loops around epsilon loops
    RegexNfa nfa = compileFromInfix("((a*)*)*");
    statelist closure = epsilonClosure(nfa, nfa.start());
    std::set<stateptr> unique(closure.begin(), closure.end());
    EXPECT_EQ(unique.size(), closure.size());
    EXPECT_TRUE(matches(nfa, ""));
    EXPECT_TRUE(matches(nfa, "aaa"));
}

TEST(MatcherTest, LongEpsilonChainsDontRecurse) {
    // A deep chain of nested groups: the closure walks it iteratively
    std::string pattern = "";
    for (int i = 0; i < 500; ++i) pattern += "(";
    pattern += "a";
    for (int i = 0; i < 500; ++i) pattern += ")?";
    RegexNfa nfa = compileFromInfix(pattern);
    EXPECT_TRUE(matches(nfa, ""));
    EXPECT_TRUE(matches(nfa, "a"));
    EXPECT_FALSE(matches(nfa, "aa"));
}

/* Seconds spent running `f` */
double secondsFor(std::function<void()> const &f) {
    auto start = std::chrono::steady_clock::now();
    f();
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count();
}

TEST(MatcherTest, LongLiteralPattern) {
    const size_t n = 100000;
    std::string pattern(n, 'a');
    double seconds = secondsFor([&]() {
        Matcher m = makeMatcher(pattern);
        EXPECT_TRUE(m(pattern));
        EXPECT_FALSE(m(std::string(n - 1, 'a')));
        EXPECT_FALSE(m(pattern + "a"));
    });
    EXPECT_LT(seconds, 10.0);
}

TEST(MatcherTest, LongAlternation) {
    const size_t n = 100000;
    std::string pattern = "a";
    for (size_t i = 1; i < n; ++i) {
        pattern += '|';
        pattern += static_cast<char>('a' + i % 26);
    }
    double seconds = secondsFor([&]() {
        RegexNfa nfa = compileFromInfix(pattern);
        EXPECT_EQ(nfa.size(), 4 * n - 2);
        EXPECT_TRUE(matches(nfa, "a"));
        EXPECT_TRUE(matches(nfa, "z"));
        EXPECT_FALSE(matches(nfa, ""));
        EXPECT_FALSE(matches(nfa, "ab"));
    });
    EXPECT_LT(seconds, 10.0);
}

TEST(MatcherTest, LongWordAgainstALargeAutomaton) {
    // A 10^5 state prefix followed by a loop, fed a 10^5 char word
    const size_t n = 50000;
    std::string prefix;
    for (size_t i = 0; i < n; ++i) {
        prefix += static_cast<char>('a' + i % 3);
    }
    RegexNfa nfa = compileFromInfix(prefix + "(a|b)*c");
    std::string word = prefix + std::string(n, 'b');
    double seconds = secondsFor([&]() {
        EXPECT_TRUE(matches(nfa, word + "c"));
        EXPECT_FALSE(matches(nfa, word));
        EXPECT_FALSE(matches(nfa, "c" + word));
    });
    EXPECT_LT(seconds, 10.0);
}

TEST(MatcherTest, NoBacktrackingBlowUp) {
    // (a?)^n a^n against a^n takes exponential time with backtracking
    const int n = 200;
    std::string pattern = "";
    for (int i = 0; i < n; ++i) pattern += "a?";
    for (int i = 0; i < n; ++i) pattern += "a";
    RegexNfa nfa = compileFromInfix(pattern);
    EXPECT_TRUE(matches(nfa, std::string(n, 'a')));
    EXPECT_TRUE(matches(nfa, std::string(2 * n, 'a')));
    EXPECT_FALSE(matches(nfa, std::string(2 * n + 1, 'a')));
}

TEST(MatcherTest, MakeMatcherIsReusable) {
    Matcher m = makeMatcher("(a|b)*c");
    EXPECT_TRUE(m("c"));
    EXPECT_TRUE(m("abc"));
    EXPECT_FALSE(m("ab"));
    EXPECT_TRUE(m("bbbbac"));

    Matcher empty = makeMatcher("");
    EXPECT_TRUE(empty(""));
    EXPECT_FALSE(empty("c"));
}

TEST(MatcherTest, MakeMatcherFailsOnBadPattern) {
    EXPECT_THROW(makeMatcher("(a"), UnexpectedEndOfInput);
    EXPECT_THROW(makeMatcher("*a"), SyntaxError);
}

TEST(MatcherTest, RegexCopiesShareTheAutomaton) {
    Regex regex("x+y");
    Regex copy = regex;
    EXPECT_EQ(&regex.nfa(), &copy.nfa());
    EXPECT_EQ(copy.pattern(), "x+y");
    EXPECT_TRUE(copy.match("xxy"));
    EXPECT_FALSE(copy.match("y"));
}

TEST(MatcherTest, ConcurrentMatchingOnOneAutomaton) {
    Regex regex("(ab|a)*b+");
    auto words = allWords("ab", 8);
    std::vector<char> expected;
    for (auto const &w : words) {
        expected.push_back(regex.match(w));
    }

    std::vector<std::thread> threads;
    std::vector<int> mismatches(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int round = 0; round < 20; ++round) {
                for (size_t i = 0; i < words.size(); ++i) {
                    if (regex.match(words[i]) != static_cast<bool>(expected[i]))
                        mismatches[t]++;
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    for (int t = 0; t < 8; ++t) {
        EXPECT_EQ(mismatches[t], 0);
    }
}

}
