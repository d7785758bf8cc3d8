#pragma once

#include <string>
#include <stdexcept>
#include <exception>
#include <cstddef>

/** Base class of every error raised while parsing or compiling a pattern. */
struct RegexException : public std::runtime_error {
public:
    RegexException(std::string m): std::runtime_error(m) {
    }

	const char * what () const throw () {
    	return std::runtime_error::what();
    }
};

/** The pattern contains a symbol the grammar can't accept at `position`. */
struct SyntaxError : public RegexException {
public:
    SyntaxError(size_t position, std::string m):
        RegexException("[Syntax error] " + m + " at position " + std::to_string(position) + "."),
        m_position(position) {
    }

    size_t position() const {
        return m_position;
    }
private:
    size_t m_position;
};

/** A postfix token stream is malformed (missing or extra operands). */
struct PostfixError : public SyntaxError {
public:
    PostfixError(size_t position, std::string m): SyntaxError(position, m) {
    }
};

/** A grammar rule required one more character but the pattern ended. */
struct UnexpectedEndOfInput : public RegexException {
public:
    UnexpectedEndOfInput(size_t position):
        RegexException("[Syntax error] Unexpected end of input at position "
                       + std::to_string(position) + "."),
        m_position(position) {
    }

    size_t position() const {
        return m_position;
    }
private:
    size_t m_position;
};

/** The tree compiler met a node that is not part of the grammar. */
struct UnrecognizedNode : public RegexException {
public:
    UnrecognizedNode(std::string const &label):
        RegexException("[Nfa] Unrecognized node label `" + label + "`."),
        m_label(label) {
    }

    std::string const &label() const {
        return m_label;
    }
private:
    std::string m_label;
};
