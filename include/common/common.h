#pragma once

#include <stdexcept>
#include <cctype>
#include <vector>
#include <algorithm>
#include <cstring>
#include <cstdint>
#include <string>
#include <tuple>
#include <iostream>
#include <sstream>
#include <memory>

/** Exception used when parsing or running shell commands. */
struct CommandException : public std::runtime_error {
    CommandException(std::string m): std::runtime_error(m) {}
};

/** Return `message` followed by the description of the current errno. */
std::string formatError(const std::string& message);

/** Whether `c` separates arguments. Any byte is accepted, UTF-8 included. */
bool isBlank(char c);

/** Index of the first non blank char of `s` at or after `start`. */
size_t skipBlanks(size_t start, std::string const &s);

/** Index of the first blank char of `s` at or after `start`. */
size_t skipWord(size_t start, std::string const &s);

/** `s` without its leading and trailing blanks. */
std::string trim(std::string const &s);

/**
 * Read one shell argument of `s` starting at `start` into `arg`.
 *
 * - 'single quotes' keep their content as is.
 * - "double quotes" turn `\"` into `"` and `\\` into `\`. Other
 *   backslashes are kept, so patterns like "a\*" can be quoted.
 * - Anything else runs up to the next blank, untouched.
 *
 * An unterminated quote runs to the end of `s`.
 *
 * @return The index right after the argument, and whether it was quoted.
 */
std::tuple<size_t, bool> readArg(size_t start, std::string const &s, std::string &arg);

/** Remove a trailing '\r' left by files written on another platform. */
std::string stripCarriageReturn(std::string const &s);
