#pragma once

#include <string>
#include <exception>
#include <stdexcept>

/* Read when no configuration file is given on the command line */
#define CONFIG_DEFAULT_PATH "thompson.conf"

struct ConfigException : public std::exception {
public:
    ConfigException(std::string path, int line, std::string m);

	const char* what () const throw ();
private:
    std::string m_path;
    int m_line;
    std::string m_message;
    std::string m_buffer;
};

/**
 * Settings of the shell, read from a file with one keyword per line:
 *
 *     # comment
 *     prompt regex>
 *     log debug
 *     pattern (a|b)*c
 *
 * The value of `prompt` and `pattern` is the rest of the line with
 * the surrounding spaces removed.
 */
class Config {
public:
    static void fromFile(std::string path);

    /** Put every setting back to its default value. */
    static void reset();

    static std::string prompt;
    static std::string pattern;
    static bool hasPattern;
};
