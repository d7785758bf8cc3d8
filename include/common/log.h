#pragma once

#include <iostream>
#include <mutex>
#include <string>

/* Verbosity of the console log. A message is printed when its level
   is lower than or equal to Log::level. */
enum LogLevel {
    LOG_ERROR = 0,
    LOG_INFO = 1,
    LOG_DEBUG = 2,
};

/**
 * Console log shared by the library and the shell.
 *
 * Lines look like `[INFO] Compiled pattern.` and go to std::cout unless
 * `stream` is redirected. Safe to call from several threads.
 */
class Log {
public:
    static LogLevel level;
    static std::ostream *stream;

    static void error(std::string const &message) {
        write(LOG_ERROR, "[ERROR] ", message);
    }

    static void info(std::string const &message) {
        write(LOG_INFO, "[INFO] ", message);
    }

    static void debug(std::string const &message) {
        write(LOG_DEBUG, "[DEBUG] ", message);
    }

    /** Parse `error`, `info` or `debug`. Returns false on anything else. */
    static bool parseLevel(std::string const &name, LogLevel &out);

private:
    static std::mutex m_mutex;

    static void write(LogLevel l, const char *prefix, std::string const &message);
};
