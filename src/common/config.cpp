#include <common/config.h>
#include <common/common.h>
#include <common/log.h>

#include <iostream>
#include <fstream>
#include <sstream>


ConfigException::ConfigException(std::string path, int line, std::string m):
    m_path(path), m_line(line), m_message(m) {
    if (m_line <= 0) {
        m_buffer = m_message;
    } else {
        m_buffer = m_path + ":" + std::to_string(m_line) + ", " + m_message;
    }
}

const char* ConfigException::what() const throw(){
    return m_buffer.c_str();
}

std::string Config::prompt = "> ";
std::string Config::pattern = "";
bool Config::hasPattern = false;

void Config::reset() {
    Config::prompt = "> ";
    Config::pattern = "";
    Config::hasPattern = false;
    Log::level = LOG_INFO;
}

/* Rest of the line after the keyword, without the surrounding spaces */
static std::string readValue(std::istringstream &iss) {
    std::string rest;
    std::getline(iss, rest);
    return trim(rest);
}

static void parseLine(std::string const &path, std::istringstream &iss, int nline) {
    std::string keyword;

    if (iss >> keyword) {
        if (keyword == "prompt") {
            std::string prompt = readValue(iss);
            if (prompt.empty())
                throw ConfigException(path, nline, "`prompt` keyword expects one string");
            // The prompt is followed by the input, keep them apart
            Config::prompt = prompt + " ";
        } else if (keyword == "log") {
            std::string level = readValue(iss);
            LogLevel parsed;
            if (!Log::parseLevel(level, parsed))
                throw ConfigException(path, nline, "`log` keyword expects one of error, info, debug");
            Log::level = parsed;
        } else if (keyword == "pattern") {
            // An empty pattern is valid: it matches the empty word
            Config::pattern = readValue(iss);
            Config::hasPattern = true;
        } else if (keyword.size() >= 1 && keyword[0] == '#') {
            // do nothing, this is a comment
        } else {
            throw ConfigException(path, nline, "Can't understand keyword `" + keyword + "`");
        }
    }
}

void Config::fromFile(std::string path) {
    std::ifstream file;
    file.open(path);

    if (!file) {
        throw ConfigException(path, 0, "file " + path + " not found");
    }

    std::string line;
    int nline = 0;
    while (std::getline(file, line)) {
        nline++;
        std::istringstream iss(stripCarriageReturn(line));
        parseLine(path, iss, nline);
    }
    Log::debug("Loaded configuration from " + path + ".");
}
