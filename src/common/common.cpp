#include <common/common.h>
#include <errno.h>

std::string formatError(const std::string& message) {
    std::stringstream error;
    error << message << ": " << ::strerror(errno) << ".";
    return error.str();
}

bool isBlank(char c) {
    // <cctype> is only defined for the values of unsigned char
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

size_t skipBlanks(size_t start, std::string const &s) {
    size_t i = start;
    while (i < s.size() && isBlank(s[i]))
        i++;
    return i;
}

size_t skipWord(size_t start, std::string const &s) {
    size_t i = start;
    while (i < s.size() && !isBlank(s[i]))
        i++;
    return i;
}

std::string trim(std::string const &s) {
    size_t start = skipBlanks(0, s);
    size_t end = s.size();
    while (end > start && isBlank(s[end - 1]))
        end--;
    return s.substr(start, end - start);
}

std::tuple<size_t, bool> readArg(size_t start, std::string const &s, std::string &arg) {
    arg.clear();
    if (start >= s.size())
        return std::make_tuple(start, false);

    char quote = s[start];
    if (quote != '\'' && quote != '"') {
        size_t end = skipWord(start, s);
        arg = s.substr(start, end - start);
        return std::make_tuple(end, false);
    }

    size_t i = start + 1;
    while (i < s.size() && s[i] != quote) {
        if (quote == '"' && s[i] == '\\' && i + 1 < s.size()
            && (s[i + 1] == '"' || s[i + 1] == '\\')) {
            i++;
        }
        arg += s[i];
        i++;
    }
    // Step over the closing quote when there is one
    return std::make_tuple(std::min(i + 1, s.size()), true);
}

std::string stripCarriageReturn(std::string const &s) {
    if (!s.empty() && s[s.size() - 1] == '\r')
        return s.substr(0, s.size() - 1);
    return s;
}
