#include <common/log.h>

LogLevel Log::level = LOG_INFO;
std::ostream *Log::stream = &std::cout;
std::mutex Log::m_mutex;

bool Log::parseLevel(std::string const &name, LogLevel &out) {
    if (name == "error") {
        out = LOG_ERROR;
    } else if (name == "info") {
        out = LOG_INFO;
    } else if (name == "debug") {
        out = LOG_DEBUG;
    } else {
        return false;
    }
    return true;
}

void Log::write(LogLevel l, const char *prefix, std::string const &message) {
    if (l > level)
        return;
    std::unique_lock<std::mutex> lock(m_mutex);
    *stream << prefix << message << std::endl;
}
