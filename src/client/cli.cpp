#include <client/cli.h>

bool Cli::readInput(std::string &input) {
    if (m_interactive) {
        m_out << m_start_input << std::flush;
    }
    return static_cast<bool>(std::getline(m_in, input));
}
