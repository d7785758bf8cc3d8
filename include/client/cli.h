#pragma once

#include <string>
#include <iostream>

/** Line oriented console: prompts and reads a line. */
class Cli {
public:
    /* The prompt is only printed when `interactive` is set, so that
       replaying a file gives a clean output */
    Cli(std::istream &in, std::ostream &out, std::string const &start_input = "> ",
        bool interactive = true) :
        m_in(in), m_out(out), m_start_input(start_input), m_interactive(interactive) {
    }

    /* Return false at the end of the input */
    bool readInput(std::string &input);

    std::ostream &output() {
        return m_out;
    }

private:
    std::istream &m_in;
    std::ostream &m_out;
    std::string m_start_input;
    bool m_interactive;
};
