#include <common/command.h>

class ShowCommand : public Command {
public:
    ShowCommand(): Command() {}

    void execute(std::ostream &out, Context &context, const CommandArgs &) {
        const Regex &regex = context.currentRegex();
        out << "`" << regex.pattern() << "`: " << regex.nfa().size() << " states, "
            << regex.nfa().countTransitions() << " transitions" << std::endl;
    }

    Specification getSpecification() const {
        return {};
    }

    std::string getDescription() const {
        return "show: print the current pattern";
    }
};

REGISTER_COMMAND(ShowCommand, "show");
