#include <common/command.h>

class ExitCommand : public Command {
public:
    ExitCommand(): Command() {}

    void execute(std::ostream &, Context &context, const CommandArgs &) {
        context.stopRequested = true;
    }

    Specification getSpecification() const {
        return {};
    }

    std::string getDescription() const {
        return "exit: leave the shell";
    }
};

REGISTER_COMMAND(ExitCommand, "exit");
