#include <common/command.h>

class HelpCommand : public Command {
public:
    HelpCommand(): Command() {}

    void execute(std::ostream &out, Context &, const CommandArgs &) {
        for (std::string const &name : CommandFactory::names()) {
            Command *command = CommandFactory::create(name);
            out << "  " << command->getDescription() << "\n";
            delete command;
        }
        out << std::flush;
    }

    Specification getSpecification() const {
        return {};
    }

    std::string getDescription() const {
        return "help: list the commands";
    }
};

REGISTER_COMMAND(HelpCommand, "help");
