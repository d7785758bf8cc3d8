#include <common/command.h>

class CompileCommand : public Command {
public:
    CompileCommand(): Command() {}

    void execute(std::ostream &out, Context &context, const CommandArgs &args) {
        std::string pattern = args[0];
        // Replace the current pattern only once the new one compiled
        std::shared_ptr<const Regex> regex = std::make_shared<const Regex>(pattern);
        context.regex = regex;
        out << "compiled `" << pattern << "`: " << regex->nfa().size() << " states" << std::endl;
    }

    Specification getSpecification() const {
        return {ARG_PATTERN};
    }

    std::string getDescription() const {
        return "compile <pattern>: compile an infix pattern and make it current";
    }
};

REGISTER_COMMAND(CompileCommand, "compile");
