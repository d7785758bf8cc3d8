#include <common/command.h>
#include <common/regexcompiler.h>
#include <common/regexparser.h>

class ToPostfixCommand : public Command {
public:
    ToPostfixCommand(): Command() {}

    void execute(std::ostream &out, Context &, const CommandArgs &args) {
        if (args[0].empty()) {
            out << "''" << std::endl;
            return;
        }
        out << toPostfix(parse(args[0])) << std::endl;
    }

    Specification getSpecification() const {
        return {ARG_PATTERN};
    }

    std::string getDescription() const {
        return "topostfix <pattern>: print the postfix form of a pattern";
    }
};

REGISTER_COMMAND(ToPostfixCommand, "topostfix");
