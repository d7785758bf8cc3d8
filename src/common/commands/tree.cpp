#include <common/command.h>
#include <common/regexparser.h>

class TreeCommand : public Command {
public:
    TreeCommand(): Command() {}

    void execute(std::ostream &out, Context &, const CommandArgs &args) {
        if (args[0].empty())
            throw CommandException("the empty pattern has no parse tree.");
        dump(out, parse(args[0]));
    }

    Specification getSpecification() const {
        return {ARG_PATTERN};
    }

    std::string getDescription() const {
        return "tree <pattern>: print the parse tree of a pattern";
    }
};

REGISTER_COMMAND(TreeCommand, "tree");
