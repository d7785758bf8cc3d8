#include <common/command.h>

class MatchCommand : public Command {
public:
    MatchCommand(): Command() {}

    void execute(std::ostream &out, Context &context, const CommandArgs &args) {
        const Regex &regex = context.currentRegex();
        out << (regex.match(args[0]) ? "match" : "no match") << std::endl;
    }

    Specification getSpecification() const {
        return {ARG_WORD};
    }

    std::string getDescription() const {
        return "match [word]: match a word against the current pattern";
    }
};

REGISTER_COMMAND(MatchCommand, "match");
