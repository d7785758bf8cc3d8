#include <common/command.h>

class TestCommand : public Command {
public:
    TestCommand(): Command() {}

    void execute(std::ostream &out, Context &, const CommandArgs &args) {
        Matcher matcher = makeMatcher(args[0]);
        out << (matcher(args[1]) ? "match" : "no match") << std::endl;
    }

    Specification getSpecification() const {
        return {ARG_PATTERN, ARG_WORD};
    }

    std::string getDescription() const {
        return "test <pattern> [word]: match a word against a pattern, keeping the current one";
    }
};

REGISTER_COMMAND(TestCommand, "test");
