#include <common/command.h>
#include <common/regexcompiler.h>

class PostfixCommand : public Command {
public:
    PostfixCommand(): Command() {}

    void execute(std::ostream &out, Context &context, const CommandArgs &args) {
        std::string tokens = args[0];
        // The current pattern is kept in infix form, so the token string
        // is turned into its infix equivalent first
        std::string infix = tokens.empty() ? "" : toString(postfixToTree(tokens));
        std::shared_ptr<const Regex> regex = std::make_shared<const Regex>(infix);
        context.regex = regex;
        out << "compiled `" << tokens << "` as `" << infix << "`: "
            << regex->nfa().size() << " states" << std::endl;
    }

    Specification getSpecification() const {
        return {ARG_POSTFIX};
    }

    std::string getDescription() const {
        return "postfix <tokens>: compile a postfix pattern ('.' concatenates) and make it current";
    }
};

REGISTER_COMMAND(PostfixCommand, "postfix");
