#include <common/command.h>
#include <common/regexcommon.h>
#include <common/log.h>

// Initialization of static variables.
std::unordered_map<std::string, CommandFactory::Constructor> *CommandFactory::m_constructors = nullptr;

const Regex &Context::currentRegex() const {
    if (!regex)
        throw CommandException("no pattern compiled, use `compile` first.");
    return *regex;
}

/** Try to parse the arguments according to the specification. */
CommandArgs Command::convertAndTypecheckArguments(CommandArgsString const& args) const {
    Specification const &expected = getSpecification();
    if (args.size() > expected.size())
        throw CommandException("number of arguments doesn't match.");
    CommandArgs converted;
    for (uint64_t i = 0; i < expected.size(); ++i) {
        if (i >= args.size()) {
            // Only a word can be left out: it stands for the empty word
            if (expected[i] != ARG_WORD)
                throw CommandException("number of arguments doesn't match.");
            converted.push_back("");
            continue;
        }
        switch (expected[i]) {
            case ARG_PATH: // Local file.
                // A path can't contain any null bytes (this is specified by posix!)
                if (args[i].empty() || args[i].find((char)0) != std::string::npos)
                    throw CommandException("incorrect path.");
                converted.push_back(args[i]);
                break;

            case ARG_PATTERN: // Checked by the parser.
            case ARG_POSTFIX:
            case ARG_WORD:
                converted.push_back(args[i]);
                break;

            default:
                throw CommandException("unhandled argument type.");
        }
    }
    return converted;
}

/** Add a command constructor to the list of constructors. */
void CommandFactory::registerCommand(const std::string &name, Constructor c) {
    if (!m_constructors)
        m_constructors = new std::unordered_map<std::string, CommandFactory::Constructor>();
    (*m_constructors)[name] = c;
}

std::vector<std::string> CommandFactory::names() {
    std::vector<std::string> out;
    if (m_constructors) {
        for (auto const &it : *m_constructors) {
            out.push_back(it.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

/** Try to parse a raw input line into a command and its arguments. */
std::tuple<Command*, CommandArgsString> commandFromInput(std::string const& input) {
    size_t start = skipBlanks(0, input);
    size_t stop_command_name = skipWord(start, input);
    std::string command_name = input.substr(start, stop_command_name - start);
    Command* command = CommandFactory::create(command_name);
    CommandArgsString command_args;
    start = skipBlanks(stop_command_name, input);
    while (start < input.size()) {
        std::string arg;
        bool quoted;
        std::tie(start, quoted) = readArg(start, input, arg);
        // A quoted argument may be empty
        if (!arg.empty() || quoted)
            command_args.push_back(arg);
        start = skipBlanks(start, input);
    }
    return std::make_tuple(command, command_args);
}

bool executeLine(std::string const &line, Context &context, std::ostream &out) {
    if (skipBlanks(0, line) >= line.size())
        return !context.stopRequested;

    Command *command = nullptr;
    CommandArgsString argsString;
    try {
        std::tie(command, argsString) = commandFromInput(line);
        CommandArgs args = command->convertAndTypecheckArguments(argsString);
        command->execute(out, context, args);
    } catch (const CommandException &e) {
        // CommandExceptions are shown to the user.
        out << "Error: " << e.what() << std::endl;
    } catch (const RegexException &e) {
        out << "Error: " << e.what() << std::endl;
        Log::debug("Rejected line `" + line + "`.");
    }

    delete command;
    return !context.stopRequested;
}
