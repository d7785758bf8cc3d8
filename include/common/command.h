#pragma once

#include <vector>
#include <map>
#include <unordered_map>
#include <functional>
#include <iostream>
#include <common/common.h>
#include <common/context.h>

/* Enumeration of possible types for the arguments. */
enum ArgTypes {
    ARG_PATTERN, //< Infix regex.
    ARG_POSTFIX, //< Postfix token string.
    ARG_WORD,    //< Word to match, empty when left out.
    ARG_PATH,    //< Path of a local file.
};

/* Abstract specification of the types of argument a command expects. */
typedef std::vector<ArgTypes> Specification;

/* List of unparsed string arguments. */
typedef std::vector<std::string> CommandArgsString;

/* List of checked arguments. */
typedef std::vector<std::string> CommandArgs;

/**
 * Abstract command class.
 *
 * All actual commands (e.g. `compile` or `match`) inherit from this class,
 * and implement the execute(), getSpecification() and getDescription()
 * methods.
 */
class Command {
public:
    Command() {}
    virtual ~Command(){}

    /**
     * Execute the command.
     *
     * This method is only called if the arguments passed to the command
     * were formatted correctly according to the declared specification.
     *
     * @param out     The stream the result is written to.
     * @param context The context of the current session.
     * @param args    The checked arguments of the command.
     */
    virtual void execute(std::ostream &out, Context &context, const CommandArgs& args) = 0;

    /**
     * Return the type of the arguments that the command expects.
     *
     * For instance, returning {ARG_PATTERN, ARG_WORD} will mean that the
     * command expects a pattern followed by an optional word.
     */
    virtual Specification getSpecification() const = 0;

    /** One line summary shown by `help`. */
    virtual std::string getDescription() const = 0;

    /**
     * Check the arguments against the specification.
     *
     * @return CommandArgs      The arguments, missing words filled in.
     * @throw  CommandException If some of the arguments didn't match the declared types.
     */
    CommandArgs convertAndTypecheckArguments(CommandArgsString const &args) const;
};

/**
 * A utility class to register commands via a macro.
 *
 * The code for this is strongly inspired by Nori, an educational raytracer
 * available at https://github.com/cs440-epfl/nori-base-2019/.
 */
class CommandFactory {
public:
    typedef std::function<Command*()> Constructor;

    /** Add a command constructor to the list of constructors. */
    static void registerCommand(const std::string &name, Constructor c);

    /** Try to create an instance of the command with the given name. */
    static Command* create(const std::string &name) {
        if (!m_constructors || m_constructors->find(name) == m_constructors->end()) {
            throw CommandException("command " + name + " not found.");
        }
        return (*m_constructors)[name]();
    }

    /** Names of the registered commands, in alphabetical order. */
    static std::vector<std::string> names();

    /** Free the list of constructors. */
    static void destroy() {
        if (m_constructors != nullptr) {
            delete m_constructors;
            m_constructors = nullptr;
        }
    }

private:
    static std::unordered_map<std::string, Constructor> *m_constructors;
};

/**
 * Try to parse a raw input line into a command and its arguments.
 *
 * For instance, commandFromInput("match abc") will return a pointer to
 * a MatchCommand as well as the list ["abc"]. Quotes group an argument,
 * so `match ''` passes the empty word.
 *
 * @return A pointer to the command instance, and a list of unparsed
 *         string arguments.
 * @throw  CommandException If the parsing fails because the desired
 *         command is not registered in the factory.
 */
std::tuple<Command*, CommandArgsString> commandFromInput(std::string const& line);

/**
 * Parse and execute one line of input. Errors of the command are written
 * to `out` as `Error: ...` and don't stop the session.
 *
 * @return false once the session asked to stop.
 */
bool executeLine(std::string const &line, Context &context, std::ostream &out);

/// Macro for registering a command constructor into the CommandFactory.
#define REGISTER_COMMAND(cls, name)                               \
    cls *cls ##_create() {                                        \
        return new cls();                                         \
    }                                                             \
    static struct cls ##_{                                        \
        cls ##_() {                                               \
            CommandFactory::registerCommand(name, cls ##_create); \
        }                                                         \
    } cls ##__THOMPSON_;
