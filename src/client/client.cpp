#include <client/cli.h>
#include <common/common.h>
#include <common/command.h>
#include <common/config.h>
#include <common/log.h>

#include <iostream>
#include <fstream>
#include <string>
#include <exception>

using namespace std;

class CliArguments {
public:
    std::string configPath;
    bool configRequired = false;
    std::ifstream inputStream;
    std::ofstream outputStream;

    /** Parse the command-line arguments. */
    CliArguments(int argc, char **argv) {
        int next = 1;
        configPath = CONFIG_DEFAULT_PATH;
        if (argc > next && endsWith(argv[next], ".conf")) {
            configPath = argv[next++];
            configRequired = true;
        }

        int remaining = argc - next;
        if (remaining != 0 && remaining != 2) {
            cout << "Usage: " << argv[0] << " [config-file.conf]";
            cout << " [in-file out-file]" << endl;
            throw std::invalid_argument("Incorrect arguments.");
        }

        if (remaining == 2) {
            inputStream.open(argv[next]);
            if (!inputStream.is_open())
                throw std::invalid_argument("Input file is invalid.");

            outputStream.open(argv[next + 1]);
            if (!outputStream.is_open())
                throw std::invalid_argument("Output file is invalid.");
        }
    }

private:
    static bool endsWith(std::string const &s, std::string const &suffix) {
        return s.size() >= suffix.size()
            && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
};

/** Load the configuration. The default file is optional. */
void loadConfig(const CliArguments &args) {
    if (!args.configRequired && !ifstream(args.configPath)) {
        Log::debug("No " + args.configPath + ", using the default settings.");
        return;
    }
    Config::fromFile(args.configPath);
    Log::info("Loaded configuration " + args.configPath + ".");
}

/** Read commands until the input ends or `exit` is run. */
void run(Cli &cli, Context &context) {
    string line;
    while (cli.readInput(line)) {
        if (!executeLine(stripCarriageReturn(line), context, cli.output()))
            break;
    }
}

/** Start the shell. */
int main(int argc, char **argv) {
    int status = 0;

    try {
        CliArguments args(argc, argv);
        loadConfig(args);

        Context context;
        if (Config::hasPattern) {
            context.regex = std::make_shared<const Regex>(Config::pattern);
            Log::info("Current pattern is `" + Config::pattern + "`.");
        }

        // If an infile and outfile were passed, run in testing mode.
        if (args.inputStream.is_open() && args.outputStream.is_open()) {
            Cli cli(args.inputStream, args.outputStream, Config::prompt, false);
            run(cli, context);
        } else {
            Cli cli(cin, cout, Config::prompt, true);
            run(cli, context);
        }
    } catch (const ConfigException &e) {
        Log::error(string("Config: ") + e.what());
        status = 1;
    } catch (const RegexException &e) {
        Log::error(string("Pattern: ") + e.what());
        status = 1;
    } catch (const exception &e) {
        Log::error(e.what());
        status = 1;
    }

    CommandFactory::destroy();
    return status;
}
