#include <common/command.h>
#include <common/threadpool.h>
#include <common/log.h>

#include <fstream>

#define BatchCommand_N_WORKERS 4
/* Lines handed to a worker at once */
#define BatchCommand_CHUNK_SIZE 256

class BatchCommand : public Command {
public:
    BatchCommand(): Command() {}

    /* Read every line of `path`. Throws if the file can't be opened. */
    std::vector<std::string> readLines(std::string const &path) {
        std::ifstream file(path);
        if (!file)
            throw CommandException(formatError("can't open " + path));
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(stripCarriageReturn(line));
        }
        return lines;
    }

    /*
      [regex] is shared read-only by every worker
      [lines] are the words to match
      [results] receives one flag per line, each worker writing its own chunk

      Split the lines in chunks and match them on the pool.
    */
    void matchAll(const Regex &regex, const std::vector<std::string> &lines,
                  std::vector<char> &results) {
        ThreadPool<unsigned int, BatchCommand_N_WORKERS> pool;
        size_t n_chunks = (lines.size() + BatchCommand_CHUNK_SIZE - 1) / BatchCommand_CHUNK_SIZE;
        for (size_t chunk = 0; chunk < n_chunks; ++chunk) {
            size_t begin = chunk * BatchCommand_CHUNK_SIZE;
            size_t end = std::min(lines.size(), begin + BatchCommand_CHUNK_SIZE);
            pool.schedule(static_cast<unsigned int>(chunk), [&regex, &lines, &results, begin, end]() {
                for (size_t i = begin; i < end; ++i) {
                    results[i] = regex.match(lines[i]);
                }
            });
        }
        pool.join();
    }

    void execute(std::ostream &out, Context &context, const CommandArgs &args) {
        const Regex &regex = context.currentRegex();
        std::vector<std::string> lines = readLines(args[0]);
        std::vector<char> results(lines.size(), 0);

        Log::info("Matching " + std::to_string(lines.size()) + " lines of "
                  + args[0] + " against `" + regex.pattern() + "`.");
        matchAll(regex, lines, results);

        size_t n_matched = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            out << lines[i] << ": " << (results[i] ? "match" : "no match") << "\n";
            n_matched += results[i] ? 1 : 0;
        }
        out << n_matched << "/" << lines.size() << " matched" << std::endl;
    }

    Specification getSpecification() const {
        return {ARG_PATH};
    }

    std::string getDescription() const {
        return "batch <file>: match every line of a file against the current pattern";
    }
};

REGISTER_COMMAND(BatchCommand, "batch");
