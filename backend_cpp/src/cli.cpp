#include "cli.hpp"
#include <stdexcept>

namespace code_query {

const char* USAGE =
"code_query <codebase_dir> [--config FILE] [--verbose] [--max-iterations N]\n"
"code_query_agent <codebase_dir> [--config FILE] [--verbose] [--max-iterations N] [--port P]\n";

namespace {

int to_int(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + v);
    }
}

} // namespace

CliArgs parse_cli(int argc, char** argv) {
    CliArgs a;
    int i = 1;
    while (i < argc) {
        std::string f = argv[i++];
        auto next = [&]() -> std::string {
            if (i >= argc) throw std::invalid_argument("Missing value after " + f);
            return argv[i++];
        };
        if (f == "--config") a.config_path = next();
        else if (f == "--verbose" || f == "-v") a.verbose = true;
        else if (f == "--max-iterations") {
            a.max_iterations = to_int(f, next());
            if (a.max_iterations < 1) throw std::invalid_argument("--max-iterations must be at least 1");
        }
        else if (f == "--port") a.port = to_int(f, next());
        else if (!f.empty() && f[0] == '-') throw std::invalid_argument("Unknown flag: " + f);
        else if (a.codebase_dir.empty()) a.codebase_dir = f;
        else throw std::invalid_argument("Unexpected argument: " + f);
    }
    if (a.codebase_dir.empty()) throw std::invalid_argument("No codebase directory given");
    return a;
}

} // namespace code_query
