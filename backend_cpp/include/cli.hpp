#pragma once
#include <string>

namespace code_query {

struct CliArgs {
    std::string codebase_dir;
    std::string config_path;      // empty = search for config.json
    bool verbose = false;
    int max_iterations = 0;       // 0 = take it from the config
    int port = 50051;             // agent service only
};

extern const char* USAGE;

// Throws std::invalid_argument on unknown flags or missing values.
CliArgs parse_cli(int argc, char** argv);

} // namespace code_query
