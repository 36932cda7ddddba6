#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>

#include "AppConfig.hpp"
#include "agent/LlmReasoningEngine.hpp"
#include "chat_client.hpp"
#include "cli.hpp"
#include "commands/SessionCommands.hpp"
#include "errors.hpp"
#include "session.hpp"
#include "text_util.hpp"

using namespace code_query;

namespace {

void print_outcome(const SearchOutcome& outcome) {
    if (!outcome.ok()) {
        std::cout << "\n" << outcome.answer << "\n\n";
        return;
    }
    if (outcome.analyzed_files.empty()) {
        std::cout << "\n" << outcome.answer << "\n\n";
        return;
    }

    std::string file_list;
    for (const auto& p : outcome.analyzed_files) {
        if (!file_list.empty()) file_list += ", ";
        file_list += p;
    }
    const char* source = outcome.action == QueryAction::UseMemory ? "from memory" : "analyzed";
    std::cout << "\nAnswer (" << source << " " << outcome.analyzed_files.size() << " files: " << file_list << "):\n"
              << outcome.answer << "\n\n";
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliArgs args;
    try {
        args = parse_cli(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\nUsage:\n" << USAGE;
        return 1;
    }
    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    std::unique_ptr<CodeSession> session;
    try {
        AppConfig config = AppConfig::load(args.config_path);
        if (args.max_iterations > 0) config.max_iterations = args.max_iterations;

        auto chat = std::make_shared<OllamaChatClient>(
            config.ollama_url, std::chrono::seconds(config.request_timeout_seconds));
        auto engine = std::make_shared<LlmReasoningEngine>(chat, config);

        spdlog::info("Building file index...");
        session = CodeSession::open(args.codebase_dir, config, engine);
    } catch (const ConfigError& e) {
        spdlog::error("🚨 Configuration error: {}", e.what());
        return 1;
    } catch (const IndexBuildError& e) {
        spdlog::error("🚨 {}", e.what());
        return 1;
    }

    CommandRegistry commands;
    register_session_commands(commands, *session);

    std::cout << "\nCodebase query ready with " << session->index().size()
              << " files. Type '/help' for commands.\n\n";

    ProgressObserver observer;
    if (args.verbose) {
        observer = [](SearchPhase phase, const std::string& detail) {
            std::cout << "  [" << to_string(phase) << "] " << detail << "\n";
        };
    }

    std::string line;
    while (true) {
        std::cout << "Code Query: " << std::flush;
        if (!std::getline(std::cin, line)) break;
        std::string q = trim(line);
        if (q.empty()) continue;

        if (CommandRegistry::is_command(q)) {
            CommandResult result = commands.dispatch(q);
            std::cout << result.output;
            if (result.exit) break;
            continue;
        }

        try {
            print_outcome(session->ask(q, observer));
        } catch (const std::exception& e) {
            spdlog::error("❌ Query failed: {}", e.what());
            std::cout << "\nCould not complete analysis: " << e.what() << "\n\n";
        }
    }
    return 0;
}
