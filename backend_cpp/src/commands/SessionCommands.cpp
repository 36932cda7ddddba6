#include "commands/SessionCommands.hpp"
#include "LogManager.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <sstream>

namespace code_query {

namespace {

constexpr size_t kListLimit = 50;
constexpr size_t kSearchLimit = 20;

std::string format_path_listing(const std::vector<std::string>& paths, size_t limit) {
    std::string out;
    for (size_t i = 0; i < paths.size() && i < limit; ++i) out += "  " + paths[i] + "\n";
    if (paths.size() > limit) {
        out += "  ... and " + std::to_string(paths.size() - limit) + " more files\n";
    }
    return out;
}

CommandResult cmd_ls(CodeSession& session, const std::string& args) {
    std::string prefix = args;
    while (!prefix.empty() && (prefix[0] == '/' || prefix.rfind("./", 0) == 0)) {
        prefix = prefix.substr(prefix[0] == '/' ? 1 : 2);
    }
    if (!prefix.empty() && prefix.back() != '/') prefix += '/';

    std::vector<std::string> paths;
    for (const auto& rec : session.index().list_directory(prefix)) paths.push_back(rec.path);
    if (paths.empty()) return {"No files found in '" + args + "'\n"};
    return {"\nFiles in '" + (args.empty() ? std::string("/") : args) + "':\n" + format_path_listing(paths, kListLimit)};
}

CommandResult cmd_read(CodeSession& session, const std::string& args) {
    if (args.empty()) return {"Usage: /read <filename>\n"};
    try {
        std::string content = session.reader().read_full(args);
        return {"\n--- " + args + " ---\n" + content + "\n--- End of " + args + " ---\n"};
    } catch (const FileReadError& e) {
        return {std::string("Error reading file: ") + e.what() + "\n"};
    }
}

CommandResult cmd_search(CodeSession& session, const std::string& args) {
    if (args.empty()) return {"Usage: /search <term>\n"};
    std::string term = to_lower(args);

    std::vector<std::string> matches;
    for (const auto& rec : session.index().records()) {
        try {
            if (to_lower(session.reader().read_full(rec.path)).find(term) != std::string::npos) {
                matches.push_back(rec.path);
            }
        } catch (const FileReadError& e) {
            spdlog::debug("Failed to search {}: {}", rec.path, e.what());
        }
    }
    if (matches.empty()) return {"No files found containing '" + args + "'\n"};
    return {"\nFound '" + args + "' in " + std::to_string(matches.size()) + " files:\n" +
            format_path_listing(matches, kSearchLimit)};
}

CommandResult cmd_memory(CodeSession& session) {
    auto cached = session.list_cached();
    if (cached.empty()) return {"\nNo files in memory cache.\n"};
    return {"\nCached files (" + std::to_string(cached.size()) + "):\n" + format_path_listing(cached, cached.size())};
}

CommandResult cmd_history(CodeSession& session) {
    auto entries = session.history();
    if (entries.empty()) return {"\nConversation history is empty.\n"};
    std::stringstream ss;
    ss << "\n";
    for (const auto& h : entries) {
        ss << "[" << h.index << "] Q: " << h.query << "\n    A: " << h.answer << "\n";
    }
    return {ss.str()};
}

CommandResult cmd_trace() {
    auto logs = LogManager::instance().recent(10);
    if (logs.empty()) return {"\nNo reasoning calls recorded yet.\n"};
    std::stringstream ss;
    ss << "\nRecent reasoning calls:\n";
    for (const auto& log : logs) {
        ss << "  " << log.call << " [" << log.model << "] " << static_cast<long long>(log.duration_ms)
           << " ms, ~" << log.token_count_est << " tokens" << (log.ok ? "" : " FAILED") << "\n";
    }
    return {ss.str()};
}

} // namespace

void register_session_commands(CommandRegistry& registry, CodeSession& session) {
    auto add = [&registry](std::string name, std::string usage, std::string desc,
                           std::function<CommandResult(const std::string&)> action) {
        registry.register_command(std::make_unique<GenericCommand>(
            std::move(name), std::move(usage), std::move(desc), std::move(action)));
    };

    add("ls", "ls [path]", "List files (optionally in a specific path)",
        [&session](const std::string& args) { return cmd_ls(session, args); });
    add("read", "read <file>", "Read a specific file",
        [&session](const std::string& args) { return cmd_read(session, args); });
    add("search", "search <term>", "Search for files containing term",
        [&session](const std::string& args) { return cmd_search(session, args); });
    add("tree", "tree", "Show directory tree",
        [&session](const std::string&) { return CommandResult{"\n" + session.index().render_tree()}; });
    add("memory", "memory", "Show cached files in memory",
        [&session](const std::string&) { return cmd_memory(session); });
    add("clear", "clear", "Clear file memory cache",
        [&session](const std::string&) {
            size_t n = session.wipe_cache();
            return CommandResult{"Memory cache cleared (" + std::to_string(n) + " files).\n"};
        });
    add("forget", "forget", "Clear conversation history",
        [&session](const std::string&) {
            session.clear_history();
            return CommandResult{"Conversation history cleared.\n"};
        });
    add("history", "history", "Show conversation history",
        [&session](const std::string&) { return cmd_history(session); });
    add("trace", "trace", "Show recent reasoning engine calls",
        [](const std::string&) { return cmd_trace(); });
    add("help", "help", "Show this help",
        [&registry](const std::string&) { return CommandResult{registry.help_text()}; });
    auto quit = [](const std::string&) { return CommandResult{"Exiting codebase query mode.\n", true}; };
    add("exit", "exit", "Exit codebase query mode", quit);
    add("quit", "quit", "Exit codebase query mode", quit);
}

} // namespace code_query
