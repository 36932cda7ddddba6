#pragma once
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace code_query {

struct CommandMetadata {
    std::string name;  // without the leading '/'
    std::string usage;
    std::string description;
};

struct CommandResult {
    std::string output;
    bool exit = false;
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual CommandMetadata get_metadata() const = 0;
    virtual CommandResult execute(const std::string& args) = 0;
};

class GenericCommand : public ICommand {
    CommandMetadata meta_;
    std::function<CommandResult(const std::string&)> action_;
public:
    GenericCommand(std::string name, std::string usage, std::string desc,
                   std::function<CommandResult(const std::string&)> action)
        : meta_{std::move(name), std::move(usage), std::move(desc)}, action_(std::move(action)) {}
    CommandMetadata get_metadata() const override { return meta_; }
    CommandResult execute(const std::string& args) override { return action_(args); }
};

// Slash commands of the interactive front end.
class CommandRegistry {
private:
    std::map<std::string, std::unique_ptr<ICommand>> commands_;
    std::vector<std::string> order_;
public:
    static bool is_command(const std::string& line) { return !line.empty() && line[0] == '/'; }

    void register_command(std::unique_ptr<ICommand> cmd) {
        auto meta = cmd->get_metadata();
        spdlog::debug("Command registered: /{}", meta.name);
        if (!commands_.count(meta.name)) order_.push_back(meta.name);
        commands_[meta.name] = std::move(cmd);
    }

    // "/ls src" -> command "ls" with args "src". Command names are case-insensitive.
    CommandResult dispatch(const std::string& line) {
        std::string body = is_command(line) ? line.substr(1) : line;
        size_t split = body.find_first_of(" \t");
        std::string name = body.substr(0, split);
        std::string args = split == std::string::npos ? "" : body.substr(split + 1);
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        auto it = commands_.find(name);
        if (it == commands_.end()) {
            return {"Unknown command. Type '/help' for available commands.\n", false};
        }
        size_t a = args.find_first_not_of(" \t");
        size_t b = args.find_last_not_of(" \t");
        args = a == std::string::npos ? "" : args.substr(a, b - a + 1);
        return it->second->execute(args);
    }

    std::string help_text() const {
        std::string out = "\nAvailable commands:\n";
        for (const auto& name : order_) {
            auto meta = commands_.at(name)->get_metadata();
            std::string usage = "/" + meta.usage;
            if (usage.size() < 18) usage.resize(18, ' ');
            out += "  " + usage + " - " + meta.description + "\n";
        }
        return out;
    }
};

} // namespace code_query
