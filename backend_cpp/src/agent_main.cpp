#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

#include "AppConfig.hpp"
#include "agent/AgentService.hpp"
#include "agent/LlmReasoningEngine.hpp"
#include "chat_client.hpp"
#include "cli.hpp"
#include "errors.hpp"
#include "session.hpp"

using grpc::Server;
using grpc::ServerBuilder;

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    code_query::CliArgs args;
    try {
        args = code_query::parse_cli(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\nUsage:\n" << code_query::USAGE;
        return 1;
    }
    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

    // 1. Initialize Core Services
    std::shared_ptr<code_query::CodeSession> session;
    try {
        auto config = code_query::AppConfig::load(args.config_path);
        if (args.max_iterations > 0) config.max_iterations = args.max_iterations;

        auto chat = std::make_shared<code_query::OllamaChatClient>(
            config.ollama_url, std::chrono::seconds(config.request_timeout_seconds));
        auto engine = std::make_shared<code_query::LlmReasoningEngine>(chat, config);
        session = code_query::CodeSession::open(args.codebase_dir, config, engine);
    } catch (const code_query::ConfigError& e) {
        spdlog::error("🚨 Configuration error: {}", e.what());
        return 1;
    } catch (const code_query::IndexBuildError& e) {
        spdlog::error("🚨 {}", e.what());
        return 1;
    }

    // 2. Start gRPC Server
    std::string server_address = "127.0.0.1:" + std::to_string(args.port);
    code_query::AgentServiceImpl service(session);

    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("🚨 Could not bind agent service to {}", server_address);
        return 1;
    }

    spdlog::info("🚀 Agent gRPC Service ignited on {} ({} files indexed)", server_address, session->index().size());
    server->Wait();
    return 0;
}
