#include "agent/AgentService.hpp"
#include <spdlog/spdlog.h>

namespace code_query {

grpc::Status AgentServiceImpl::ExecuteQuery(grpc::ServerContext* context,
                                            const UserQuery* request,
                                            grpc::ServerWriter<AgentResponse>* writer) {
    if (request->prompt().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "prompt must not be empty");
    }

    AgentResponse res;
    res.set_phase("STARTUP");
    res.set_payload("Agent Service Connected.");
    writer->Write(res);

    auto observer = [writer](SearchPhase phase, const std::string& detail) {
        AgentResponse event;
        event.set_phase(to_string(phase));
        event.set_payload(detail);
        writer->Write(event);
    };

    SearchOutcome outcome;
    try {
        outcome = session_->ask(request->prompt(), observer);
    } catch (const std::exception& e) {
        spdlog::error("❌ Query failed for {}: {}", context->peer(), e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    spdlog::info("🛰️  Query finished ({}, {} files) for {}", outcome.ok() ? "ok" : "failed",
                 outcome.analyzed_files.size(), context->peer());

    AgentResponse final_res;
    final_res.set_phase("FINAL");
    final_res.set_payload(outcome.answer);
    final_res.set_failed(!outcome.ok());
    for (const auto& p : outcome.analyzed_files) final_res.add_analyzed_files(p);
    writer->Write(final_res);

    return grpc::Status::OK;
}

grpc::Status AgentServiceImpl::ListMemory(grpc::ServerContext*, const Empty*, MemoryListing* reply) {
    for (const auto& p : session_->list_cached()) reply->add_paths(p);
    return grpc::Status::OK;
}

grpc::Status AgentServiceImpl::WipeMemory(grpc::ServerContext*, const Empty*, WipeResult* reply) {
    reply->set_dropped(static_cast<uint32_t>(session_->wipe_cache()));
    return grpc::Status::OK;
}

grpc::Status AgentServiceImpl::ClearHistory(grpc::ServerContext*, const Empty*, Empty*) {
    session_->clear_history();
    return grpc::Status::OK;
}

} // namespace code_query
