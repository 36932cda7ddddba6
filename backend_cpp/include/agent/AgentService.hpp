#pragma once
#include <memory>
#include "agent.grpc.pb.h"
#include "session.hpp"

namespace code_query {

class AgentServiceImpl final : public AgentService::Service {
    std::shared_ptr<CodeSession> session_;

public:
    explicit AgentServiceImpl(std::shared_ptr<CodeSession> session) : session_(std::move(session)) {}

    grpc::Status ExecuteQuery(grpc::ServerContext* context,
                              const UserQuery* request,
                              grpc::ServerWriter<AgentResponse>* writer) override;

    grpc::Status ListMemory(grpc::ServerContext* context, const Empty* request, MemoryListing* reply) override;
    grpc::Status WipeMemory(grpc::ServerContext* context, const Empty* request, WipeResult* reply) override;
    grpc::Status ClearHistory(grpc::ServerContext* context, const Empty* request, Empty* reply) override;
};

} // namespace code_query
