#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/table_service.hpp"
#include "pokertable/v1.hpp"

namespace pokertable::grpc {

class TableServer final : public pokertable::v1::TableService::Service {
 public:
  explicit TableServer(std::shared_ptr<pokertable::service::TableService> svc);

  ::grpc::Status EnsureTable(::grpc::ServerContext* ctx, const pokertable::v1::EnsureTableRequest* req,
                             pokertable::v1::EnsureTableResponse* resp) override;

  ::grpc::Status StartGame(::grpc::ServerContext* ctx, const pokertable::v1::StartGameRequest* req,
                           pokertable::v1::StartGameResponse* resp) override;

  ::grpc::Status HandleAction(::grpc::ServerContext* ctx, const pokertable::v1::HandleActionRequest* req,
                              pokertable::v1::HandleActionResponse* resp) override;

  ::grpc::Status MarkPlayerReady(::grpc::ServerContext* ctx, const pokertable::v1::MarkPlayerReadyRequest* req,
                                 pokertable::v1::MarkPlayerReadyResponse* resp) override;

  ::grpc::Status CompleteInterHandPhase(::grpc::ServerContext* ctx, const pokertable::v1::CompleteInterHandPhaseRequest* req,
                                        pokertable::v1::CompleteInterHandPhaseResponse* resp) override;

  ::grpc::Status GetState(::grpc::ServerContext* ctx, const pokertable::v1::GetStateRequest* req,
                          pokertable::v1::GetStateResponse* resp) override;

 private:
  std::shared_ptr<pokertable::service::TableService> service_;
};

} // namespace pokertable::grpc
