#include "table_server.hpp"

#include "grpc_error.hpp"

namespace pokertable::grpc {

TableServer::TableServer(std::shared_ptr<pokertable::service::TableService> svc) : service_(std::move(svc)) {
}

::grpc::Status TableServer::EnsureTable(::grpc::ServerContext*, const pokertable::v1::EnsureTableRequest* req,
                                        pokertable::v1::EnsureTableResponse* resp) {
  try {
    *resp = service_->EnsureTable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TableServer::StartGame(::grpc::ServerContext*, const pokertable::v1::StartGameRequest* req,
                                      pokertable::v1::StartGameResponse* resp) {
  try {
    *resp = service_->StartGame(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TableServer::HandleAction(::grpc::ServerContext*, const pokertable::v1::HandleActionRequest* req,
                                         pokertable::v1::HandleActionResponse* resp) {
  try {
    *resp = service_->HandleAction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TableServer::MarkPlayerReady(::grpc::ServerContext*, const pokertable::v1::MarkPlayerReadyRequest* req,
                                            pokertable::v1::MarkPlayerReadyResponse* resp) {
  try {
    *resp = service_->MarkPlayerReady(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TableServer::CompleteInterHandPhase(::grpc::ServerContext*, const pokertable::v1::CompleteInterHandPhaseRequest* req,
                                                   pokertable::v1::CompleteInterHandPhaseResponse* resp) {
  try {
    *resp = service_->CompleteInterHandPhase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TableServer::GetState(::grpc::ServerContext*, const pokertable::v1::GetStateRequest* req,
                                     pokertable::v1::GetStateResponse* resp) {
  try {
    *resp = service_->GetState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace pokertable::grpc
