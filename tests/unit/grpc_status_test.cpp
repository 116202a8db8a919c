#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/table_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/table_service.hpp"
#include "internal/util/errors.hpp"
#include "pokertable/v1.hpp"
#include "test_support.hpp"

namespace {

struct Fixture {
  Fixture() {
    repository = std::make_shared<pokertable::db::memory::MemoryRepository>();
    pokertable::service::ServiceContext ctx;
    ctx.manager    = pokertable::testing::MakeManager(repository, std::make_shared<pokertable::engine::HoldemEngineFactory>());
    ctx.repository = repository;
    server         = std::make_unique<pokertable::grpc::TableServer>(std::make_shared<pokertable::service::TableService>(ctx));
    table_id       = pokertable::testing::SeedTable(*repository, {{1, 1000}, {2, 1000}});
  }

  std::shared_ptr<pokertable::db::memory::MemoryRepository> repository;
  std::unique_ptr<pokertable::grpc::TableServer>            server;
  int64_t                                                   table_id = 0;
};

void TestUnknownTableReturnsNotFound() {
  Fixture f;

  pokertable::v1::GetStateRequest req;
  req.set_table_id(f.table_id + 100);
  pokertable::v1::GetStateResponse resp;
  ::grpc::ServerContext            grpc_ctx;

  const auto status = f.server->GetState(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMalformedRequestsReturnInvalidArgument() {
  Fixture f;

  {
    pokertable::v1::EnsureTableRequest  req;
    pokertable::v1::EnsureTableResponse resp;
    ::grpc::ServerContext               grpc_ctx;
    assert(f.server->EnsureTable(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    pokertable::v1::HandleActionRequest req;
    req.set_table_id(f.table_id);
    req.set_user_id(1);
    pokertable::v1::HandleActionResponse resp;
    ::grpc::ServerContext                grpc_ctx;
    assert(f.server->HandleAction(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

void TestOutOfPhaseReturnsFailedPrecondition() {
  Fixture f;

  pokertable::v1::CompleteInterHandPhaseRequest req;
  req.set_table_id(f.table_id);
  req.set_force(true);
  pokertable::v1::CompleteInterHandPhaseResponse resp;
  ::grpc::ServerContext                          grpc_ctx;

  const auto status = f.server->CompleteInterHandPhase(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestStartGameAndOutOfTurnAction() {
  Fixture f;

  pokertable::v1::StartGameRequest start;
  start.set_table_id(f.table_id);
  pokertable::v1::StartGameResponse started;
  ::grpc::ServerContext             start_ctx;
  assert(f.server->StartGame(&start_ctx, &start, &started).ok());
  assert(started.state().hand_no() == 1);
  assert(started.state().current_actor() == 1);

  pokertable::v1::HandleActionRequest req;
  req.set_table_id(f.table_id);
  req.set_user_id(2);
  req.set_action(pokertable::v1::ACTION_TYPE_CALL);
  pokertable::v1::HandleActionResponse resp;
  ::grpc::ServerContext                grpc_ctx;
  assert(f.server->HandleAction(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_user_id(1);
  ::grpc::ServerContext ok_ctx;
  assert(f.server->HandleAction(&ok_ctx, &req, &resp).ok());
  assert(resp.state().current_actor() == 2);
  assert(!resp.has_hand_ended());
}

void TestErrorMapping() {
  using pokertable::grpc::ToStatus;
  assert(ToStatus(pokertable::util::ConcurrencyError("hand version changed")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(pokertable::util::PersistenceError("disk full")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(pokertable::util::RestorationError("bad snapshot")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(pokertable::util::IllegalActionError("raise too small")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(pokertable::util::NoActiveHand()).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestUnknownTableReturnsNotFound();
  TestMalformedRequestsReturnInvalidArgument();
  TestOutOfPhaseReturnsFailedPrecondition();
  TestStartGameAndOutOfTurnAction();
  TestErrorMapping();

  std::cout << "grpc_status_test: pass\n";
  return 0;
}
