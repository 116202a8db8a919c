#pragma once

#include "pokertable/v1.hpp"
#include "service_context.hpp"

namespace pokertable::service {

/*
  Request/response adapter over core::RuntimeManager.

  Validates request shape only; game rules stay in the core.
*/
class TableService {
 public:
  explicit TableService(ServiceContext ctx);

  pokertable::v1::EnsureTableResponse EnsureTable(const pokertable::v1::EnsureTableRequest& req);

  pokertable::v1::StartGameResponse StartGame(const pokertable::v1::StartGameRequest& req);

  pokertable::v1::HandleActionResponse HandleAction(const pokertable::v1::HandleActionRequest& req);

  pokertable::v1::MarkPlayerReadyResponse MarkPlayerReady(const pokertable::v1::MarkPlayerReadyRequest& req);

  pokertable::v1::CompleteInterHandPhaseResponse CompleteInterHandPhase(const pokertable::v1::CompleteInterHandPhaseRequest& req);

  pokertable::v1::GetStateResponse GetState(const pokertable::v1::GetStateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace pokertable::service
