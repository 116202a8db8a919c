#include "table_service.hpp"

#include <optional>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "internal/core/runtime_manager.hpp"
#include "internal/util/errors.hpp"

namespace pokertable::service {

namespace {

void RequireTableId(int64_t table_id) {
  if (table_id <= 0) throw util::ValidationError(fmt::format("invalid table_id {}", table_id));
}

void RequireUserId(int64_t user_id) {
  if (user_id <= 0) throw util::ValidationError(fmt::format("invalid user_id {}", user_id));
}

} // namespace

TableService::TableService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager) throw std::invalid_argument("TableService: manager is required");
}

pokertable::v1::EnsureTableResponse TableService::EnsureTable(const pokertable::v1::EnsureTableRequest& req) {
  RequireTableId(req.table_id());

  pokertable::v1::EnsureTableResponse resp;
  *resp.mutable_state() = ctx_.manager->EnsureTable(req.table_id());
  return resp;
}

pokertable::v1::StartGameResponse TableService::StartGame(const pokertable::v1::StartGameRequest& req) {
  RequireTableId(req.table_id());

  pokertable::v1::StartGameResponse resp;
  *resp.mutable_state() = ctx_.manager->StartGame(req.table_id());
  return resp;
}

pokertable::v1::HandleActionResponse TableService::HandleAction(const pokertable::v1::HandleActionRequest& req) {
  RequireTableId(req.table_id());
  RequireUserId(req.user_id());
  if (req.action() == pokertable::v1::ACTION_TYPE_UNSPECIFIED) throw util::ValidationError("action is required");

  std::optional<int64_t> amount;
  if (req.has_amount()) amount = req.amount();

  auto result = ctx_.manager->HandleAction(req.table_id(), req.user_id(), req.action(), amount);

  pokertable::v1::HandleActionResponse resp;
  *resp.mutable_state() = std::move(result.state);
  if (result.hand_ended) *resp.mutable_hand_ended() = std::move(*result.hand_ended);
  return resp;
}

pokertable::v1::MarkPlayerReadyResponse TableService::MarkPlayerReady(const pokertable::v1::MarkPlayerReadyRequest& req) {
  RequireTableId(req.table_id());
  RequireUserId(req.user_id());

  pokertable::v1::MarkPlayerReadyResponse resp;
  *resp.mutable_state() = ctx_.manager->MarkPlayerReady(req.table_id(), req.user_id());
  return resp;
}

pokertable::v1::CompleteInterHandPhaseResponse
TableService::CompleteInterHandPhase(const pokertable::v1::CompleteInterHandPhaseRequest& req) {
  RequireTableId(req.table_id());

  auto result = ctx_.manager->CompleteInterHandPhase(req.table_id(), req.force());

  pokertable::v1::CompleteInterHandPhaseResponse resp;
  resp.set_table_ended(result.table_ended);
  resp.set_end_reason(result.end_reason);
  *resp.mutable_state() = std::move(result.state);
  return resp;
}

pokertable::v1::GetStateResponse TableService::GetState(const pokertable::v1::GetStateRequest& req) {
  RequireTableId(req.table_id());

  std::optional<int64_t> viewer;
  if (req.has_viewer_user_id()) viewer = req.viewer_user_id();

  pokertable::v1::GetStateResponse resp;
  *resp.mutable_state() = ctx_.manager->GetState(req.table_id(), viewer);
  return resp;
}

} // namespace pokertable::service
