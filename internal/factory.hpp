#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/core/runtime_manager.hpp"
#include "internal/core/table_runtime.hpp"
#include "internal/db/api/repository.hpp"

namespace pokertable::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<core::RuntimeManager>        manager;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Zero-valued game fields keep the GameSettings defaults.
core::GameSettings BuildGameSettings(const pokertable::runtime::config::GameConfig& game);

// Opens and bootstraps the configured backend. Memory when none is set.
std::shared_ptr<db::Repository> BuildRepository(const pokertable::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. It is the ONLY place allowed to know concrete DB,
  engine, wallet and lifecycle types.
*/
Application Build(const pokertable::runtime::config::RuntimeConfig& config);

} // namespace pokertable::factory
