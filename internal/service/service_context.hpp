#pragma once

#include <memory>

namespace pokertable::core {
class RuntimeManager;
}
namespace pokertable::db {
class Repository;
}

namespace pokertable::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<pokertable::core::RuntimeManager> manager;
  std::shared_ptr<pokertable::db::Repository>       repository;
};

} // namespace pokertable::service
