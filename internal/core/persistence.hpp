#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"

namespace pokertable::core {

// Throws the util error matching a failed repository result.
void ThrowIfDbError(const pokertable::db::Result& result, const std::string& context);

// Commits and translates a refused commit into util::ConcurrencyError / util::PersistenceError.
void CommitOrThrow(pokertable::db::Transaction& tx, const std::string& context);

bool IsConcurrencyCode(pokertable::db::ErrorCode code);

} // namespace pokertable::core
