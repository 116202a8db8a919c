#include "persistence.hpp"

#include "internal/util/errors.hpp"

namespace pokertable::core {

bool IsConcurrencyCode(pokertable::db::ErrorCode code) {
  switch (code) {
    case pokertable::db::ErrorCode::Busy:
    case pokertable::db::ErrorCode::Conflict:
    case pokertable::db::ErrorCode::SerializationFailure:
      return true;
    default:
      return false;
  }
}

void ThrowIfDbError(const pokertable::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case pokertable::db::ErrorCode::NotFound:
      throw pokertable::util::NotFound(message);
    case pokertable::db::ErrorCode::AlreadyExists:
    case pokertable::db::ErrorCode::Busy:
    case pokertable::db::ErrorCode::Conflict:
    case pokertable::db::ErrorCode::SerializationFailure:
      throw pokertable::util::ConcurrencyError(message);
    default:
      throw pokertable::util::PersistenceError(message);
  }
}

void CommitOrThrow(pokertable::db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const pokertable::db::CommitError& e) {
    const auto message = context + ": " + e.what();
    if (IsConcurrencyCode(e.code())) throw pokertable::util::ConcurrencyError(message);
    throw pokertable::util::PersistenceError(message);
  }
}

} // namespace pokertable::core
