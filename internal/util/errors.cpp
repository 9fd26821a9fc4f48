#include "internal/util/errors.hpp"

namespace relay::util {

void ThrowIfDbError(const relay::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  std::string message = context + ": " + relay::db::ToString(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  throw StorageError(message, result.code);
}

} // namespace relay::util
