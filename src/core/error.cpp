#include "embdb/error.hpp"

namespace embdb::core {

auto to_string(error_code code) -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::already_exists: return "already_exists";
    case error_code::collection_not_found: return "collection_not_found";
    case error_code::create_collection_conflict: return "create_collection_conflict";
    case error_code::delete_blue_forbidden: return "delete_blue_forbidden";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::unavailable: return "unavailable";
    case error_code::lock_not_available: return "lock_not_available";
    case error_code::lock_acquisition_failed: return "lock_acquisition_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

} // namespace embdb::core
