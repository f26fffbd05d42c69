#include "VaultError.hpp"

namespace vault {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:             return "none";
    case ErrorKind::Validation:       return "validation";
    case ErrorKind::InvalidSelection: return "invalid_selection";
    case ErrorKind::InvalidId:        return "invalid_id";
    case ErrorKind::NotFound:         return "not_found";
    case ErrorKind::IoFailure:        return "io_failure";
    case ErrorKind::StoreFailure:     return "store_failure";
  }
  return "unknown";
}

} // namespace vault
