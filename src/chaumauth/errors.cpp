#include "chaumauth/errors.hpp"

namespace chaumauth {

[[nodiscard]]
auto to_string(ErrorKind const kind) noexcept -> std::string_view {
  switch (kind) {
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::InvalidProof:
      return "InvalidProof";
    case ErrorKind::Internal:
      return "Internal";
  }
  return "Unknown";
}

[[nodiscard]]
auto grpc_status_name(ErrorKind const kind) noexcept -> std::string_view {
  switch (kind) {
    case ErrorKind::NotFound:
      return "NOT_FOUND";
    case ErrorKind::InvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorKind::InvalidProof:
      return "UNAUTHENTICATED";
    case ErrorKind::Internal:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

[[nodiscard]]
auto grpc_status_code(ErrorKind const kind) noexcept -> int {
  // google.rpc.Code
  switch (kind) {
    case ErrorKind::NotFound:
      return 5;
    case ErrorKind::InvalidArgument:
      return 3;
    case ErrorKind::InvalidProof:
      return 16;
    case ErrorKind::Internal:
      return 13;
  }
  return 2;
}

}  // namespace chaumauth
