#include "playwarden/common/result.hpp"

namespace playwarden::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::PathViolation:
    return "PathViolation";
  case ErrorKind::SanitizationRejected:
    return "SanitizationRejected";
  case ErrorKind::DuplicateHost:
    return "DuplicateHost";
  case ErrorKind::HostNotFound:
    return "HostNotFound";
  case ErrorKind::BackupFailure:
    return "BackupFailure";
  case ErrorKind::SubprocessTimeout:
    return "SubprocessTimeout";
  case ErrorKind::SubprocessNonZeroExit:
    return "SubprocessNonZeroExit";
  case ErrorKind::ParseError:
    return "ParseError";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::AlreadyExists:
    return "AlreadyExists";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::Io:
    return "Io";
  case ErrorKind::Internal:
    return "Internal";
  }
  return "Internal";
}

} // namespace playwarden::common
