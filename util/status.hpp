#ifndef UTIL_STATUS_HPP
#define UTIL_STATUS_HPP

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace util {

// Failure classes shared by every component. The kind travels as a payload
// of absl::Status so callers can switch on it.
enum class ErrorKind {
  kNone,
  kProvisioning,
  kCommandTimeout,
  kCommandFailure,
  kFileMutationConflict,
  kPatchApplyFailure,
  kTestTimeout,
  kModelTransient,
  kModelFatal,
  kInvalidInput,
  kUnknown,
};

absl::Status MakeError(ErrorKind kind, absl::string_view message);

// Returns kNone for an OK status and kUnknown for errors without a kind.
ErrorKind GetErrorKind(const absl::Status& status);

const char* ErrorKindName(ErrorKind kind);

inline absl::Status ProvisioningError(absl::string_view message) {
  return MakeError(ErrorKind::kProvisioning, message);
}
inline absl::Status FileMutationConflict(absl::string_view message) {
  return MakeError(ErrorKind::kFileMutationConflict, message);
}
inline absl::Status InvalidInput(absl::string_view message) {
  return MakeError(ErrorKind::kInvalidInput, message);
}

}  // namespace util

#endif
