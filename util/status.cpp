#include "util/status.hpp"

#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace util {

namespace {
const constexpr char* kErrorKindUrl = "type.fixbench/util.ErrorKind";

const ErrorKind kAllKinds[] = {
    ErrorKind::kProvisioning,      ErrorKind::kCommandTimeout,
    ErrorKind::kCommandFailure,    ErrorKind::kFileMutationConflict,
    ErrorKind::kPatchApplyFailure, ErrorKind::kTestTimeout,
    ErrorKind::kModelTransient,    ErrorKind::kModelFatal,
    ErrorKind::kInvalidInput,
};

absl::StatusCode CodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kProvisioning:
    case ErrorKind::kModelTransient:
      return absl::StatusCode::kUnavailable;
    case ErrorKind::kCommandTimeout:
    case ErrorKind::kTestTimeout:
      return absl::StatusCode::kDeadlineExceeded;
    case ErrorKind::kCommandFailure:
    case ErrorKind::kPatchApplyFailure:
      return absl::StatusCode::kAborted;
    case ErrorKind::kFileMutationConflict:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kInvalidInput:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kModelFatal:
    case ErrorKind::kNone:
    case ErrorKind::kUnknown:
      break;
  }
  return absl::StatusCode::kInternal;
}
}  // namespace

absl::Status MakeError(ErrorKind kind, absl::string_view message) {
  absl::Status status(CodeFor(kind), message);
  status.SetPayload(kErrorKindUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) return ErrorKind::kNone;
  absl::optional<absl::Cord> payload = status.GetPayload(kErrorKindUrl);
  if (!payload) return ErrorKind::kUnknown;
  std::string name(*payload);
  for (ErrorKind kind : kAllKinds) {
    if (name == ErrorKindName(kind)) return kind;
  }
  return ErrorKind::kUnknown;
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kProvisioning:
      return "ProvisioningError";
    case ErrorKind::kCommandTimeout:
      return "CommandTimeout";
    case ErrorKind::kCommandFailure:
      return "CommandFailure";
    case ErrorKind::kFileMutationConflict:
      return "FileMutationConflict";
    case ErrorKind::kPatchApplyFailure:
      return "PatchApplyFailure";
    case ErrorKind::kTestTimeout:
      return "TestTimeout";
    case ErrorKind::kModelTransient:
      return "ModelTransientError";
    case ErrorKind::kModelFatal:
      return "ModelFatalError";
    case ErrorKind::kInvalidInput:
      return "InvalidInput";
    case ErrorKind::kUnknown:
      break;
  }
  return "Unknown";
}

}  // namespace util
