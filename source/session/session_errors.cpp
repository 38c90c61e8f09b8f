#include "session/session_errors.hpp"

namespace session_errors {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::InvalidConfig:
        return "invalid_config";
    case ErrorKind::BuildFailure:
        return "build_failure";
    case ErrorKind::SpawnError:
        return "spawn_error";
    case ErrorKind::AttachFailure:
        return "attach_failure";
    case ErrorKind::CommandFailure:
        return "command_failure";
    case ErrorKind::AttachDiagnosticFailure:
        return "attach_diagnostic_failure";
    case ErrorKind::PathOverrideMalformed:
        return "path_override_malformed";
    case ErrorKind::TeardownError:
        return "teardown_error";
    }
    return "none";
}

} // namespace session_errors
