#ifndef CDPDBG_SESSION_ERRORS_HPP
#define CDPDBG_SESSION_ERRORS_HPP

// Error kinds a session can run into, and the result type of the session
// operations that can fail.

#include <string>

namespace session_errors {

enum class ErrorKind {
    None,
    InvalidConfig,           // malformed launch/attach request
    BuildFailure,            // build collaborator rejected; launch aborted
    SpawnError,              // debuggee could not be created; session terminated
    AttachFailure,           // protocol attach failed; launch aborted
    CommandFailure,          // a passthrough protocol command (reload) failed
    AttachDiagnosticFailure, // best-effort probe after attach; logged only
    PathOverrideMalformed,   // ${webRoot} not at position 0; logged only
    TeardownError            // detach or kill failed; swallowed
};

const char *error_kind_name(ErrorKind kind);

// Fixed id reported with a build failure.
static constexpr int BUILD_FAILED_ERROR_ID = 2001;
static const char BUILD_FAILED_MESSAGE[] = "Compilation failed.";

struct OperationResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    int error_id = 0;
    std::string message;
    std::string error_detail;
};

} // namespace session_errors

#endif // CDPDBG_SESSION_ERRORS_HPP
