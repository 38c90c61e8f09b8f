#ifndef CDPDBG_DEBUGGEE_PROCESS_HPP
#define CDPDBG_DEBUGGEE_PROCESS_HPP

// The spawned debuggee as seen by the session.

namespace debuggee_process {

enum class StrategyKind {
    Direct,
    HelperMediated
};

const char *strategy_name(StrategyKind kind);

struct DebuggeeProcessHandle {
    // The child we spawned: the debuggee itself, or the spawn helper.
    int process_id = -1;
    // The real debuggee. Equals process_id for direct spawns; reported
    // out-of-band by the helper otherwise.
    int debuggee_process_id = -1;
    bool debuggee_id_known = false;
    StrategyKind strategy = StrategyKind::Direct;
    // Set once the process was killed or seen to exit. Never killed again after.
    bool terminated = false;
};

} // namespace debuggee_process

#endif // CDPDBG_DEBUGGEE_PROCESS_HPP
