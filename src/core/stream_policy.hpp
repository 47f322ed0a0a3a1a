#pragma once

namespace lazycmd {

// How one standard stream of a child process is wired.
enum class StreamPolicy {
    // Shares the caller's descriptor.
    Inherit,
    // Connected to a pipe read by the parent (stdin: a pipe closed right away).
    Capture,
    // Connected to /dev/null.
    Discard,
};

} // namespace lazycmd
