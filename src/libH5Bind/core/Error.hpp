#pragma once

#include "Platform.hpp"
#include "Types.hpp"

// ============================================================================
// ResolveError - failure value shared by every resolution stage
// ============================================================================
// None of these are recoverable inside the tool: each one describes an
// environment or configuration defect. The message always names the flag,
// capability, path or version involved.
// ============================================================================

namespace h5bind {

struct HB_API ResolveError {
    ErrorCode code = ErrorCode::Unknown;
    String message;

    // Kind-specific detail (empty / zero when not applicable)
    String flag;          // UnknownFlag, CapabilityMismatch
    String capability;    // CapabilityMismatch
    i32 exitStatus = 0;   // NativeBuildFailed
    String logTail;       // NativeBuildFailed

    static ResolveError UnknownFlag(StringView name);
    static ResolveError LibraryNotFound(StringView detail);
    static ResolveError ProbeParseError(const Path& file, StringView detail);
    static ResolveError CapabilityMismatch(StringView flag, StringView capability, StringView detail);
    static ResolveError NativeBuildFailed(i32 exitStatus, StringView step, String logTail);
    static ResolveError AbiVersionUnsupported(StringView version, StringView supportedRange);
    static ResolveError ConfigError(StringView detail);
    static ResolveError IoError(const Path& file, StringView detail);

    /// "<category>: <message>", the form written to the log and stderr
    String Describe() const;
};

template<typename T>
using ResolveResult = Result<T, ResolveError>;

} // namespace h5bind
