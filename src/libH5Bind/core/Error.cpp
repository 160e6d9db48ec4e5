#include "Error.hpp"

#include <sstream>

namespace h5bind {

ResolveError ResolveError::UnknownFlag(StringView name) {
    ResolveError err;
    err.code = ErrorCode::UnknownFlag;
    err.flag = String(name);
    err.message = "unknown feature flag '" + String(name) +
                  "' (known: mpio, hl, threadsafe, zlib, deprecated, static)";
    return err;
}

ResolveError ResolveError::LibraryNotFound(StringView detail) {
    ResolveError err;
    err.code = ErrorCode::LibraryNotFound;
    err.message = String(detail);
    return err;
}

ResolveError ResolveError::ProbeParseError(const Path& file, StringView detail) {
    ResolveError err;
    err.code = ErrorCode::ProbeParseError;
    err.message = "cannot parse " + file.string() + ": " + String(detail);
    return err;
}

ResolveError ResolveError::CapabilityMismatch(StringView flag, StringView capability, StringView detail) {
    ResolveError err;
    err.code = ErrorCode::CapabilityMismatch;
    err.flag = String(flag);
    err.capability = String(capability);
    err.message = "feature '" + String(flag) + "' requires native capability '" +
                  String(capability) + "': " + String(detail);
    return err;
}

ResolveError ResolveError::NativeBuildFailed(i32 exitStatus, StringView step, String logTail) {
    ResolveError err;
    err.code = ErrorCode::NativeBuildFailed;
    err.exitStatus = exitStatus;
    err.logTail = std::move(logTail);

    std::ostringstream oss;
    oss << "native HDF5 " << step << " exited with status " << exitStatus;
    if (!err.logTail.empty()) {
        oss << "; last build log lines:\n" << err.logTail;
    }
    err.message = oss.str();
    return err;
}

ResolveError ResolveError::AbiVersionUnsupported(StringView version, StringView supportedRange) {
    ResolveError err;
    err.code = ErrorCode::AbiVersionUnsupported;
    err.message = "HDF5 " + String(version) + " is outside the supported range " +
                  String(supportedRange);
    return err;
}

ResolveError ResolveError::ConfigError(StringView detail) {
    ResolveError err;
    err.code = ErrorCode::ConfigInvalidValue;
    err.message = String(detail);
    return err;
}

ResolveError ResolveError::IoError(const Path& file, StringView detail) {
    ResolveError err;
    err.code = ErrorCode::FileWriteError;
    err.message = file.string() + ": " + String(detail);
    return err;
}

String ResolveError::Describe() const {
    return String(ErrorCodeToString(code)) + ": " + message;
}

} // namespace h5bind
