#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

// ============================================================================
// Environment - the ambient state the resolver reads and writes
// ============================================================================
// Environment variables and the filesystem are only reached through this
// interface so that probing and resolution can run against an in-memory
// fake in tests. Implementations never modify the process environment.
// ============================================================================

namespace h5bind {

class HB_API Environment {
public:
    virtual ~Environment() = default;

    /// Value of an environment variable, nullopt when unset or empty
    virtual Optional<String> GetVar(StringView name) const = 0;

    virtual bool IsFile(const Path& path) const = 0;
    virtual bool IsDirectory(const Path& path) const = 0;

    /// Whole file contents, nullopt when missing or unreadable
    virtual Optional<String> ReadFile(const Path& path) const = 0;

    /// Replace a file's contents, creating parent directories.
    /// Returns an error message on failure.
    virtual Optional<String> WriteFile(const Path& path, StringView contents) = 0;

    /// Remove a file or a whole directory tree. A missing path is not an
    /// error. Returns an error message on failure.
    virtual Optional<String> RemoveAll(const Path& path) = 0;
};

/// Real process environment and filesystem
class HB_API SystemEnvironment final : public Environment {
public:
    Optional<String> GetVar(StringView name) const override;
    bool IsFile(const Path& path) const override;
    bool IsDirectory(const Path& path) const override;
    Optional<String> ReadFile(const Path& path) const override;
    Optional<String> WriteFile(const Path& path, StringView contents) override;
    Optional<String> RemoveAll(const Path& path) override;
};

/// Last `lineCount` lines of `text`, without a trailing newline
String TailLines(StringView text, usize lineCount);

} // namespace h5bind
