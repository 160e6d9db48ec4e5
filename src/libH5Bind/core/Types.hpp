#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <span>
#include <array>
#include <vector>
#include <set>
#include <map>
#include <memory>
#include <optional>
#include <variant>
#include <filesystem>

// ============================================================================
// Fundamental Type Aliases & C++20 Utilities
// ============================================================================

namespace h5bind {

// ============================================================================
// Integer Types (explicit width)
// ============================================================================
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// String & Path Types
// ============================================================================
using String = std::string;
using StringView = std::string_view;
using Path = std::filesystem::path;

// ============================================================================
// Container Type Aliases
// ============================================================================
template<typename T>
using Span = std::span<T>;

template<typename T, usize N>
using Array = std::array<T, N>;

template<typename T>
using Vector = std::vector<T>;

template<typename T>
using Set = std::set<T>;

template<typename K, typename V>
using Map = std::map<K, V>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

template<typename T>
using Optional = std::optional<T>;

// ============================================================================
// Error Handling (C++20-compatible Result type)
// ============================================================================

/// Simple Result type using std::variant (C++20 compatible)
/// Usage: Result<T, E> func() { return T{...}; } or { return Result<T, E>::Err(e); }
template<typename T, typename E = String>
class Result {
public:
    // Construct from success value
    Result(T&& value) : m_data(std::move(value)) {}
    Result(const T& value) : m_data(value) {}

    // Construct from error
    struct Err {
        E error;
        explicit Err(E&& e) : error(std::move(e)) {}
        explicit Err(const E& e) : error(e) {}
    };

    Result(Err&& err) : m_data(std::move(err.error)) {}

    // Check if result holds a value
    bool has_value() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return has_value(); }

    // Access value (throws if error)
    T& value() & { return std::get<T>(m_data); }
    const T& value() const & { return std::get<T>(m_data); }
    T&& value() && { return std::get<T>(std::move(m_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const & { return value(); }
    T&& operator*() && { return std::move(value()); }

    const T* operator->() const { return &value(); }

    // Access error (throws if value)
    const E& error() const & { return std::get<E>(m_data); }
    E& error() & { return std::get<E>(m_data); }
    E&& error() && { return std::get<E>(std::move(m_data)); }

private:
    std::variant<T, E> m_data;
};

/// Error codes for H5Bind operations
enum class ErrorCode : u32 {
    Success = 0,

    // File I/O errors (1-99)
    FileNotFound = 1,
    FileReadError = 2,
    FileWriteError = 3,

    // Configuration errors (100-199)
    ConfigParseError = 100,
    ConfigMissingKey = 101,
    ConfigInvalidValue = 102,

    // Feature selection errors (200-299)
    UnknownFlag = 200,

    // Native library discovery errors (300-399)
    LibraryNotFound = 300,
    ProbeParseError = 301,
    AbiVersionUnsupported = 302,

    // Resolution errors (400-499)
    CapabilityMismatch = 400,

    // Native source build errors (500-599)
    NativeBuildFailed = 500,

    Unknown = 9999
};

// ============================================================================
// Utility Functions
// ============================================================================

/// Convert ErrorCode to human-readable string
constexpr const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:               return "Success";
        case ErrorCode::FileNotFound:          return "File not found";
        case ErrorCode::FileReadError:         return "File read error";
        case ErrorCode::FileWriteError:        return "File write error";
        case ErrorCode::ConfigParseError:      return "Config parse error";
        case ErrorCode::ConfigMissingKey:      return "Config missing key";
        case ErrorCode::ConfigInvalidValue:    return "Config invalid value";
        case ErrorCode::UnknownFlag:           return "Unknown feature flag";
        case ErrorCode::LibraryNotFound:       return "Native library not found";
        case ErrorCode::ProbeParseError:       return "Native library metadata unreadable";
        case ErrorCode::AbiVersionUnsupported: return "Native library version unsupported";
        case ErrorCode::CapabilityMismatch:    return "Capability mismatch";
        case ErrorCode::NativeBuildFailed:     return "Native build failed";
        default:                               return "Unknown error";
    }
}

} // namespace h5bind
