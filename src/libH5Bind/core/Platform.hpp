#pragma once

// ============================================================================
// Platform Detection & Abstraction Layer
// Cross-platform compatibility macros
// ============================================================================

// Platform identification macros (defined by CMake)
// Native builds are driven through fork/exec, so only POSIX hosts are supported
#if defined(H5BIND_PLATFORM_LINUX)
    #define HB_LINUX 1
#elif defined(H5BIND_PLATFORM_MACOS)
    #define HB_MACOS 1
#else
    #error "Unsupported platform! H5Bind requires Linux or macOS."
#endif

// Compiler detection
#if defined(_MSC_VER)
    #define HB_COMPILER_MSVC 1
#elif defined(__clang__)
    #define HB_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define HB_COMPILER_GCC 1
#elif defined(__INTEL_COMPILER)
    #define HB_COMPILER_INTEL 1
#else
    #error "Unsupported compiler! C++20 support required."
#endif

// Build configuration
#if defined(NDEBUG)
    #define HB_RELEASE 1
#else
    #define HB_DEBUG 1
#endif

// Symbol visibility
#define HB_API __attribute__((visibility("default")))

// Debug break macro
#if defined(HB_DEBUG)
    #include <signal.h>
    #define HB_DEBUGBREAK() raise(SIGTRAP)
#else
    #define HB_DEBUGBREAK()
#endif

// Disable specific warnings for third-party headers
#if defined(HB_COMPILER_MSVC)
    #define HB_DISABLE_WARNINGS_PUSH __pragma(warning(push, 0))
    #define HB_DISABLE_WARNINGS_POP  __pragma(warning(pop))
#elif defined(HB_COMPILER_CLANG) || defined(HB_COMPILER_GCC)
    #define HB_DISABLE_WARNINGS_PUSH \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"")
    #define HB_DISABLE_WARNINGS_POP _Pragma("GCC diagnostic pop")
#elif defined(HB_COMPILER_INTEL)
    #define HB_DISABLE_WARNINGS_PUSH __pragma(warning(push, 0))
    #define HB_DISABLE_WARNINGS_POP  __pragma(warning(pop))
#endif

// Assert macro (active in debug builds)
#if defined(HB_DEBUG)
    #include <cassert>
    #define HB_ASSERT(condition, message) \
        do { \
            if (!(condition)) { \
                ::h5bind::Log::Critical("Assertion failed: {} at {}:{}", \
                    message, __FILE__, __LINE__); \
                HB_DEBUGBREAK(); \
                assert(condition); \
            } \
        } while (false)
#else
    #define HB_ASSERT(condition, message) ((void)0)
#endif

namespace h5bind {

/// Returns a human-readable platform string
constexpr const char* GetPlatformName() {
    #if defined(HB_LINUX)
        return "Linux";
    #elif defined(HB_MACOS)
        return "macOS";
    #else
        return "Unknown";
    #endif
}

/// Returns a human-readable compiler string
constexpr const char* GetCompilerName() {
    #if defined(HB_COMPILER_MSVC)
        return "MSVC";
    #elif defined(HB_COMPILER_CLANG)
        return "Clang";
    #elif defined(HB_COMPILER_GCC)
        return "GCC";
    #elif defined(HB_COMPILER_INTEL)
        return "Intel";
    #endif
}

/// Returns build configuration string
constexpr const char* GetBuildConfig() {
    #if defined(HB_DEBUG)
        return "Debug";
    #else
        return "Release";
    #endif
}

} // namespace h5bind
