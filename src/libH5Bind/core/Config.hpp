#pragma once

#include "Platform.hpp"
#include "Types.hpp"

HB_DISABLE_WARNINGS_PUSH
#include <toml++/toml.h>
HB_DISABLE_WARNINGS_POP

#include <cstdint>
#include <filesystem>
#include <limits>
#include <type_traits>

// ============================================================================
// Configuration Loader (TOML)
// Parse h5bind.toml resolver configuration files
// ============================================================================

namespace h5bind {

/// Configuration manager for H5Bind (reads TOML files)
class HB_API Config {
public:
    /// Load a TOML configuration file
    /// @param filePath Path to the .toml file
    /// @return Result containing parsed config or error
    static Result<Config, String> Load(const std::filesystem::path& filePath);

    /// Parse TOML text held in memory
    static Result<Config, String> Parse(StringView text);

    /// Create an empty configuration
    Config() = default;

    /// Check if a key exists in the configuration
    /// @param key Dot-separated key path (e.g., "probe.hdf5_dir")
    bool Has(StringView key) const;

    /// Get a value from the configuration (with optional default)
    /// @tparam T Expected value type (i32, u32, String, bool)
    /// @param key Dot-separated key path
    /// @param defaultValue Fallback value if key is missing or mistyped
    template<typename T>
    T Get(StringView key, const T& defaultValue = T{}) const;

    /// Get a value only if present and of the expected type
    template<typename T>
    Optional<T> TryGet(StringView key) const;

    /// Get a nested table as a Config object
    Result<Config, String> GetTable(StringView key) const;

    /// Get an array of values (elements of another type are skipped)
    template<typename T>
    Vector<T> GetArray(StringView key) const;

    /// True if the key exists and holds an array
    bool IsArray(StringView key) const;

    /// Element count of an array (0 when missing or not an array)
    usize ArraySize(StringView key) const;

    /// Access the underlying toml::table (for advanced usage)
    const toml::table& GetRoot() const { return m_Root; }

    /// Log the entire config at debug level
    void Print() const;

private:
    explicit Config(toml::table&& root);

    toml::table m_Root;

    /// Helper: Navigate to a nested node by dot-separated path
    const toml::node* Navigate(StringView key) const;

    template<typename T>
    static Optional<T> Convert(const toml::node& node);

    static void WarnOutOfRange(const toml::node& node, int64_t value, const char* typeName);
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
Optional<T> Config::Convert(const toml::node& node) {
    if constexpr (std::is_same_v<T, String>) {
        if (auto val = node.value<std::string>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, i32> || std::is_same_v<T, u32>) {
        if (auto val = node.value<int64_t>()) {
            if (*val < std::numeric_limits<T>::min() || *val > std::numeric_limits<T>::max()) {
                WarnOutOfRange(node, *val, std::is_same_v<T, i32> ? "i32" : "u32");
                return std::nullopt;
            }
            return static_cast<T>(*val);
        }
    } else if constexpr (std::is_same_v<T, f64>) {
        if (auto val = node.value<double>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (auto val = node.value<bool>()) {
            return *val;
        }
    }
    return std::nullopt;
}

template<typename T>
T Config::Get(StringView key, const T& defaultValue) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return defaultValue;
    }

    if (auto val = Convert<T>(*node)) {
        return *val;
    }
    return defaultValue;
}

template<typename T>
Optional<T> Config::TryGet(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return std::nullopt;
    }
    return Convert<T>(*node);
}

template<typename T>
Vector<T> Config::GetArray(StringView key) const {
    const toml::node* node = Navigate(key);
    Vector<T> result;

    if (!node || !node->is_array()) {
        return result;
    }

    const toml::array* arr = node->as_array();
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        if (auto val = Convert<T>(elem)) {
            result.push_back(std::move(*val));
        }
    }

    return result;
}

} // namespace h5bind
