#include "Config.hpp"
#include "Log.hpp"

#include <sstream>

namespace h5bind {

namespace {

String DescribeParseError(const toml::parse_error& err) {
    std::ostringstream oss;
    oss << "TOML parse error: " << err.description()
        << " at line " << err.source().begin.line
        << ", column " << err.source().begin.column;
    return oss.str();
}

} // namespace

Config::Config(toml::table&& root) : m_Root(std::move(root)) {}

Result<Config, String> Config::Load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return Result<Config, String>::Err("Config file not found: " + filePath.string());
    }

    try {
        toml::table table = toml::parse_file(filePath.string());
        Log::Info("Loaded configuration from: {}", filePath.string());
        return Config(std::move(table));
    }
    catch (const toml::parse_error& err) {
        return Result<Config, String>::Err(DescribeParseError(err));
    }
    catch (const std::exception& ex) {
        return Result<Config, String>::Err(String("Failed to load config: ") + ex.what());
    }
}

Result<Config, String> Config::Parse(StringView text) {
    try {
        toml::table table = toml::parse(text);
        return Config(std::move(table));
    }
    catch (const toml::parse_error& err) {
        return Result<Config, String>::Err(DescribeParseError(err));
    }
}

bool Config::Has(StringView key) const {
    return Navigate(key) != nullptr;
}

bool Config::IsArray(StringView key) const {
    const toml::node* node = Navigate(key);
    return node && node->is_array();
}

usize Config::ArraySize(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node || !node->is_array()) {
        return 0;
    }
    return node->as_array()->size();
}

Result<Config, String> Config::GetTable(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return Result<Config, String>::Err("Table not found: " + String(key));
    }

    if (!node->is_table()) {
        return Result<Config, String>::Err("Key is not a table: " + String(key));
    }

    // Clone the table (toml++ doesn't provide a non-const access pattern here)
    toml::table clonedTable = *node->as_table();
    return Config(std::move(clonedTable));
}

void Config::Print() const {
    std::ostringstream oss;
    oss << m_Root;
    Log::Debug("Configuration:\n{}", oss.str());
}

void Config::WarnOutOfRange(const toml::node& node, int64_t value, const char* typeName) {
    Log::Warn("Config: value {} at line {} does not fit in {}; using the default",
              value, node.source().begin.line, typeName);
}

const toml::node* Config::Navigate(StringView key) const {
    // Split key by '.' and traverse the hierarchy
    const toml::node* current = &m_Root;
    usize start = 0;

    while (start < key.size()) {
        usize end = key.find('.', start);
        if (end == StringView::npos) {
            end = key.size();
        }

        String segment(key.substr(start, end - start));

        if (!current->is_table()) {
            return nullptr;
        }

        const toml::table* table = current->as_table();
        auto it = table->find(segment);
        if (it == table->end()) {
            return nullptr;
        }
        current = &it->second;

        start = end + 1;
    }

    return current;
}

} // namespace h5bind
