#include "Environment.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace h5bind {

Optional<String> SystemEnvironment::GetVar(StringView name) const {
    const char* value = std::getenv(String(name).c_str());
    if (!value || value[0] == '\0') {
        return std::nullopt;
    }
    return String(value);
}

bool SystemEnvironment::IsFile(const Path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool SystemEnvironment::IsDirectory(const Path& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

Optional<String> SystemEnvironment::ReadFile(const Path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

Optional<String> SystemEnvironment::WriteFile(const Path& path, StringView contents) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return "cannot create directory " + path.parent_path().string() + ": " + ec.message();
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot open " + path.string() + " for writing";
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) {
        return "write to " + path.string() + " failed";
    }
    return std::nullopt;
}

Optional<String> SystemEnvironment::RemoveAll(const Path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return "cannot remove " + path.string() + ": " + ec.message();
    }
    return std::nullopt;
}

String TailLines(StringView text, usize lineCount) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    if (lineCount == 0 || text.empty()) {
        return {};
    }

    usize pos = text.size();
    usize found = 0;
    while (pos > 0) {
        --pos;
        if (text[pos] == '\n' && ++found == lineCount) {
            return String(text.substr(pos + 1));
        }
    }
    return String(text);
}

} // namespace h5bind
