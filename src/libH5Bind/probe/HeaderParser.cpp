#include "HeaderParser.hpp"
#include "core/Log.hpp"

#include <charconv>
#include <sstream>

namespace h5bind {

namespace {

StringView TrimView(StringView text) {
    const char* ws = " \t\r\n";
    usize first = text.find_first_not_of(ws);
    if (first == StringView::npos) {
        return {};
    }
    usize last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

// #define NAME VALUE  ->  {NAME, VALUE}; other lines -> nullopt
Optional<std::pair<String, String>> ParseDefine(StringView line) {
    line = TrimView(line);
    if (line.empty() || line.front() != '#') {
        return std::nullopt;
    }
    line = TrimView(line.substr(1));

    constexpr StringView kDefine = "define";
    if (line.substr(0, kDefine.size()) != kDefine) {
        return std::nullopt;
    }
    line = line.substr(kDefine.size());
    if (line.empty() || (line.front() != ' ' && line.front() != '\t')) {
        return std::nullopt;
    }
    line = TrimView(line);

    usize nameEnd = line.find_first_of(" \t(");
    String name(line.substr(0, nameEnd));
    String value;
    if (nameEnd != StringView::npos) {
        value = String(TrimView(line.substr(nameEnd)));
    }
    if (name.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(name), std::move(value));
}

Map<String, String> CollectDefines(StringView text) {
    Map<String, String> defines;
    usize start = 0;
    while (start <= text.size()) {
        usize end = text.find('\n', start);
        if (end == StringView::npos) {
            end = text.size();
        }
        if (auto define = ParseDefine(text.substr(start, end - start))) {
            defines.insert(std::move(*define));
        }
        start = end + 1;
    }
    return defines;
}

Optional<u32> ParseUnsigned(StringView text) {
    // Values may carry a trailing comment: "10 /* minor */"
    text = TrimView(text);
    u32 value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Set<String> HeaderParser::DefinedMacros(StringView headerText) {
    Set<String> names;
    for (const auto& entry : CollectDefines(headerText)) {
        names.insert(entry.first);
    }
    return names;
}

ResolveResult<Version> HeaderParser::ParseVersion(StringView h5publicText, const Path& file) {
    auto defines = CollectDefines(h5publicText);

    auto read = [&defines](const char* name) -> Optional<u32> {
        auto it = defines.find(name);
        if (it == defines.end()) {
            return std::nullopt;
        }
        return ParseUnsigned(it->second);
    };

    auto majnum = read("H5_VERS_MAJOR");
    auto minnum = read("H5_VERS_MINOR");
    auto relnum = read("H5_VERS_RELEASE");
    if (!majnum || !minnum || !relnum) {
        return ResolveResult<Version>::Err(ResolveError::ProbeParseError(
            file, "H5_VERS_MAJOR/H5_VERS_MINOR/H5_VERS_RELEASE not found or not numeric"));
    }
    return Version(*majnum, *minnum, *relnum);
}

Optional<Version> HeaderParser::ParseConfigVersion(StringView h5pubconfText) {
    auto defines = CollectDefines(h5pubconfText);
    auto it = defines.find("H5_VERSION");
    if (it == defines.end()) {
        return std::nullopt;
    }
    return Version::Parse(it->second);
}

ResolveResult<CapabilitySet> HeaderParser::ParseCapabilities(StringView h5pubconfText, const Path& file) {
    Set<String> macros = DefinedMacros(h5pubconfText);

    bool anyConfigMacro = false;
    for (const auto& name : macros) {
        if (name.rfind("H5_", 0) == 0) {
            anyConfigMacro = true;
            break;
        }
    }
    if (!anyConfigMacro) {
        return ResolveResult<CapabilitySet>::Err(ResolveError::ProbeParseError(
            file, "no H5_* configuration macros defined"));
    }

    CapabilitySet caps;
    if (macros.contains("H5_HAVE_PARALLEL"))        caps.insert(Capability::Mpio);
    if (macros.contains("H5_HAVE_THREADSAFE"))      caps.insert(Capability::Threadsafe);
    if (macros.contains("H5_HAVE_FILTER_DEFLATE"))  caps.insert(Capability::Zlib);
    if (!macros.contains("H5_NO_DEPRECATED_SYMBOLS")) caps.insert(Capability::Deprecated);
    if (macros.contains("H5_HAVE_DIRECT"))          caps.insert(Capability::Direct);
    if (macros.contains("H5_HAVE_STDBOOL_H"))       caps.insert(Capability::Stdbool);

    HB_LOG_DEBUG("{}: {}", file.string(), JoinCapabilityNames(caps));
    return caps;
}

Map<String, String> HeaderParser::ParseSettings(StringView settingsText) {
    Map<String, String> settings;
    std::istringstream in{String(settingsText)};
    String line;
    while (std::getline(in, line)) {
        usize colon = line.find(':');
        if (colon == String::npos) {
            continue;
        }
        StringView key = TrimView(StringView(line).substr(0, colon));
        StringView value = TrimView(StringView(line).substr(colon + 1));
        if (!key.empty()) {
            settings[String(key)] = String(value);
        }
    }
    return settings;
}

Vector<String> HeaderParser::ParseLibraryList(StringView text) {
    Vector<String> libs;
    std::istringstream in{String(text)};
    String token;
    while (in >> token) {
        if (token.size() > 2 && token.rfind("-l", 0) == 0) {
            libs.push_back(token.substr(2));
        }
    }
    return libs;
}

} // namespace h5bind
