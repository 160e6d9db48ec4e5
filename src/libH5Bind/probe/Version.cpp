#include "Version.hpp"

#include <charconv>

namespace h5bind {

namespace {

// Splits on '.', stopping at the first character that is neither a digit
// nor a dot ("1.10.8-patch1" -> {1, 10, 8}).
Vector<u32> ParseNumericParts(StringView text) {
    Vector<u32> parts;
    usize pos = 0;

    while (pos < text.size()) {
        u32 value = 0;
        auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), value);
        if (ec != std::errc{} || ptr == text.data() + pos) {
            break;
        }
        parts.push_back(value);
        pos = static_cast<usize>(ptr - text.data());

        if (pos >= text.size() || text[pos] != '.') {
            break;
        }
        ++pos;
    }
    return parts;
}

StringView Trim(StringView text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '"' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '"' || text.back() == '\t' ||
                             text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

Optional<Version> Version::Parse(StringView text) {
    auto parts = ParseNumericParts(Trim(text));
    if (parts.size() < 2) {
        return std::nullopt;
    }
    return Version(parts[0], parts[1], parts.size() > 2 ? parts[2] : 0);
}

String Version::ToString() const {
    return std::to_string(majnum) + "." + std::to_string(minnum) + "." + std::to_string(relnum);
}

String Version::ToMacroSuffix() const {
    return std::to_string(majnum) + "_" + std::to_string(minnum) + "_" + std::to_string(relnum);
}

Optional<VersionSelector> VersionSelector::Parse(StringView text) {
    auto parts = ParseNumericParts(Trim(text));
    if (parts.empty()) {
        return std::nullopt;
    }

    VersionSelector selector;
    selector.majnum = parts[0];
    if (parts.size() > 1) selector.minnum = parts[1];
    if (parts.size() > 2) selector.relnum = parts[2];
    return selector;
}

bool VersionSelector::Matches(const Version& version) const {
    if (version.majnum != majnum) return false;
    if (minnum && version.minnum != *minnum) return false;
    if (relnum && version.relnum != *relnum) return false;
    return true;
}

String VersionSelector::ToString() const {
    String out = std::to_string(majnum);
    if (minnum) out += "." + std::to_string(*minnum);
    if (relnum) out += "." + std::to_string(*relnum);
    return out;
}

bool IsSupportedVersion(const Version& version) {
    return version >= kMinSupportedVersion && version < kMaxSupportedVersionExclusive;
}

String SupportedVersionRange() {
    return "[" + kMinSupportedVersion.ToString() + ", " +
           kMaxSupportedVersionExclusive.ToString() + ")";
}

const Vector<Version>& KnownReleases() {
    static const Vector<Version> releases = [] {
        Vector<Version> v;
        for (u32 rel = 4; rel <= 23; ++rel) v.emplace_back(1, 8, rel);
        for (u32 rel = 0; rel <= 11; ++rel) v.emplace_back(1, 10, rel);
        for (u32 rel = 0; rel <= 3; ++rel)  v.emplace_back(1, 12, rel);
        for (u32 rel = 0; rel <= 2; ++rel)  v.emplace_back(1, 13, rel);
        for (u32 rel = 0; rel <= 6; ++rel)  v.emplace_back(1, 14, rel);
        return v;
    }();
    return releases;
}

} // namespace h5bind
