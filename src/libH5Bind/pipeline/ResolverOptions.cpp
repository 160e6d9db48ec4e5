#include "ResolverOptions.hpp"

namespace h5bind {

namespace {

// Typed read of an optional key: absent -> keep `out`, mistyped or out of
// range -> error
template<typename T>
Optional<ResolveError> Read(const Config& config, StringView key, T& out) {
    if (!config.Has(key)) {
        return std::nullopt;
    }
    auto value = config.TryGet<T>(key);
    if (!value) {
        return ResolveError::ConfigError("'" + String(key) + "' has the wrong type or is out of range");
    }
    out = std::move(*value);
    return std::nullopt;
}

Optional<ResolveError> ReadStringArray(const Config& config, StringView key, Vector<String>& out) {
    if (!config.Has(key)) {
        return std::nullopt;
    }
    if (!config.IsArray(key)) {
        return ResolveError::ConfigError("'" + String(key) + "' must be an array of strings");
    }
    Vector<String> values = config.GetArray<String>(key);
    if (values.size() != config.ArraySize(key)) {
        return ResolveError::ConfigError("'" + String(key) + "' must contain only strings");
    }
    out = std::move(values);
    return std::nullopt;
}

} // namespace

Vector<String> ResolverOptions::SplitFeatureList(StringView list) {
    Vector<String> names;
    usize start = 0;
    while (start <= list.size()) {
        usize end = list.find(',', start);
        if (end == StringView::npos) {
            end = list.size();
        }
        StringView item = list.substr(start, end - start);
        usize first = item.find_first_not_of(" \t");
        if (first != StringView::npos) {
            usize last = item.find_last_not_of(" \t");
            names.emplace_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return names;
}

ResolveResult<ResolverOptions> ResolverOptions::FromConfig(const Config& config) {
    ResolverOptions options;

#define HB_READ(expr) \
    do { if (auto err = (expr)) return ResolveResult<ResolverOptions>::Err(std::move(*err)); } while (false)

    // [features]
    if (config.Has("features.enabled")) {
        Vector<String> enabled;
        HB_READ(ReadStringArray(config, "features.enabled", enabled));
        options.features = std::move(enabled);
    }

    // [probe]
    String hdf5Dir;
    HB_READ(Read(config, "probe.hdf5_dir", hdf5Dir));
    if (!hdf5Dir.empty()) {
        options.probe.hdf5Dir = Path(hdf5Dir);
    }
    HB_READ(Read(config, "probe.use_pkg_config", options.probe.usePkgConfig));
    HB_READ(Read(config, "probe.use_linked_runtime", options.probe.useLinkedRuntime));

    Vector<String> extraPaths;
    HB_READ(ReadStringArray(config, "probe.extra_search_paths", extraPaths));
    for (const auto& path : extraPaths) {
        options.probe.extraSearchPaths.emplace_back(path);
    }

    // [static_build]
    String sourceDir;
    HB_READ(Read(config, "static_build.source_dir", sourceDir));
    if (!sourceDir.empty()) {
        options.staticBuild.sourceDir = Path(sourceDir);
    }
    String buildDir = options.staticBuild.buildDir.string();
    HB_READ(Read(config, "static_build.build_dir", buildDir));
    options.staticBuild.buildDir = buildDir;
    HB_READ(Read(config, "static_build.jobs", options.staticBuild.jobs));
    HB_READ(Read(config, "static_build.cc", options.staticBuild.cc));
    HB_READ(Read(config, "static_build.log_tail_lines", options.staticBuild.logTailLines));

    if (options.staticBuild.jobs == 0) {
        return ResolveResult<ResolverOptions>::Err(ResolveError::ConfigError("'static_build.jobs' must be at least 1"));
    }
    if (buildDir.empty()) {
        return ResolveResult<ResolverOptions>::Err(ResolveError::ConfigError("'static_build.build_dir' must not be empty"));
    }

    // [output]
    String outputDir = options.output.dir.string();
    HB_READ(Read(config, "output.dir", outputDir));
    options.output.dir = outputDir;
    HB_READ(Read(config, "output.header", options.output.header));
    HB_READ(Read(config, "output.cmake", options.output.cmake));
    HB_READ(Read(config, "output.flags", options.output.flags));

    // [log]
    String level;
    HB_READ(Read(config, "log.level", level));
    if (!level.empty()) {
        auto parsed = Log::ParseLevel(level);
        if (!parsed) {
            return ResolveResult<ResolverOptions>::Err(ResolveError::ConfigError(
                "'log.level' must be one of trace, debug, info, warn, error, critical, off (got '" + level + "')"));
        }
        options.logLevel = *parsed;
    }
    HB_READ(Read(config, "log.file", options.logFile));

#undef HB_READ

    return options;
}

} // namespace h5bind
