// ============================================================================
// h5bind-resolve - HDF5 linkage resolver
// ============================================================================
// Detects (or builds) the native HDF5 library, checks the requested feature
// flags against it and writes the declaration header, CMake fragment and
// linker flags for the consuming build.
//
// Exit status: 0 success, 1 resolution failure, 2 usage error
// ============================================================================

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "io/CommandRunner.hpp"
#include "io/Environment.hpp"
#include "pipeline/Pipeline.hpp"
#include "probe/LinkedRuntime.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace h5bind;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr const char* kDefaultConfigFile = "h5bind.toml";

struct CliArgs {
    Optional<Path> configPath;
    Optional<String> features;
    Optional<Path> outputDir;
    Optional<Log::Level> logLevel;
    bool runtimeInfo = false;
    bool help = false;
};

void PrintUsage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>      Resolver configuration (default: ./" << kDefaultConfigFile << " if present)\n"
        << "  --features <list>    Comma-separated features: mpio, hl, threadsafe, zlib,\n"
        << "                       deprecated, static (overrides features.enabled)\n"
        << "  --out <dir>          Output directory for the generated files\n"
        << "  --log-level <level>  trace, debug, info, warn, error, critical, off\n"
        << "  --runtime-info       Describe the HDF5 library this tool is linked against\n"
        << "  --help               Show this message\n";
}

// Returns an error message on malformed input
Optional<String> ParseArgs(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        StringView arg = argv[i];

        auto next = [&]() -> Optional<String> {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            return String(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--runtime-info") {
            args.runtimeInfo = true;
        } else if (arg == "--config" || arg == "--features" || arg == "--out" || arg == "--log-level") {
            auto value = next();
            if (!value) {
                return String(arg) + " requires a value";
            }
            if (arg == "--config") {
                args.configPath = Path(*value);
            } else if (arg == "--features") {
                args.features = *value;
            } else if (arg == "--out") {
                args.outputDir = Path(*value);
            } else {
                args.logLevel = Log::ParseLevel(*value);
                if (!args.logLevel) {
                    return "unknown log level '" + *value + "'";
                }
            }
        } else {
            return "unknown argument '" + String(arg) + "'";
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    // Console only until the configuration names a log file
    Log::Init("", Log::Level::Info);

    CliArgs args;
    if (auto usageError = ParseArgs(argc, argv, args)) {
        HB_LOG_ERROR("{}", *usageError);
        PrintUsage(std::cerr, argv[0]);
        Log::Shutdown();
        return kExitUsage;
    }

    if (args.help) {
        PrintUsage(std::cout, argv[0]);
        Log::Shutdown();
        return 0;
    }

    try {
        if (args.runtimeInfo) {
            std::cout << LinkedRuntime::Describe() << "\n";
            Log::Shutdown();
            return 0;
        }

        // ====================================================================
        // Configuration
        // ====================================================================
        Config config;
        Optional<Path> configPath = args.configPath;
        if (!configPath && std::filesystem::exists(kDefaultConfigFile)) {
            configPath = Path(kDefaultConfigFile);
        }
        if (configPath) {
            auto loaded = Config::Load(*configPath);
            if (!loaded.has_value()) {
                HB_LOG_ERROR("Failed to load configuration: {}", loaded.error());
                Log::Shutdown();
                return kExitFailure;
            }
            config = std::move(loaded.value());
        }

        auto parsed = ResolverOptions::FromConfig(config);
        if (!parsed.has_value()) {
            HB_LOG_ERROR("{}", parsed.error().Describe());
            Log::Shutdown();
            return kExitFailure;
        }
        ResolverOptions options = std::move(parsed.value());

        if (args.features) {
            options.features = ResolverOptions::SplitFeatureList(*args.features);
        }
        if (args.outputDir) {
            options.output.dir = *args.outputDir;
        }
        if (args.logLevel) {
            options.logLevel = *args.logLevel;
        }

        Log::Init(options.logFile.c_str(), options.logLevel);
        config.Print();

        // ====================================================================
        // Resolution
        // ====================================================================
        SystemEnvironment env;
        SystemCommandRunner runner;
        Pipeline pipeline(env, runner, std::move(options));

        auto outcome = pipeline.Run();
        if (!outcome.has_value()) {
            // Already logged with its stage by the pipeline
            Log::Shutdown();
            return kExitFailure;
        }

        for (const auto& file : outcome->writtenFiles) {
            std::cout << file.string() << "\n";
        }
    }
    catch (const std::exception& e) {
        HB_LOG_CRITICAL("Fatal error: {}", e.what());
        Log::Shutdown();
        return kExitFailure;
    }

    Log::Shutdown();
    return 0;
}
