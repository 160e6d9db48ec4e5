#include "TestFakes.hpp"
#include "gtest/gtest.h"
#include "probe/CapabilityProbe.hpp"

using namespace h5bind;
using namespace h5bind::test;

namespace {

const Vector<String> kSerialMacros = {"H5_HAVE_FILTER_DEFLATE", "H5_HAVE_STDBOOL_H"};

} // namespace

TEST(CapabilityProbeTest, NothingInstalledIsLibraryNotFound) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    CapabilityProbe probe(env, runner);

    auto lib = probe.Probe();
    ASSERT_FALSE(lib.has_value());
    EXPECT_EQ(lib.error().code, ErrorCode::LibraryNotFound);
    EXPECT_NE(lib.error().message.find("HDF5_DIR"), String::npos);

    // Every pkg-config package was asked for
    EXPECT_EQ(runner.captures.size(), 4u);
    EXPECT_EQ(runner.captures.front(), (Vector<String>{"pkg-config", "--cflags-only-I", "hdf5"}));
}

TEST(CapabilityProbeTest, Hdf5DirEnvironmentVariable) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/hdf5", {.macros = kSerialMacros});
    env.SetVar("HDF5_DIR", "/opt/hdf5");

    auto lib = CapabilityProbe(env, runner).Probe();
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->caps.version, Version(1, 10, 8));
    EXPECT_EQ(lib->caps.capabilities, (CapabilitySet{Capability::Zlib, Capability::Deprecated, Capability::Stdbool}));
    EXPECT_EQ(lib->includeDir, Path("/opt/hdf5/include"));
    EXPECT_EQ(lib->libraryDir, Path("/opt/hdf5/lib"));
    EXPECT_EQ(lib->libraryName, "hdf5");
    EXPECT_EQ(lib->discoveredBy, "HDF5_DIR");

    // An explicit directory ends the search
    EXPECT_TRUE(runner.captures.empty());
}

TEST(CapabilityProbeTest, ConfiguredDirectoryOverridesEnvironment) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/hdf5-1.10", {.version = {1, 10, 8}});
    AddPrefixInstall(env, "/opt/hdf5-1.12", {.version = {1, 12, 2}});
    env.SetVar("HDF5_DIR", "/opt/hdf5-1.10");

    ProbeOptions options;
    options.hdf5Dir = Path("/opt/hdf5-1.12");
    auto lib = CapabilityProbe(env, runner, options).Probe();
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->caps.version, Version(1, 12, 2));
    EXPECT_EQ(lib->discoveredBy, "probe.hdf5_dir");
}

TEST(CapabilityProbeTest, ExplicitDirectoryProblems) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    env.SetVar("HDF5_DIR", "/nowhere");

    auto missing = CapabilityProbe(env, runner).Probe();
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::LibraryNotFound);
    EXPECT_NE(missing.error().message.find("HDF5_DIR=/nowhere is not a directory"), String::npos);

    env.AddFile("/opt/empty/README");
    env.SetVar("HDF5_DIR", "/opt/empty");
    auto empty = CapabilityProbe(env, runner).Probe();
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::LibraryNotFound);
    EXPECT_NE(empty.error().message.find("contains no HDF5 installation"), String::npos);
}

TEST(CapabilityProbeTest, Lib64AndMultiarchDirectories) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddInstall(env, {.includeDir = "/opt/h5/include", .libraryDir = "/opt/h5/lib64"});

    auto lib = CapabilityProbe(env, runner).ProbeInstallPrefix("/opt/h5", "test");
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->libraryDir, Path("/opt/h5/lib64"));
    EXPECT_EQ(lib->discoveredBy, "test");
}

TEST(CapabilityProbeTest, VersionSelectorSkipsOtherReleases) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    // Found first via pkg-config, but the wrong release
    AddPrefixInstall(env, "/opt/pc", {.version = {1, 12, 2}});
    runner.ScriptCapture({"pkg-config", "--cflags-only-I", "hdf5"}, 0, "-I/opt/pc/include\n");
    runner.ScriptCapture({"pkg-config", "--libs-only-L", "hdf5"}, 0, "-L/opt/pc/lib\n");
    // Debian side-by-side layout
    AddInstall(env, {.includeDir = "/usr/include/hdf5/serial",
                     .libraryDir = "/usr/lib/x86_64-linux-gnu/hdf5/serial",
                     .version = {1, 10, 8},
                     .libraryName = "hdf5_serial"});

    env.SetVar("HDF5_VERSION", "1.10");
    auto lib = CapabilityProbe(env, runner).Probe();
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->caps.version, Version(1, 10, 8));
    EXPECT_EQ(lib->libraryName, "hdf5_serial");
    EXPECT_EQ(lib->discoveredBy, "well-known prefix");

    env.SetVar("HDF5_VERSION", "1.8");
    auto none = CapabilityProbe(env, runner).Probe();
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::LibraryNotFound);
    EXPECT_NE(none.error().message.find("HDF5_VERSION=1.8"), String::npos);
}

TEST(CapabilityProbeTest, VersionSelectorAgainstExplicitDirectory) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/hdf5", {.version = {1, 12, 1}});
    env.SetVar("HDF5_DIR", "/opt/hdf5");
    env.SetVar("HDF5_VERSION", "1.10.8");

    auto lib = CapabilityProbe(env, runner).Probe();
    ASSERT_FALSE(lib.has_value());
    EXPECT_EQ(lib.error().code, ErrorCode::LibraryNotFound);
    EXPECT_NE(lib.error().message.find("holds HDF5 1.12.1"), String::npos);
}

TEST(CapabilityProbeTest, MalformedVersionSelectorIsConfigError) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    env.SetVar("HDF5_VERSION", "newest");

    auto lib = CapabilityProbe(env, runner).Probe();
    ASSERT_FALSE(lib.has_value());
    EXPECT_EQ(lib.error().code, ErrorCode::ConfigInvalidValue);
}

TEST(CapabilityProbeTest, PkgConfigLocatesInstallation) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    env.SetVar("PKG_CONFIG", "/usr/bin/x86_64-linux-gnu-pkg-config");
    AddInstall(env, {.includeDir = "/srv/hdf5/inc", .libraryDir = "/srv/hdf5/libs", .version = {1, 14, 3}});
    runner.ScriptCapture({"/usr/bin/x86_64-linux-gnu-pkg-config", "--cflags-only-I", "hdf5-openmpi"}, 0,
                         "-I/srv/hdf5/inc -I/usr/include/openmpi\n");
    runner.ScriptCapture({"/usr/bin/x86_64-linux-gnu-pkg-config", "--libs-only-L", "hdf5-openmpi"}, 0,
                         "-L/srv/hdf5/libs\n");

    auto lib = CapabilityProbe(env, runner).Probe();
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->caps.version, Version(1, 14, 3));
    EXPECT_EQ(lib->includeDir, Path("/srv/hdf5/inc"));
    EXPECT_EQ(lib->discoveredBy, "pkg-config hdf5-openmpi");
}

TEST(CapabilityProbeTest, PkgConfigCanBeDisabled) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    ProbeOptions options;
    options.usePkgConfig = false;
    options.extraSearchPaths = {"/home/user/hdf5"};
    AddPrefixInstall(env, "/home/user/hdf5", {});

    auto lib = CapabilityProbe(env, runner, options).Probe();
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->discoveredBy, "probe.extra_search_paths");
    EXPECT_TRUE(runner.captures.empty());
}

TEST(CapabilityProbeTest, ExtraSearchPathsWinOverSystemInstalls) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/usr", {.version = {1, 10, 8}});
    AddInstall(env, {.includeDir = "/usr/include/hdf5/serial",
                     .libraryDir = "/usr/lib/x86_64-linux-gnu/hdf5/serial",
                     .version = {1, 10, 8},
                     .libraryName = "hdf5_serial"});
    AddPrefixInstall(env, "/home/user/hdf5-1.14", {.version = {1, 14, 3}});
    runner.ScriptCapture({"pkg-config", "--cflags-only-I", "hdf5"}, 0, "-I/usr/include/hdf5/serial\n");
    runner.ScriptCapture({"pkg-config", "--libs-only-L", "hdf5"}, 0, "-L/usr/lib/x86_64-linux-gnu/hdf5/serial\n");

    ProbeOptions options;
    options.extraSearchPaths = {"/home/user/hdf5-1.14"};
    auto lib = CapabilityProbe(env, runner, options).Probe();
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->caps.version, Version(1, 14, 3));
    EXPECT_EQ(lib->includeDir, Path("/home/user/hdf5-1.14/include"));
    EXPECT_EQ(lib->discoveredBy, "probe.extra_search_paths");

    // Without the configured prefix the system installation is used
    FakeCommandRunner fallbackRunner;
    fallbackRunner.captureResults = runner.captureResults;
    auto system = CapabilityProbe(env, fallbackRunner).Probe();
    ASSERT_TRUE(system.has_value()) << system.error().Describe();
    EXPECT_EQ(system->caps.version, Version(1, 10, 8));
    EXPECT_EQ(system->discoveredBy, "pkg-config hdf5");
}

TEST(CapabilityProbeTest, HighLevelLibraryDetection) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/with-hl", {.withHl = true});

    auto lib = CapabilityProbe(env, runner).ProbeInstallPrefix("/opt/with-hl", "test");
    ASSERT_TRUE(lib.has_value());
    EXPECT_TRUE(lib->caps.Has(Capability::Hl));
    EXPECT_EQ(lib->hlLibraryName, "hdf5_hl");

    // Header without the library does not count
    AddPrefixInstall(env, "/opt/hl-header-only", {});
    env.AddFile("/opt/hl-header-only/include/hdf5_hl.h");
    auto headerOnly = CapabilityProbe(env, runner).ProbeInstallPrefix("/opt/hl-header-only", "test");
    ASSERT_TRUE(headerOnly.has_value());
    EXPECT_FALSE(headerOnly->caps.Has(Capability::Hl));
    EXPECT_TRUE(headerOnly->hlLibraryName.empty());
}

TEST(CapabilityProbeTest, ExtraLibrariesFromSettings) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/hdf5", {.extraLibraries = "-lcrypto -lcurl -lsz -lz -ldl -lm"});

    auto lib = CapabilityProbe(env, runner).ProbeInstallPrefix("/opt/hdf5", "test");
    ASSERT_TRUE(lib.has_value());
    EXPECT_EQ(lib->extraLibraries, (Vector<String>{"crypto", "curl", "sz", "z", "dl", "m"}));
}

TEST(CapabilityProbeTest, UnreadableHeaderIsProbeParseError) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/hdf5", {});
    env.unreadable.insert(FakeEnvironment::Key("/opt/hdf5/include/H5pubconf.h"));

    auto lib = CapabilityProbe(env, runner).ProbeInstallPrefix("/opt/hdf5", "test");
    ASSERT_FALSE(lib.has_value());
    EXPECT_EQ(lib.error().code, ErrorCode::ProbeParseError);
    EXPECT_NE(lib.error().message.find("H5pubconf.h"), String::npos);
}

TEST(CapabilityProbeTest, VersionFallsBackToPubconf) {
    FakeEnvironment env;
    FakeCommandRunner runner;
    AddPrefixInstall(env, "/opt/hdf5", {.version = {1, 8, 21}});
    env.AddFile("/opt/hdf5/include/H5public.h", "/* version macros moved elsewhere */\n");

    auto lib = CapabilityProbe(env, runner).ProbeInstallPrefix("/opt/hdf5", "test");
    ASSERT_TRUE(lib.has_value()) << lib.error().Describe();
    EXPECT_EQ(lib->caps.version, Version(1, 8, 21));
}
