#include <algorithm>

#include "gtest/gtest.h"
#include "resolve/ConflictResolver.hpp"

using namespace h5bind;

namespace {

NativeLibrary Library(CapabilitySet caps, Version version = {1, 10, 8}) {
    NativeLibrary lib;
    lib.caps.version = version;
    lib.caps.capabilities = std::move(caps);
    lib.includeDir = "/usr/include/hdf5/serial";
    lib.libraryDir = "/usr/lib/x86_64-linux-gnu/hdf5/serial";
    lib.libraryName = "hdf5_serial";
    lib.discoveredBy = "well-known prefix";
    return lib;
}

FlagSet Subset(u32 mask) {
    FlagSet flags;
    for (usize i = 0; i < kAllFeatureFlags.size(); ++i) {
        if (mask & (1u << i)) {
            flags.insert(kAllFeatureFlags[i]);
        }
    }
    return flags;
}

} // namespace

TEST(ConflictResolverTest, DynamicAcceptsAvailableCapability) {
    ConflictResolver resolver;
    auto plan = resolver.ResolveDynamic({FeatureFlag::Zlib}, Library({Capability::Zlib}));
    ASSERT_TRUE(plan.has_value()) << plan.error().Describe();
    EXPECT_EQ(plan->linkMode, LinkMode::Dynamic);
    EXPECT_EQ(plan->symbolsExposed, (GroupSet{SymbolGroup::Core, SymbolGroup::Zlib}));
    EXPECT_EQ(plan->origin, "well-known prefix");
}

TEST(ConflictResolverTest, DynamicRejectsMissingCapability) {
    ConflictResolver resolver;
    auto plan = resolver.ResolveDynamic({FeatureFlag::Mpio}, Library({Capability::Zlib}));
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, ErrorCode::CapabilityMismatch);
    EXPECT_EQ(plan.error().flag, "mpio");
    EXPECT_EQ(plan.error().capability, "has_mpio");
}

TEST(ConflictResolverTest, ThreadsafeRequestNeedsThreadsafeBuild) {
    ConflictResolver resolver;
    auto rejected = resolver.ResolveDynamic({FeatureFlag::Threadsafe}, Library({Capability::Zlib}));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().capability, "has_threadsafe");

    auto accepted = resolver.ResolveDynamic({FeatureFlag::Threadsafe}, Library({Capability::Threadsafe}));
    ASSERT_TRUE(accepted.has_value());
    EXPECT_TRUE(accepted->threadsafeSatisfied);
    // threadsafe exposes no symbols of its own
    EXPECT_EQ(accepted->symbolsExposed, (GroupSet{SymbolGroup::Core}));
}

TEST(ConflictResolverTest, UnrequestedThreadsafeStillSatisfies) {
    ConflictResolver resolver;
    auto plan = resolver.ResolveDynamic({}, Library({Capability::Threadsafe}));
    ASSERT_TRUE(plan.has_value());
    EXPECT_TRUE(plan->threadsafeSatisfied);

    auto serial = resolver.ResolveDynamic({}, Library({}));
    ASSERT_TRUE(serial.has_value());
    EXPECT_FALSE(serial->threadsafeSatisfied);
}

TEST(ConflictResolverTest, FirstMismatchInRegistryOrder) {
    ConflictResolver resolver;
    auto plan = resolver.ResolveDynamic({FeatureFlag::Deprecated, FeatureFlag::Hl}, Library({}));
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().flag, "hl");
}

TEST(ConflictResolverTest, ExposedGroupsAreBackedForEverySatisfiableRequest) {
    ConflictResolver resolver;
    CapabilitySet caps = {Capability::Hl, Capability::Zlib, Capability::Deprecated, Capability::Direct};
    NativeLibrary lib = Library(caps);
    GroupSet provided = resolver.ProvidedGroups(caps);

    usize resolved = 0;
    for (u32 mask = 0; mask < (1u << kAllFeatureFlags.size()); ++mask) {
        FlagSet flags = Subset(mask);
        flags.erase(FeatureFlag::Static);
        auto plan = resolver.ResolveDynamic(flags, lib);
        if (!plan) {
            EXPECT_EQ(plan.error().code, ErrorCode::CapabilityMismatch);
            continue;
        }
        ++resolved;
        EXPECT_TRUE(plan->Exposes(SymbolGroup::Core));
        EXPECT_TRUE(plan->Exposes(SymbolGroup::Direct));
        EXPECT_TRUE(std::includes(provided.begin(), provided.end(),
                                  plan->symbolsExposed.begin(), plan->symbolsExposed.end()));
    }
    // Subsets of {hl, zlib, deprecated}, each with and without static
    EXPECT_EQ(resolved, 16u);
}

TEST(ConflictResolverTest, StaticRequiresExactCapabilities) {
    ConflictResolver resolver;
    FlagSet flags = {FeatureFlag::Static, FeatureFlag::Hl, FeatureFlag::Deprecated};

    auto exact = resolver.ResolveStatic(flags, Library({Capability::Hl, Capability::Deprecated}));
    ASSERT_TRUE(exact.has_value()) << exact.error().Describe();
    EXPECT_EQ(exact->linkMode, LinkMode::Static);
    EXPECT_EQ(exact->symbolsExposed, (GroupSet{SymbolGroup::Core, SymbolGroup::Hl, SymbolGroup::Deprecated}));

    auto missing = resolver.ResolveStatic(flags, Library({Capability::Hl}));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().flag, "deprecated");
    EXPECT_NE(missing.error().message.find("did not produce"), String::npos);

    auto extra = resolver.ResolveStatic(flags, Library({Capability::Hl, Capability::Deprecated, Capability::Zlib}));
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().flag, "zlib");
    EXPECT_NE(extra.error().message.find("not requested"), String::npos);
}

TEST(ConflictResolverTest, StaticIgnoresCapabilitiesWithoutFlags) {
    ConflictResolver resolver;
    auto plan = resolver.ResolveStatic({FeatureFlag::Static}, Library({Capability::Stdbool, Capability::Direct}));
    ASSERT_TRUE(plan.has_value()) << plan.error().Describe();
    EXPECT_EQ(plan->symbolsExposed, (GroupSet{SymbolGroup::Core, SymbolGroup::Direct}));
}

TEST(ConflictResolverTest, UnsupportedVersions) {
    ConflictResolver resolver;
    for (Version version : {Version(1, 6, 10), Version(1, 8, 3), Version(1, 15, 0), Version(2, 0, 0)}) {
        auto plan = resolver.ResolveDynamic({}, Library({}, version));
        ASSERT_FALSE(plan.has_value()) << version.ToString();
        EXPECT_EQ(plan.error().code, ErrorCode::AbiVersionUnsupported);
        EXPECT_NE(plan.error().message.find(version.ToString()), String::npos);

        auto staticPlan = resolver.ResolveStatic({FeatureFlag::Static}, Library({}, version));
        ASSERT_FALSE(staticPlan.has_value());
        EXPECT_EQ(staticPlan.error().code, ErrorCode::AbiVersionUnsupported);
    }
}

TEST(ConflictResolverTest, VersionIsCheckedBeforeCapabilities) {
    ConflictResolver resolver;
    auto plan = resolver.ResolveDynamic({FeatureFlag::Mpio}, Library({}, {1, 6, 0}));
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, ErrorCode::AbiVersionUnsupported);
}

TEST(ConflictResolverTest, DynamicLibraryOrder) {
    ConflictResolver resolver;
    NativeLibrary lib = Library({Capability::Hl, Capability::Zlib});
    lib.hlLibraryName = "hdf5_serial_hl";
    lib.extraLibraries = {"sz", "z"};

    auto plan = resolver.ResolveDynamic({FeatureFlag::Hl, FeatureFlag::Zlib}, lib);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->libraries, (Vector<String>{"hdf5_serial_hl", "hdf5_serial"}));
    EXPECT_EQ(plan->includeDirs, (Vector<Path>{"/usr/include/hdf5/serial"}));
    EXPECT_EQ(plan->searchPaths, (Vector<Path>{"/usr/lib/x86_64-linux-gnu/hdf5/serial"}));
}

TEST(ConflictResolverTest, StaticLibraryOrder) {
    ConflictResolver resolver;
    NativeLibrary lib = Library({Capability::Hl, Capability::Zlib, Capability::Threadsafe});
    lib.libraryName = "hdf5";
    lib.hlLibraryName = "hdf5_hl";
    lib.extraLibraries = {"z", "dl", "m"};

    FlagSet flags = {FeatureFlag::Static, FeatureFlag::Hl, FeatureFlag::Zlib, FeatureFlag::Threadsafe};
    auto plan = resolver.ResolveStatic(flags, lib);
    ASSERT_TRUE(plan.has_value()) << plan.error().Describe();
    EXPECT_EQ(plan->libraries, (Vector<String>{"hdf5_hl", "hdf5", "pthread", "z", "dl", "m"}));
}
