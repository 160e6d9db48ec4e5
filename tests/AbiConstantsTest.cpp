#include <type_traits>

#include <hdf5.h>

#include "emit/DeclarationEmitter.hpp"
#include "gtest/gtest.h"
#include "probe/LinkedRuntime.hpp"

// ============================================================================
// Catalog values checked against the HDF5 headers this test is compiled with
// ============================================================================

using namespace h5bind;

namespace {

const Version kCompiled(H5_VERS_MAJOR, H5_VERS_MINOR, H5_VERS_RELEASE);

CapabilitySet CompiledCapabilities() {
    CapabilitySet caps;
#ifdef H5_HAVE_STDBOOL_H
    caps.insert(Capability::Stdbool);
#endif
    return caps;
}

i64 Constant(StringView name) {
    const Declaration* decl = SymbolCatalog::Default().Find(name, kCompiled);
    EXPECT_NE(decl, nullptr) << name;
    return decl ? decl->value : -12345;
}

i64 EnumValue(StringView name) {
    auto value = SymbolCatalog::Default().EnumeratorValue(name, kCompiled);
    EXPECT_TRUE(value.has_value()) << name;
    return value.value_or(-12345);
}

} // namespace

TEST(AbiConstantsTest, CompiledVersionIsSupported) {
    EXPECT_TRUE(IsSupportedVersion(kCompiled)) << kCompiled.ToString();
    EXPECT_EQ(LinkedRuntime::CompiledVersion(), kCompiled);
}

TEST(AbiConstantsTest, HidType) {
    const bool wide = StringView(DeclarationEmitter::HidType(kCompiled)) == "int64_t";
    EXPECT_EQ(sizeof(hid_t), wide ? sizeof(int64_t) : sizeof(int));
    EXPECT_TRUE(std::is_signed_v<hid_t>);
}

TEST(AbiConstantsTest, HboolType) {
    const bool isBool = DeclarationEmitter::HboolIsBool(kCompiled, CompiledCapabilities());
    EXPECT_EQ((std::is_same_v<hbool_t, bool>), isBool);
    if (!isBool) {
        EXPECT_TRUE((std::is_same_v<hbool_t, unsigned int>));
    }
}

TEST(AbiConstantsTest, FileAccessFlags) {
    EXPECT_EQ(static_cast<i64>(H5F_ACC_RDONLY), Constant("H5F_ACC_RDONLY"));
    EXPECT_EQ(static_cast<i64>(H5F_ACC_RDWR), Constant("H5F_ACC_RDWR"));
    EXPECT_EQ(static_cast<i64>(H5F_ACC_TRUNC), Constant("H5F_ACC_TRUNC"));
    EXPECT_EQ(static_cast<i64>(H5F_ACC_EXCL), Constant("H5F_ACC_EXCL"));
    EXPECT_EQ(static_cast<i64>(H5F_ACC_CREAT), Constant("H5F_ACC_CREAT"));
#ifdef H5F_ACC_SWMR_WRITE
    EXPECT_EQ(static_cast<i64>(H5F_ACC_SWMR_WRITE), Constant("H5F_ACC_SWMR_WRITE"));
    EXPECT_EQ(static_cast<i64>(H5F_ACC_SWMR_READ), Constant("H5F_ACC_SWMR_READ"));
#else
    EXPECT_EQ(SymbolCatalog::Default().Find("H5F_ACC_SWMR_WRITE", kCompiled), nullptr);
#endif
}

TEST(AbiConstantsTest, DefaultIdentifiersAndUnlimited) {
    EXPECT_EQ(static_cast<i64>(H5P_DEFAULT), Constant("H5P_DEFAULT"));
    EXPECT_EQ(static_cast<i64>(H5S_ALL), Constant("H5S_ALL"));
    EXPECT_EQ(static_cast<i64>(H5E_DEFAULT), Constant("H5E_DEFAULT"));
    EXPECT_EQ(H5S_UNLIMITED, static_cast<hsize_t>(Constant("H5S_UNLIMITED")));
}

TEST(AbiConstantsTest, IdentifierTypes) {
    EXPECT_EQ(H5I_BADID, EnumValue("H5I_BADID"));
    EXPECT_EQ(H5I_FILE, EnumValue("H5I_FILE"));
    EXPECT_EQ(H5I_DATASET, EnumValue("H5I_DATASET"));
    EXPECT_EQ(H5I_ATTR, EnumValue("H5I_ATTR"));
    EXPECT_EQ(H5I_VFL, EnumValue("H5I_VFL"));
    EXPECT_EQ(H5I_GENPROP_LST, EnumValue("H5I_GENPROP_LST"));
    EXPECT_EQ(H5I_ERROR_STACK, EnumValue("H5I_ERROR_STACK"));
    EXPECT_EQ(H5I_NTYPES, EnumValue("H5I_NTYPES"));
}

TEST(AbiConstantsTest, OtherEnumerations) {
    EXPECT_EQ(H5S_NO_CLASS, EnumValue("H5S_NO_CLASS"));
    EXPECT_EQ(H5S_SIMPLE, EnumValue("H5S_SIMPLE"));
    EXPECT_EQ(H5S_NULL, EnumValue("H5S_NULL"));
    EXPECT_EQ(H5F_SCOPE_GLOBAL, EnumValue("H5F_SCOPE_GLOBAL"));
    EXPECT_EQ(H5_INDEX_CRT_ORDER, EnumValue("H5_INDEX_CRT_ORDER"));
    EXPECT_EQ(H5_ITER_NATIVE, EnumValue("H5_ITER_NATIVE"));
    EXPECT_EQ(H5T_INTEGER, EnumValue("H5T_INTEGER"));
    EXPECT_EQ(H5T_ARRAY, EnumValue("H5T_ARRAY"));
    EXPECT_EQ(H5T_NCLASSES, EnumValue("H5T_NCLASSES"));
}

TEST(AbiConstantsTest, DeflateFilterIdentifier) {
    EXPECT_EQ(H5Z_FILTER_DEFLATE, Constant("H5Z_FILTER_DEFLATE"));
}

TEST(AbiConstantsTest, EncodeVariantMatchesHeaders) {
    const auto& catalog = SymbolCatalog::Default();
#if H5_VERS_MAJOR > 1 || (H5_VERS_MAJOR == 1 && H5_VERS_MINOR >= 12)
    EXPECT_NE(catalog.Find("H5Sencode2", kCompiled), nullptr);
    EXPECT_EQ(catalog.Find("H5Sencode", kCompiled), nullptr);
#else
    EXPECT_NE(catalog.Find("H5Sencode", kCompiled), nullptr);
    EXPECT_EQ(catalog.Find("H5Sencode2", kCompiled), nullptr);
#endif
}

TEST(AbiConstantsTest, LinkedRuntimeMatchesHeaders) {
    auto runtime = LinkedRuntime::Query();
    ASSERT_TRUE(runtime.has_value()) << runtime.error().Describe();
    EXPECT_EQ(runtime->caps.version, kCompiled);
    EXPECT_EQ(runtime->discoveredBy, "linked runtime");
    EXPECT_FALSE(runtime->caps.Has(Capability::Hl));
#ifdef H5_HAVE_FILTER_DEFLATE
    EXPECT_TRUE(runtime->caps.Has(Capability::Zlib));
#endif
#ifdef H5_HAVE_PARALLEL
    EXPECT_TRUE(runtime->caps.Has(Capability::Mpio));
#else
    EXPECT_FALSE(runtime->caps.Has(Capability::Mpio));
#endif
}

TEST(AbiConstantsTest, LinkedRuntimeThreadsafetyMatchesLibrary) {
    auto runtime = LinkedRuntime::Query();
    ASSERT_TRUE(runtime.has_value()) << runtime.error().Describe();
#if H5_VERS_MAJOR > 1 || (H5_VERS_MAJOR == 1 && (H5_VERS_MINOR > 8 || \
                                                 (H5_VERS_MINOR == 8 && H5_VERS_RELEASE >= 16)))
    hbool_t threadsafe = 0;
    ASSERT_GE(H5is_library_threadsafe(&threadsafe), 0);
    EXPECT_EQ(runtime->caps.Has(Capability::Threadsafe), threadsafe != 0);
#elif defined(H5_HAVE_THREADSAFE)
    EXPECT_TRUE(runtime->caps.Has(Capability::Threadsafe));
#else
    EXPECT_FALSE(runtime->caps.Has(Capability::Threadsafe));
#endif
}
