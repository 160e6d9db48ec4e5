#include "gtest/gtest.h"
#include "probe/HeaderParser.hpp"

using namespace h5bind;

namespace {

// Trimmed copy of a Debian serial build's H5pubconf.h
constexpr const char* kSerialPubconf = R"(/* src/H5pubconf.h.  Generated from H5config.h.in by configure.  */
/* Define if building universal (internal helper macro) */
/* #undef H5_AC_APPLE_UNIVERSAL_BUILD */
#define H5_HAVE_ATTRIBUTE 1
/* #undef H5_HAVE_DIRECT */
#define H5_HAVE_FILTER_DEFLATE 1
/* #undef H5_HAVE_PARALLEL */
#define H5_HAVE_STDBOOL_H 1
#define H5_HAVE_THREADSAFE 1
/* #undef H5_NO_DEPRECATED_SYMBOLS */
#define H5_VERSION "1.10.8"
)";

constexpr const char* kH5public = R"(
#define H5_VERS_MAJOR   1 /* For major interface/format changes */
#define H5_VERS_MINOR   12 /* For minor interface/format changes */
#define H5_VERS_RELEASE 2 /* For tweaks, bug-fixes, or development */
#define H5_VERS_SUBRELEASE "" /* For pre-releases like snap0 */
#define H5_VERS_INFO    "HDF5 library version: 1.12.2"
)";

} // namespace

TEST(HeaderParserTest, DefinedMacrosSkipUndefComments) {
    auto macros = HeaderParser::DefinedMacros(kSerialPubconf);
    EXPECT_TRUE(macros.contains("H5_HAVE_THREADSAFE"));
    EXPECT_TRUE(macros.contains("H5_VERSION"));
    EXPECT_FALSE(macros.contains("H5_HAVE_PARALLEL"));
    EXPECT_FALSE(macros.contains("H5_NO_DEPRECATED_SYMBOLS"));
}

TEST(HeaderParserTest, DefinedMacrosHandleIndentedAndFunctionLike) {
    auto macros = HeaderParser::DefinedMacros("#  define H5_A 1\n#define H5_B(x) (x)\n#defineX\n");
    EXPECT_TRUE(macros.contains("H5_A"));
    EXPECT_TRUE(macros.contains("H5_B"));
    EXPECT_EQ(macros.size(), 2u);
}

TEST(HeaderParserTest, VersionFromPublicHeader) {
    auto version = HeaderParser::ParseVersion(kH5public, "H5public.h");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(*version, Version(1, 12, 2));
}

TEST(HeaderParserTest, MissingVersionIsProbeParseError) {
    auto version = HeaderParser::ParseVersion("#define H5_VERS_MAJOR 1\n", "/opt/hdf5/include/H5public.h");
    ASSERT_FALSE(version.has_value());
    EXPECT_EQ(version.error().code, ErrorCode::ProbeParseError);
    EXPECT_NE(version.error().message.find("/opt/hdf5/include/H5public.h"), String::npos);
}

TEST(HeaderParserTest, ConfigVersion) {
    EXPECT_EQ(HeaderParser::ParseConfigVersion(kSerialPubconf), Version(1, 10, 8));
    EXPECT_FALSE(HeaderParser::ParseConfigVersion("#define H5_HAVE_ZLIB_H 1\n").has_value());
}

TEST(HeaderParserTest, CapabilitiesFromPubconf) {
    auto caps = HeaderParser::ParseCapabilities(kSerialPubconf, "H5pubconf.h");
    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(*caps, (CapabilitySet{Capability::Threadsafe, Capability::Zlib,
                                    Capability::Deprecated, Capability::Stdbool}));
}

TEST(HeaderParserTest, NoDeprecatedSymbolsRemovesCapability) {
    auto caps = HeaderParser::ParseCapabilities(
        "#define H5_HAVE_PARALLEL 1\n#define H5_NO_DEPRECATED_SYMBOLS 1\n#define H5_HAVE_DIRECT 1\n", "H5pubconf.h");
    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(*caps, (CapabilitySet{Capability::Mpio, Capability::Direct}));
}

TEST(HeaderParserTest, HeaderWithoutConfigMacrosIsRejected) {
    auto caps = HeaderParser::ParseCapabilities("/* empty */\n", "H5pubconf.h");
    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error().code, ErrorCode::ProbeParseError);
}

TEST(HeaderParserTest, SettingsAndLibraryList) {
    auto settings = HeaderParser::ParseSettings(
        "\t    SUMMARY OF THE HDF5 CONFIGURATION\n"
        "           Extra libraries: -lcrypto -lcurl -lsz -lz -ldl -lm \n"
        "       Parallel HDF5: no\n");
    ASSERT_TRUE(settings.contains("Extra libraries"));
    EXPECT_EQ(settings["Parallel HDF5"], "no");
    EXPECT_EQ(HeaderParser::ParseLibraryList(settings["Extra libraries"]),
              (Vector<String>{"crypto", "curl", "sz", "z", "dl", "m"}));
    EXPECT_TRUE(HeaderParser::ParseLibraryList("-L/usr/lib -l").empty());
}
