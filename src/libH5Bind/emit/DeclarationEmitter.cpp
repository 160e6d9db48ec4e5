#include "DeclarationEmitter.hpp"
#include "core/Log.hpp"
#include "probe/HeaderParser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace h5bind {

namespace {

constexpr const char* kGroupMacroPrefix = "H5BIND_GROUP_";

String ToUpper(StringView text) {
    String out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

String ToLower(StringView text) {
    String out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Libraries that belong to the native HDF5 build (linked statically under
// static linkage); everything else is a system library
bool IsNativeLibrary(StringView name) {
    return name.substr(0, 4) == "hdf5";
}

void WriteDeclaration(std::ostream& out, const Declaration& decl) {
    if (!decl.range.IsUnbounded()) {
        out << "/* " << decl.range.ToString() << " */\n";
    }

    switch (decl.kind) {
        case DeclKind::Include:
            break;
        case DeclKind::Constant:
            out << "#define " << decl.name << " " << decl.text << "\n";
            break;
        case DeclKind::Enum:
            out << "typedef enum " << decl.name << " {\n";
            for (usize i = 0; i < decl.enumerators.size(); ++i) {
                const auto& e = decl.enumerators[i];
                out << "    " << e.name << " = " << e.value
                    << (i + 1 < decl.enumerators.size() ? ",\n" : "\n");
            }
            out << "} " << decl.name << ";\n";
            break;
        case DeclKind::Typedef:
        case DeclKind::Global:
        case DeclKind::Function:
            out << decl.text << "\n";
            break;
    }
}

String CMakeList(const Vector<String>& items) {
    String out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ';';
        }
        out += item;
    }
    return out;
}

Vector<String> PathStrings(const Vector<Path>& paths) {
    Vector<String> out;
    for (const auto& path : paths) {
        out.push_back(path.string());
    }
    return out;
}

} // namespace

DeclarationEmitter::DeclarationEmitter(const SymbolCatalog& catalog)
    : m_Catalog(catalog)
{
}

const char* DeclarationEmitter::HidType(const Version& version) {
    return version >= Version(1, 10, 0) ? "int64_t" : "int";
}

bool DeclarationEmitter::HboolIsBool(const Version& version, const CapabilitySet& caps) {
    if (version >= Version(1, 14, 0)) {
        return true;
    }
    return version >= Version(1, 10, 0) && caps.contains(Capability::Stdbool);
}

EmittedArtifacts DeclarationEmitter::Emit(const LinkagePlan& plan) const {
    EmittedArtifacts artifacts;
    artifacts.header = EmitHeader(plan);
    artifacts.cmake = EmitCMake(plan);
    artifacts.flags = EmitFlags(plan);
    return artifacts;
}

// ============================================================================
// Header
// ============================================================================

String DeclarationEmitter::EmitHeader(const LinkagePlan& plan) const {
    const Version& version = plan.native.version;
    const CapabilitySet& caps = plan.native.capabilities;
    const bool hboolIsBool = HboolIsBool(version, caps);

    std::ostringstream out;
    out << "/* Generated by h5bind-resolve. Do not edit. */\n";
    out << "/* HDF5 " << version.ToString() << ", " << LinkModeName(plan.linkMode) << " linkage";
    if (!plan.features.empty()) {
        out << ", features: " << JoinFlagNames(plan.features);
    }
    out << " */\n\n";

    out << "#ifndef H5BIND_DECLS_H\n";
    out << "#define H5BIND_DECLS_H\n\n";

    out << "#include <stddef.h>\n";
    out << "#include <stdint.h>\n";
    if (hboolIsBool) {
        out << "#ifndef __cplusplus\n#include <stdbool.h>\n#endif\n";
    }
    for (SymbolGroup group : kAllSymbolGroups) {
        if (!plan.Exposes(group)) {
            continue;
        }
        for (const Declaration* decl : m_Catalog.Select(group, version)) {
            if (decl->kind == DeclKind::Include) {
                out << decl->text << "\n";
            }
        }
    }
    out << "\n";

    out << "#define H5BIND_HDF5_VERSION_MAJOR " << version.majnum << "\n";
    out << "#define H5BIND_HDF5_VERSION_MINOR " << version.minnum << "\n";
    out << "#define H5BIND_HDF5_VERSION_RELEASE " << version.relnum << "\n";
    out << "#define H5BIND_HDF5_VERSION_STRING \"" << version.ToString() << "\"\n\n";

    out << "#define H5BIND_LINK_STATIC " << (plan.linkMode == LinkMode::Static ? 1 : 0) << "\n";
    out << "#define H5BIND_THREADSAFE_SATISFIED " << (plan.threadsafeSatisfied ? 1 : 0) << "\n";
    out << "/* Without a threadsafe native library every call must be serialized */\n";
    out << "#define H5BIND_REQUIRES_CALL_SERIALIZATION " << (plan.threadsafeSatisfied ? 0 : 1) << "\n\n";

    out << "#define H5BIND_HAVE_PARALLEL " << (caps.contains(Capability::Mpio) ? 1 : 0) << "\n";
    out << "#define H5BIND_HAVE_THREADSAFE " << (caps.contains(Capability::Threadsafe) ? 1 : 0) << "\n";
    out << "#define H5BIND_HAVE_DIRECT " << (caps.contains(Capability::Direct) ? 1 : 0) << "\n";
    out << "#define H5BIND_HAVE_STDBOOL " << (caps.contains(Capability::Stdbool) ? 1 : 0) << "\n\n";

    for (const Version& release : KnownReleases()) {
        if (release <= version) {
            out << "#define H5BIND_HDF5_" << release.ToMacroSuffix() << " 1\n";
        }
    }
    out << "\n";

    for (SymbolGroup group : kAllSymbolGroups) {
        if (plan.Exposes(group)) {
            out << "#define " << kGroupMacroPrefix << ToUpper(SymbolGroupName(group)) << " 1\n";
        }
    }
    out << "\n";

    out << "#ifdef __cplusplus\nextern \"C\" {\n#endif\n\n";

    out << "typedef " << HidType(version) << " hid_t;\n";
    out << "typedef " << (hboolIsBool ? "bool" : "unsigned int") << " hbool_t;\n";

    usize declared = 0;
    for (SymbolGroup group : kAllSymbolGroups) {
        if (!plan.Exposes(group)) {
            continue;
        }
        out << "\n/* ---- " << SymbolGroupName(group) << " ---- */\n";
        for (const Declaration* decl : m_Catalog.Select(group, version)) {
            if (decl->kind == DeclKind::Include) {
                continue;
            }
            WriteDeclaration(out, *decl);
            ++declared;
        }
    }

    out << "\n#ifdef __cplusplus\n}\n#endif\n\n";
    out << "#endif /* H5BIND_DECLS_H */\n";

    HB_LOG_DEBUG("Emitted {} declarations for HDF5 {} in groups [{}]",
                 declared, version.ToString(), JoinGroupNames(plan.symbolsExposed));
    return out.str();
}

GroupSet DeclarationEmitter::ParseEmittedGroups(StringView header) {
    const StringView prefix = kGroupMacroPrefix;
    GroupSet groups;
    for (const auto& macro : HeaderParser::DefinedMacros(header)) {
        if (StringView(macro).substr(0, prefix.size()) != prefix) {
            continue;
        }
        if (auto group = SymbolGroupFromName(ToLower(StringView(macro).substr(prefix.size())))) {
            groups.insert(*group);
        } else {
            HB_LOG_WARN("Unknown symbol group macro {}", macro);
        }
    }
    return groups;
}

// ============================================================================
// Link descriptions
// ============================================================================

String DeclarationEmitter::EmitCMake(const LinkagePlan& plan) {
    Vector<String> groups;
    for (SymbolGroup group : plan.symbolsExposed) {
        groups.emplace_back(SymbolGroupName(group));
    }
    Vector<String> features;
    for (FeatureFlag flag : plan.features) {
        features.emplace_back(FeatureFlagName(flag));
    }

    std::ostringstream out;
    out << "# Generated by h5bind-resolve. Do not edit.\n";
    out << "set(H5BIND_LINK_MODE \"" << LinkModeName(plan.linkMode) << "\")\n";
    out << "set(H5BIND_HDF5_VERSION \"" << plan.native.version.ToString() << "\")\n";
    out << "set(H5BIND_FEATURES \"" << CMakeList(features) << "\")\n";
    out << "set(H5BIND_INCLUDE_DIRS \"" << CMakeList(PathStrings(plan.includeDirs)) << "\")\n";
    out << "set(H5BIND_LIBRARY_DIRS \"" << CMakeList(PathStrings(plan.searchPaths)) << "\")\n";
    out << "set(H5BIND_LIBRARIES \"" << CMakeList(plan.libraries) << "\")\n";
    out << "set(H5BIND_SYMBOL_GROUPS \"" << CMakeList(groups) << "\")\n";
    out << "set(H5BIND_THREADSAFE_SATISFIED " << (plan.threadsafeSatisfied ? "ON" : "OFF") << ")\n";
    return out.str();
}

String DeclarationEmitter::EmitFlags(const LinkagePlan& plan) {
    Vector<String> flags;
    for (const auto& dir : plan.includeDirs) {
        flags.push_back("-I" + dir.string());
    }
    for (const auto& dir : plan.searchPaths) {
        flags.push_back("-L" + dir.string());
        if (plan.linkMode == LinkMode::Dynamic) {
            flags.push_back("-Wl,-rpath," + dir.string());
        }
    }

    if (plan.linkMode == LinkMode::Static) {
        flags.emplace_back("-Wl,-Bstatic");
        for (const auto& lib : plan.libraries) {
            if (IsNativeLibrary(lib)) {
                flags.push_back("-l" + lib);
            }
        }
        flags.emplace_back("-Wl,-Bdynamic");
        for (const auto& lib : plan.libraries) {
            if (!IsNativeLibrary(lib)) {
                flags.push_back("-l" + lib);
            }
        }
    } else {
        for (const auto& lib : plan.libraries) {
            flags.push_back("-l" + lib);
        }
    }

    String line;
    for (const auto& flag : flags) {
        if (!line.empty()) {
            line += ' ';
        }
        line += flag;
    }
    return line + "\n";
}

} // namespace h5bind
