#pragma once

#include "emit/SymbolCatalog.hpp"
#include "resolve/LinkagePlan.hpp"

// ============================================================================
// DeclarationEmitter - turn a LinkagePlan into build artifacts
// ============================================================================
//   h5bind_decls.h      C declarations of the exposed symbol groups
//   h5bind_link.cmake   CMake variables describing the link
//   h5bind_link.flags   compiler/linker flags on one line
//
// Emission is a pure function of the plan and the catalog.
// ============================================================================

namespace h5bind {

struct EmittedArtifacts {
    String header;
    String cmake;
    String flags;
};

class HB_API DeclarationEmitter {
public:
    explicit DeclarationEmitter(const SymbolCatalog& catalog = SymbolCatalog::Default());

    EmittedArtifacts Emit(const LinkagePlan& plan) const;

    String EmitHeader(const LinkagePlan& plan) const;
    static String EmitCMake(const LinkagePlan& plan);
    static String EmitFlags(const LinkagePlan& plan);

    /// Symbol groups declared by an emitted header (H5BIND_GROUP_* macros)
    static GroupSet ParseEmittedGroups(StringView header);

    /// C type behind hid_t: 64-bit since 1.10, int before
    static const char* HidType(const Version& version);

    /// hbool_t is C99 bool from 1.14 on, and from 1.10 on when the native
    /// build had <stdbool.h>; unsigned int otherwise
    static bool HboolIsBool(const Version& version, const CapabilitySet& caps);

private:
    const SymbolCatalog& m_Catalog;
};

} // namespace h5bind
