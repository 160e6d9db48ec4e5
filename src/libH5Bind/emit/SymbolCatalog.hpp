#pragma once

#include "features/FeatureTypes.hpp"
#include "probe/Version.hpp"

// ============================================================================
// SymbolCatalog - the HDF5 C API slice H5Bind knows how to declare
// ============================================================================
// Every declaration belongs to one symbol group and exists for a half-open
// range of native versions. Declarations with the same name in disjoint
// ranges describe an API that changed shape between releases.
//
// hid_t and hbool_t are not in the catalog; DeclarationEmitter chooses them
// from the version and the stdbool capability.
// ============================================================================

namespace h5bind {

enum class DeclKind : u8 {
    Include,    // #include line needed by the group
    Typedef,
    Enum,
    Constant,   // object-like macro
    Global,     // extern variable
    Function
};

/// [since, until) - either end may be open
struct VersionRange {
    Optional<Version> since;
    Optional<Version> until;

    bool Contains(const Version& version) const;
    bool IsUnbounded() const { return !since && !until; }

    /// "since 1.10.0", "before 1.12.0", "1.10.0 to 1.12.0"
    String ToString() const;
};

struct Enumerator {
    String name;
    i64 value;
};

struct Declaration {
    DeclKind kind;
    SymbolGroup group;
    String name;

    /// Include/Typedef/Global/Function: the complete C text.
    /// Constant: the macro replacement text.
    String text;

    /// Constant only
    i64 value = 0;

    /// Enum only
    Vector<Enumerator> enumerators;

    VersionRange range;
};

class HB_API SymbolCatalog {
public:
    explicit SymbolCatalog(Vector<Declaration> declarations);

    /// The built-in HDF5 catalog
    static const SymbolCatalog& Default();

    /// Declarations of one group that exist in `version`, in catalog order
    Vector<const Declaration*> Select(SymbolGroup group, const Version& version) const;

    /// The variant of `name` that exists in `version`
    const Declaration* Find(StringView name, const Version& version) const;

    /// Value of an enumerator (searched across all enums) in `version`
    Optional<i64> EnumeratorValue(StringView name, const Version& version) const;

    const Vector<Declaration>& All() const { return m_Declarations; }

private:
    Vector<Declaration> m_Declarations;
};

} // namespace h5bind
