#include "SymbolCatalog.hpp"

namespace h5bind {

// ============================================================================
// VersionRange
// ============================================================================

bool VersionRange::Contains(const Version& version) const {
    if (since && version < *since) {
        return false;
    }
    if (until && version >= *until) {
        return false;
    }
    return true;
}

String VersionRange::ToString() const {
    if (since && until) {
        return since->ToString() + " to " + until->ToString();
    }
    if (since) {
        return "since " + since->ToString();
    }
    if (until) {
        return "before " + until->ToString();
    }
    return "all versions";
}

// ============================================================================
// Catalog table
// ============================================================================

namespace {

constexpr SymbolGroup kCore = SymbolGroup::Core;
constexpr SymbolGroup kMpio = SymbolGroup::Mpio;
constexpr SymbolGroup kHl = SymbolGroup::Hl;
constexpr SymbolGroup kZlib = SymbolGroup::Zlib;
constexpr SymbolGroup kDeprecated = SymbolGroup::Deprecated;
constexpr SymbolGroup kDirect = SymbolGroup::Direct;

VersionRange Since(u32 maj, u32 min, u32 rel) {
    return {Version(maj, min, rel), std::nullopt};
}

VersionRange Until(u32 maj, u32 min, u32 rel) {
    return {std::nullopt, Version(maj, min, rel)};
}

VersionRange Between(Version since, Version until) {
    return {since, until};
}

Declaration Include(SymbolGroup group, String header) {
    return {DeclKind::Include, group, header, "#include <" + header + ">", 0, {}, {}};
}

Declaration Typedef(SymbolGroup group, String name, String text, VersionRange range = {}) {
    return {DeclKind::Typedef, group, std::move(name), std::move(text), 0, {}, range};
}

Declaration Enum(SymbolGroup group, String name, Vector<Enumerator> enumerators, VersionRange range = {}) {
    return {DeclKind::Enum, group, std::move(name), {}, 0, std::move(enumerators), range};
}

Declaration Constant(SymbolGroup group, String name, String text, i64 value, VersionRange range = {}) {
    return {DeclKind::Constant, group, std::move(name), std::move(text), value, {}, range};
}

Declaration Global(SymbolGroup group, String type, String name, VersionRange range = {}) {
    String text = "extern " + type + " " + name + ";";
    return {DeclKind::Global, group, std::move(name), std::move(text), 0, {}, range};
}

Declaration Function(SymbolGroup group, String ret, String name, String params, VersionRange range = {}) {
    String text = ret + " " + name + "(" + params + ");";
    return {DeclKind::Function, group, std::move(name), std::move(text), 0, {}, range};
}

// Macro aliasing a property-list class or datatype global
Declaration GlobalAlias(SymbolGroup group, String name, const String& global, VersionRange range = {}) {
    return Constant(group, std::move(name), "(" + global + ")", 0, range);
}

Vector<Declaration> BuildCatalog() {
    const Version v1_12_0(1, 12, 0);
    const Version v1_13_0(1, 13, 0);

    Vector<Declaration> d;

    // ------------------------------------------------------------------------
    // core: types
    // ------------------------------------------------------------------------
    d.push_back(Typedef(kCore, "herr_t", "typedef int herr_t;"));
    d.push_back(Typedef(kCore, "htri_t", "typedef int htri_t;"));
    d.push_back(Typedef(kCore, "hsize_t", "typedef uint64_t hsize_t;"));
    d.push_back(Typedef(kCore, "hssize_t", "typedef int64_t hssize_t;"));
    d.push_back(Typedef(kCore, "haddr_t", "typedef uint64_t haddr_t;"));
    d.push_back(Typedef(kCore, "H5E_auto2_t",
                        "typedef herr_t (*H5E_auto2_t)(hid_t estack, void *client_data);"));

    d.push_back(Enum(kCore, "H5S_class_t", {
        {"H5S_NO_CLASS", -1}, {"H5S_SCALAR", 0}, {"H5S_SIMPLE", 1}, {"H5S_NULL", 2},
    }));
    d.push_back(Enum(kCore, "H5F_scope_t", {
        {"H5F_SCOPE_LOCAL", 0}, {"H5F_SCOPE_GLOBAL", 1},
    }));
    d.push_back(Enum(kCore, "H5_index_t", {
        {"H5_INDEX_UNKNOWN", -1}, {"H5_INDEX_NAME", 0}, {"H5_INDEX_CRT_ORDER", 1}, {"H5_INDEX_N", 2},
    }));
    d.push_back(Enum(kCore, "H5_iter_order_t", {
        {"H5_ITER_UNKNOWN", -1}, {"H5_ITER_INC", 0}, {"H5_ITER_DEC", 1},
        {"H5_ITER_NATIVE", 2}, {"H5_ITER_N", 3},
    }));
    d.push_back(Enum(kCore, "H5T_class_t", {
        {"H5T_NO_CLASS", -1}, {"H5T_INTEGER", 0}, {"H5T_FLOAT", 1}, {"H5T_TIME", 2},
        {"H5T_STRING", 3}, {"H5T_BITFIELD", 4}, {"H5T_OPAQUE", 5}, {"H5T_COMPOUND", 6},
        {"H5T_REFERENCE", 7}, {"H5T_ENUM", 8}, {"H5T_VLEN", 9}, {"H5T_ARRAY", 10},
        {"H5T_NCLASSES", 11},
    }));

    // Identifier types were renumbered when maps and VOL connectors arrived
    d.push_back(Enum(kCore, "H5I_type_t", {
        {"H5I_UNINIT", -2}, {"H5I_BADID", -1}, {"H5I_FILE", 1}, {"H5I_GROUP", 2},
        {"H5I_DATATYPE", 3}, {"H5I_DATASPACE", 4}, {"H5I_DATASET", 5}, {"H5I_ATTR", 6},
        {"H5I_REFERENCE", 7}, {"H5I_VFL", 8}, {"H5I_GENPROP_CLS", 9}, {"H5I_GENPROP_LST", 10},
        {"H5I_ERROR_CLASS", 11}, {"H5I_ERROR_MSG", 12}, {"H5I_ERROR_STACK", 13},
        {"H5I_NTYPES", 14},
    }, Until(1, 12, 0)));
    d.push_back(Enum(kCore, "H5I_type_t", {
        {"H5I_UNINIT", -2}, {"H5I_BADID", -1}, {"H5I_FILE", 1}, {"H5I_GROUP", 2},
        {"H5I_DATATYPE", 3}, {"H5I_DATASPACE", 4}, {"H5I_DATASET", 5}, {"H5I_MAP", 6},
        {"H5I_ATTR", 7}, {"H5I_VFL", 8}, {"H5I_VOL", 9}, {"H5I_GENPROP_CLS", 10},
        {"H5I_GENPROP_LST", 11}, {"H5I_ERROR_CLASS", 12}, {"H5I_ERROR_MSG", 13},
        {"H5I_ERROR_STACK", 14}, {"H5I_SPACE_SEL_ITER", 15}, {"H5I_NTYPES", 16},
    }, Between(v1_12_0, v1_13_0)));
    d.push_back(Enum(kCore, "H5I_type_t", {
        {"H5I_UNINIT", -2}, {"H5I_BADID", -1}, {"H5I_FILE", 1}, {"H5I_GROUP", 2},
        {"H5I_DATATYPE", 3}, {"H5I_DATASPACE", 4}, {"H5I_DATASET", 5}, {"H5I_MAP", 6},
        {"H5I_ATTR", 7}, {"H5I_VFL", 8}, {"H5I_VOL", 9}, {"H5I_GENPROP_CLS", 10},
        {"H5I_GENPROP_LST", 11}, {"H5I_ERROR_CLASS", 12}, {"H5I_ERROR_MSG", 13},
        {"H5I_ERROR_STACK", 14}, {"H5I_SPACE_SEL_ITER", 15}, {"H5I_EVENTSET", 16},
        {"H5I_NTYPES", 17},
    }, Since(1, 13, 0)));

    // ------------------------------------------------------------------------
    // core: constants
    // ------------------------------------------------------------------------
    d.push_back(Constant(kCore, "H5F_ACC_RDONLY", "0x0000u", 0x0000));
    d.push_back(Constant(kCore, "H5F_ACC_RDWR", "0x0001u", 0x0001));
    d.push_back(Constant(kCore, "H5F_ACC_TRUNC", "0x0002u", 0x0002));
    d.push_back(Constant(kCore, "H5F_ACC_EXCL", "0x0004u", 0x0004));
    d.push_back(Constant(kCore, "H5F_ACC_CREAT", "0x0010u", 0x0010));
    d.push_back(Constant(kCore, "H5F_ACC_SWMR_WRITE", "0x0020u", 0x0020, Since(1, 10, 0)));
    d.push_back(Constant(kCore, "H5F_ACC_SWMR_READ", "0x0040u", 0x0040, Since(1, 10, 0)));
    d.push_back(Constant(kCore, "H5P_DEFAULT", "((hid_t)0)", 0));
    d.push_back(Constant(kCore, "H5S_ALL", "((hid_t)0)", 0));
    d.push_back(Constant(kCore, "H5E_DEFAULT", "((hid_t)0)", 0));
    d.push_back(Constant(kCore, "H5S_UNLIMITED", "((hsize_t)(-1))", -1));

    // ------------------------------------------------------------------------
    // core: globals (valid only after H5open())
    // ------------------------------------------------------------------------
    const char* propertyClasses[] = {"FILE_CREATE", "FILE_ACCESS", "DATASET_CREATE", "DATASET_XFER"};
    for (const char* cls : propertyClasses) {
        String modern = String("H5P_CLS_") + cls + "_ID_g";
        String legacy = String("H5P_CLS_") + cls + "_g";
        d.push_back(Global(kCore, "hid_t", legacy, Until(1, 10, 0)));
        d.push_back(Global(kCore, "hid_t", modern, Since(1, 10, 0)));
        d.push_back(GlobalAlias(kCore, String("H5P_") + cls, legacy, Until(1, 10, 0)));
        d.push_back(GlobalAlias(kCore, String("H5P_") + cls, modern, Since(1, 10, 0)));
    }

    const char* datatypes[] = {
        "H5T_NATIVE_UCHAR", "H5T_NATIVE_INT", "H5T_NATIVE_UINT", "H5T_NATIVE_LLONG",
        "H5T_NATIVE_FLOAT", "H5T_NATIVE_DOUBLE", "H5T_STD_I32LE", "H5T_IEEE_F64LE", "H5T_C_S1",
    };
    for (const char* type : datatypes) {
        String global = String(type) + "_g";
        d.push_back(Global(kCore, "hid_t", global));
        d.push_back(GlobalAlias(kCore, type, global));
    }

    // ------------------------------------------------------------------------
    // core: functions
    // ------------------------------------------------------------------------
    d.push_back(Function(kCore, "herr_t", "H5open", "void"));
    d.push_back(Function(kCore, "herr_t", "H5close", "void"));
    d.push_back(Function(kCore, "herr_t", "H5get_libversion", "unsigned *majnum, unsigned *minnum, unsigned *relnum"));
    d.push_back(Function(kCore, "herr_t", "H5check_version", "unsigned majnum, unsigned minnum, unsigned relnum"));
    d.push_back(Function(kCore, "herr_t", "H5free_memory", "void *mem", Since(1, 8, 13)));
    d.push_back(Function(kCore, "herr_t", "H5is_library_threadsafe", "hbool_t *is_ts", Since(1, 8, 16)));

    d.push_back(Function(kCore, "herr_t", "H5Eset_auto2", "hid_t estack_id, H5E_auto2_t func, void *client_data"));
    d.push_back(Function(kCore, "H5I_type_t", "H5Iget_type", "hid_t id"));

    d.push_back(Function(kCore, "hid_t", "H5Fcreate", "const char *filename, unsigned flags, hid_t fcpl_id, hid_t fapl_id"));
    d.push_back(Function(kCore, "hid_t", "H5Fopen", "const char *filename, unsigned flags, hid_t fapl_id"));
    d.push_back(Function(kCore, "herr_t", "H5Fflush", "hid_t object_id, H5F_scope_t scope"));
    d.push_back(Function(kCore, "herr_t", "H5Fclose", "hid_t file_id"));
    d.push_back(Function(kCore, "herr_t", "H5Fstart_swmr_write", "hid_t file_id", Since(1, 10, 0)));

    d.push_back(Function(kCore, "hid_t", "H5Gcreate2", "hid_t loc_id, const char *name, hid_t lcpl_id, hid_t gcpl_id, hid_t gapl_id"));
    d.push_back(Function(kCore, "hid_t", "H5Gopen2", "hid_t loc_id, const char *name, hid_t gapl_id"));
    d.push_back(Function(kCore, "herr_t", "H5Gclose", "hid_t group_id"));

    d.push_back(Function(kCore, "hid_t", "H5Dcreate2", "hid_t loc_id, const char *name, hid_t type_id, hid_t space_id, hid_t lcpl_id, hid_t dcpl_id, hid_t dapl_id"));
    d.push_back(Function(kCore, "hid_t", "H5Dopen2", "hid_t loc_id, const char *name, hid_t dapl_id"));
    d.push_back(Function(kCore, "herr_t", "H5Dread", "hid_t dset_id, hid_t mem_type_id, hid_t mem_space_id, hid_t file_space_id, hid_t dxpl_id, void *buf"));
    d.push_back(Function(kCore, "herr_t", "H5Dwrite", "hid_t dset_id, hid_t mem_type_id, hid_t mem_space_id, hid_t file_space_id, hid_t dxpl_id, const void *buf"));
    d.push_back(Function(kCore, "hid_t", "H5Dget_space", "hid_t dset_id"));
    d.push_back(Function(kCore, "hid_t", "H5Dget_type", "hid_t dset_id"));
    d.push_back(Function(kCore, "herr_t", "H5Dread_chunk", "hid_t dset_id, hid_t dxpl_id, const hsize_t *offset, uint32_t *filters, void *buf", Since(1, 10, 3)));
    d.push_back(Function(kCore, "herr_t", "H5Dclose", "hid_t dset_id"));

    d.push_back(Function(kCore, "hid_t", "H5Screate", "H5S_class_t type"));
    d.push_back(Function(kCore, "hid_t", "H5Screate_simple", "int rank, const hsize_t dims[], const hsize_t maxdims[]"));
    d.push_back(Function(kCore, "int", "H5Sget_simple_extent_ndims", "hid_t space_id"));
    d.push_back(Function(kCore, "int", "H5Sget_simple_extent_dims", "hid_t space_id, hsize_t dims[], hsize_t maxdims[]"));
    d.push_back(Function(kCore, "herr_t", "H5Sencode", "hid_t obj_id, void *buf, size_t *nalloc", Until(1, 12, 0)));
    d.push_back(Function(kCore, "herr_t", "H5Sencode2", "hid_t obj_id, void *buf, size_t *nalloc, hid_t fapl", Since(1, 12, 0)));
    d.push_back(Function(kCore, "herr_t", "H5Sclose", "hid_t space_id"));

    d.push_back(Function(kCore, "hid_t", "H5Acreate2", "hid_t loc_id, const char *attr_name, hid_t type_id, hid_t space_id, hid_t acpl_id, hid_t aapl_id"));
    d.push_back(Function(kCore, "hid_t", "H5Aopen", "hid_t obj_id, const char *attr_name, hid_t aapl_id"));
    d.push_back(Function(kCore, "herr_t", "H5Aread", "hid_t attr_id, hid_t type_id, void *buf"));
    d.push_back(Function(kCore, "herr_t", "H5Awrite", "hid_t attr_id, hid_t type_id, const void *buf"));
    d.push_back(Function(kCore, "herr_t", "H5Aclose", "hid_t attr_id"));

    d.push_back(Function(kCore, "hid_t", "H5Pcreate", "hid_t cls_id"));
    d.push_back(Function(kCore, "herr_t", "H5Pset_chunk", "hid_t plist_id, int ndims, const hsize_t dim[]"));
    d.push_back(Function(kCore, "herr_t", "H5Pset_evict_on_close", "hid_t fapl_id, hbool_t evict_on_close", Since(1, 10, 1)));
    d.push_back(Function(kCore, "herr_t", "H5Pclose", "hid_t plist_id"));

    d.push_back(Function(kCore, "hid_t", "H5Tcopy", "hid_t type_id"));
    d.push_back(Function(kCore, "H5T_class_t", "H5Tget_class", "hid_t type_id"));
    d.push_back(Function(kCore, "size_t", "H5Tget_size", "hid_t type_id"));
    d.push_back(Function(kCore, "herr_t", "H5Tclose", "hid_t type_id"));

    // ------------------------------------------------------------------------
    // zlib
    // ------------------------------------------------------------------------
    d.push_back(Typedef(kZlib, "H5Z_filter_t", "typedef int H5Z_filter_t;"));
    d.push_back(Constant(kZlib, "H5Z_FILTER_DEFLATE", "1", 1));
    d.push_back(Function(kZlib, "herr_t", "H5Pset_deflate", "hid_t plist_id, unsigned level"));
    d.push_back(Function(kZlib, "htri_t", "H5Zfilter_avail", "H5Z_filter_t id"));

    // ------------------------------------------------------------------------
    // hl (libhdf5_hl)
    // ------------------------------------------------------------------------
    d.push_back(Function(kHl, "herr_t", "H5LTmake_dataset", "hid_t loc_id, const char *dset_name, int rank, const hsize_t *dims, hid_t type_id, const void *buffer"));
    d.push_back(Function(kHl, "herr_t", "H5LTmake_dataset_double", "hid_t loc_id, const char *dset_name, int rank, const hsize_t *dims, const double *buffer"));
    d.push_back(Function(kHl, "herr_t", "H5LTread_dataset", "hid_t loc_id, const char *dset_name, hid_t type_id, void *buffer"));
    d.push_back(Function(kHl, "herr_t", "H5LTread_dataset_double", "hid_t loc_id, const char *dset_name, double *buffer"));
    d.push_back(Function(kHl, "herr_t", "H5LTfind_dataset", "hid_t loc_id, const char *name"));
    d.push_back(Function(kHl, "herr_t", "H5LTset_attribute_string", "hid_t loc_id, const char *obj_name, const char *attr_name, const char *attr_data"));
    d.push_back(Function(kHl, "herr_t", "H5LTget_attribute_string", "hid_t loc_id, const char *obj_name, const char *attr_name, char *data"));
    d.push_back(Function(kHl, "herr_t", "H5DSset_scale", "hid_t dsid, const char *dimname"));
    d.push_back(Function(kHl, "herr_t", "H5DSattach_scale", "hid_t did, hid_t dsid, unsigned int idx"));

    // ------------------------------------------------------------------------
    // mpio
    // ------------------------------------------------------------------------
    d.push_back(Include(kMpio, "mpi.h"));
    d.push_back(Enum(kMpio, "H5FD_mpio_xfer_t", {
        {"H5FD_MPIO_INDEPENDENT", 0}, {"H5FD_MPIO_COLLECTIVE", 1},
    }));
    d.push_back(Enum(kMpio, "H5FD_mpio_collective_opt_t", {
        {"H5FD_MPIO_COLLECTIVE_IO", 0}, {"H5FD_MPIO_INDIVIDUAL_IO", 1},
    }));
    d.push_back(Function(kMpio, "herr_t", "H5Pset_fapl_mpio", "hid_t fapl_id, MPI_Comm comm, MPI_Info info"));
    d.push_back(Function(kMpio, "herr_t", "H5Pget_fapl_mpio", "hid_t fapl_id, MPI_Comm *comm, MPI_Info *info"));
    d.push_back(Function(kMpio, "herr_t", "H5Pset_dxpl_mpio", "hid_t dxpl_id, H5FD_mpio_xfer_t xfer_mode"));
    d.push_back(Function(kMpio, "herr_t", "H5Pget_dxpl_mpio", "hid_t dxpl_id, H5FD_mpio_xfer_t *xfer_mode"));
    d.push_back(Function(kMpio, "herr_t", "H5Pset_dxpl_mpio_collective_opt", "hid_t dxpl_id, H5FD_mpio_collective_opt_t opt_mode"));
    d.push_back(Function(kMpio, "herr_t", "H5Pset_all_coll_metadata_ops", "hid_t plist_id, hbool_t is_collective", Since(1, 10, 0)));
    d.push_back(Function(kMpio, "herr_t", "H5Pset_coll_metadata_write", "hid_t plist_id, hbool_t is_collective", Since(1, 10, 0)));

    // ------------------------------------------------------------------------
    // deprecated (absent when built with H5_NO_DEPRECATED_SYMBOLS)
    // ------------------------------------------------------------------------
    d.push_back(Function(kDeprecated, "hid_t", "H5Acreate1", "hid_t loc_id, const char *name, hid_t type_id, hid_t space_id, hid_t acpl_id"));
    d.push_back(Function(kDeprecated, "int", "H5Aget_num_attrs", "hid_t loc_id"));
    d.push_back(Function(kDeprecated, "hid_t", "H5Dcreate1", "hid_t loc_id, const char *name, hid_t type_id, hid_t space_id, hid_t dcpl_id"));
    d.push_back(Function(kDeprecated, "hid_t", "H5Dopen1", "hid_t loc_id, const char *name"));
    d.push_back(Function(kDeprecated, "hid_t", "H5Gcreate1", "hid_t loc_id, const char *name, size_t size_hint"));
    d.push_back(Function(kDeprecated, "hid_t", "H5Gopen1", "hid_t loc_id, const char *name"));
    d.push_back(Function(kDeprecated, "herr_t", "H5Eclear1", "void"));
    d.push_back(Function(kDeprecated, "herr_t", "H5Tcommit1", "hid_t loc_id, const char *name, hid_t type_id"));
    d.push_back(Function(kDeprecated, "hid_t", "H5Topen1", "hid_t loc_id, const char *name"));
    d.push_back(Function(kDeprecated, "herr_t", "H5Sencode1", "hid_t obj_id, void *buf, size_t *nalloc", Since(1, 12, 0)));

    // ------------------------------------------------------------------------
    // direct (Direct I/O VFD)
    // ------------------------------------------------------------------------
    d.push_back(Function(kDirect, "herr_t", "H5Pset_fapl_direct", "hid_t fapl_id, size_t alignment, size_t block_size, size_t cbuf_size"));
    d.push_back(Function(kDirect, "herr_t", "H5Pget_fapl_direct", "hid_t fapl_id, size_t *boundary, size_t *block_size, size_t *cbuf_size"));

    return d;
}

} // namespace

// ============================================================================
// SymbolCatalog
// ============================================================================

SymbolCatalog::SymbolCatalog(Vector<Declaration> declarations)
    : m_Declarations(std::move(declarations))
{
}

const SymbolCatalog& SymbolCatalog::Default() {
    static const SymbolCatalog catalog(BuildCatalog());
    return catalog;
}

Vector<const Declaration*> SymbolCatalog::Select(SymbolGroup group, const Version& version) const {
    Vector<const Declaration*> selected;
    for (const auto& decl : m_Declarations) {
        if (decl.group == group && decl.range.Contains(version)) {
            selected.push_back(&decl);
        }
    }
    return selected;
}

const Declaration* SymbolCatalog::Find(StringView name, const Version& version) const {
    for (const auto& decl : m_Declarations) {
        if (decl.name == name && decl.range.Contains(version)) {
            return &decl;
        }
    }
    return nullptr;
}

Optional<i64> SymbolCatalog::EnumeratorValue(StringView name, const Version& version) const {
    for (const auto& decl : m_Declarations) {
        if (decl.kind != DeclKind::Enum || !decl.range.Contains(version)) {
            continue;
        }
        for (const auto& e : decl.enumerators) {
            if (e.name == name) {
                return e.value;
            }
        }
    }
    return std::nullopt;
}

} // namespace h5bind
