#include "FeatureRegistry.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <stdexcept>

namespace h5bind {

FeatureRegistry::FeatureRegistry(Vector<FeatureSpec> table)
    : m_Table(std::move(table))
{
}

const FeatureRegistry& FeatureRegistry::Default() {
    static const FeatureRegistry registry({
        { FeatureFlag::Mpio,       {}, Capability::Mpio,       SymbolGroup::Mpio,
          { "--enable-parallel" }, {} },
        { FeatureFlag::Hl,         {}, Capability::Hl,         SymbolGroup::Hl,
          { "--enable-hl" }, {} },
        { FeatureFlag::Threadsafe, {}, Capability::Threadsafe, std::nullopt,
          { "--enable-threadsafe" }, { "pthread" } },
        { FeatureFlag::Zlib,       {}, Capability::Zlib,       SymbolGroup::Zlib,
          { "--with-zlib" }, { "z" } },
        { FeatureFlag::Deprecated, {}, Capability::Deprecated, SymbolGroup::Deprecated,
          { "--enable-deprecated-symbols" }, {} },
        { FeatureFlag::Static,     {}, std::nullopt,           std::nullopt,
          {}, {} },
    });
    return registry;
}

ResolveResult<FeatureFlag> FeatureRegistry::Lookup(StringView name) const {
    for (const auto& spec : m_Table) {
        if (name == FeatureFlagName(spec.flag)) {
            return spec.flag;
        }
    }
    return ResolveResult<FeatureFlag>::Err(ResolveError::UnknownFlag(name));
}

ResolveResult<FlagSet> FeatureRegistry::Close(const Vector<String>& names) const {
    FlagSet requested;
    for (const auto& name : names) {
        auto flag = Lookup(name);
        if (!flag) {
            return ResolveResult<FlagSet>::Err(std::move(flag).error());
        }
        requested.insert(*flag);
    }
    return Close(requested);
}

FlagSet FeatureRegistry::Close(const FlagSet& flags) const {
    FlagSet closed;
    Vector<FeatureFlag> pending(flags.begin(), flags.end());

    // Worklist: an implication cycle terminates because visited flags are skipped
    while (!pending.empty()) {
        FeatureFlag flag = pending.back();
        pending.pop_back();

        if (!closed.insert(flag).second) {
            continue;
        }
        if (!Contains(flag)) {
            continue;
        }
        for (FeatureFlag implied : Spec(flag).implies) {
            if (!closed.contains(implied)) {
                HB_LOG_TRACE("Feature '{}' implies '{}'", FeatureFlagName(flag), FeatureFlagName(implied));
                pending.push_back(implied);
            }
        }
    }
    return closed;
}

const FeatureSpec& FeatureRegistry::Spec(FeatureFlag flag) const {
    auto it = std::find_if(m_Table.begin(), m_Table.end(),
                           [flag](const FeatureSpec& spec) { return spec.flag == flag; });
    if (it == m_Table.end()) {
        throw std::out_of_range(String("feature registry has no entry for ") + FeatureFlagName(flag));
    }
    return *it;
}

bool FeatureRegistry::Contains(FeatureFlag flag) const {
    return std::any_of(m_Table.begin(), m_Table.end(),
                       [flag](const FeatureSpec& spec) { return spec.flag == flag; });
}

Vector<String> FeatureRegistry::ConfigureArgs(const FlagSet& flags) const {
    Vector<String> args;
    for (const auto& spec : m_Table) {
        if (flags.contains(spec.flag)) {
            args.insert(args.end(), spec.configureArgs.begin(), spec.configureArgs.end());
        }
    }
    return args;
}

Vector<String> FeatureRegistry::StaticLinkLibraries(const FlagSet& flags) const {
    Vector<String> libs;
    for (const auto& spec : m_Table) {
        if (flags.contains(spec.flag)) {
            libs.insert(libs.end(), spec.staticLinkLibraries.begin(), spec.staticLinkLibraries.end());
        }
    }
    return libs;
}

GroupSet FeatureRegistry::Groups(const FlagSet& flags) const {
    GroupSet groups;
    for (const auto& spec : m_Table) {
        if (flags.contains(spec.flag) && spec.group) {
            groups.insert(*spec.group);
        }
    }
    return groups;
}

FlagSet FeatureRegistry::AutoDetect(const CapabilitySet& caps) const {
    FlagSet detected;
    for (const auto& spec : m_Table) {
        if (spec.requiresCapability && caps.contains(*spec.requiresCapability)) {
            detected.insert(spec.flag);
        }
    }
    return Close(detected);
}

} // namespace h5bind
