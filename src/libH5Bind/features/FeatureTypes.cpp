#include "FeatureTypes.hpp"

namespace h5bind {

namespace {

template<typename SetT, typename NameFn>
String Join(const SetT& items, NameFn nameOf) {
    String out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += nameOf(item);
    }
    return out;
}

} // namespace

Optional<SymbolGroup> SymbolGroupFromName(StringView name) {
    for (SymbolGroup group : kAllSymbolGroups) {
        if (name == SymbolGroupName(group)) {
            return group;
        }
    }
    return std::nullopt;
}

String JoinFlagNames(const FlagSet& flags) {
    return Join(flags, FeatureFlagName);
}

String JoinCapabilityNames(const CapabilitySet& caps) {
    return Join(caps, CapabilityName);
}

String JoinGroupNames(const GroupSet& groups) {
    return Join(groups, SymbolGroupName);
}

} // namespace h5bind
