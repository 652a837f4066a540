/// @file mob_ref.cpp
/// @brief Entity name normalization

#include <mobdef/asset/mob_ref.hpp>

#include <algorithm>

namespace mobdef_asset {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return !suffix.empty() && s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::string normalize_mob_ref(std::string_view ref, const mobdef_core::LayerPaths& rules) {
    std::string name(ref);
    std::replace(name.begin(), name.end(), '\\', '/');

    if (!rules.root_prefix.empty() && name.rfind(rules.root_prefix, 0) == 0) {
        name.erase(0, rules.root_prefix.size());
    }

    if (ends_with(name, rules.patch_extension)) {
        name.erase(name.size() - rules.patch_extension.size());
    } else if (ends_with(name, rules.definition_extension)) {
        name.erase(name.size() - rules.definition_extension.size());
    }

    return name;
}

} // namespace mobdef_asset
