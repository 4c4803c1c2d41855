#include <affinity.hpp>
#include <topology.hpp>
#include <errors.hpp>
#include <logging.hpp>
#include <utilities.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

CatalogAffinityResolver::CatalogAffinityResolver(std::vector<AffinityGroupInfo> groups,
                                                 std::vector<LocationInfo> locations,
                                                 std::string required_capability,
                                                 std::mt19937::result_type seed)
    : groups(std::move(groups)), locations(std::move(locations)),
      required_capability(std::move(required_capability)), rng(seed) {}

bool CatalogAffinityResolver::has_capability(const std::vector<std::string>& capabilities) const {
    return std::any_of(capabilities.begin(), capabilities.end(),
                       [this](const std::string& c) { return iequals(c, required_capability); });
}

AffinityGroupResolution CatalogAffinityResolver::resolve(const AffinitySelector& selector) {
    if (selector.affinity_group && selector.location) {
        throw NetConfigError(ErrorKind::MUTUALLY_EXCLUSIVE_PARAMETERS,
                             "--affinity-group and --location cannot be used together");
    }
    if (selector.affinity_group) return resolve_group(*selector.affinity_group);
    if (selector.location) return resolve_location(*selector.location);
    throw NetConfigError(ErrorKind::MISSING_DEPENDENT_PARAMETERS, "--affinity-group or --location is required");
}

AffinityGroupResolution CatalogAffinityResolver::resolve_group(const std::string& name) const {
    std::vector<std::string> compatible;
    for (const auto& g : groups) {
        if (has_capability(g.capabilities)) compatible.push_back(g.name + " (" + g.location + ")");
    }

    auto it = std::find_if(groups.begin(), groups.end(),
                           [&name](const AffinityGroupInfo& g) { return same_identifier(g.name, name); });
    if (it == groups.end()) {
        throw NetConfigError(ErrorKind::NOT_FOUND, "affinity group '" + name + "' not found", compatible);
    }
    if (!has_capability(it->capabilities)) {
        throw NetConfigError(ErrorKind::UNSUPPORTED_CAPABILITY,
                             "affinity group '" + it->name + "' does not support " + required_capability,
                             compatible);
    }
    logger->debug("Using affinity group {} in {}", it->name, it->location);
    return {it->name, it->location, false};
}

AffinityGroupResolution CatalogAffinityResolver::resolve_location(const std::string& name) {
    std::vector<std::string> compatible;
    for (const auto& l : locations) {
        if (has_capability(l.capabilities)) compatible.push_back(l.name);
    }

    auto location = std::find_if(locations.begin(), locations.end(),
                                 [&name](const LocationInfo& l) { return same_identifier(l.name, name); });
    if (location == locations.end()) {
        throw NetConfigError(ErrorKind::NOT_FOUND, "location '" + name + "' not found", compatible);
    }
    if (!has_capability(location->capabilities)) {
        throw NetConfigError(ErrorKind::UNSUPPORTED_CAPABILITY,
                             "location '" + location->name + "' does not support " + required_capability,
                             compatible);
    }

    for (const auto& g : groups) {
        if (same_identifier(g.location, location->name) && has_capability(g.capabilities)) {
            logger->debug("Reusing affinity group {} in {}", g.name, g.location);
            return {g.name, g.location, false};
        }
    }

    std::string compact;
    for (char c : location->name) {
        if (std::isalnum(static_cast<unsigned char>(c))) compact.push_back(c);
    }
    AffinityGroupResolution created{"AG-" + compact + "-" + random_hex_suffix(rng, 4), location->name, true};
    logger->debug("New affinity group {} for {}", created.name, created.location);
    return created;
}

void CatalogAffinityResolver::commit(const AffinityGroupResolution& resolution) {
    if (!resolution.is_newly_created) return;
    bool known = std::any_of(groups.begin(), groups.end(), [&resolution](const AffinityGroupInfo& g) {
        return same_identifier(g.name, resolution.name);
    });
    if (known) return;

    groups.push_back({resolution.name, resolution.location, {required_capability}});
    logger->info("Created affinity group {} in {}", resolution.name, resolution.location);
}
