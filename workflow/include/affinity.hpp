#ifndef AFFINITY_HPP
#define AFFINITY_HPP

#include <optional>
#include <random>
#include <string>
#include <vector>
#include "settings.hpp"

struct AffinitySelector {
    std::optional<std::string> affinity_group;
    std::optional<std::string> location;
};

struct AffinityGroupResolution {
    std::string name;
    std::string location;
    bool is_newly_created = false;
};

class AffinityGroupResolver {
public:
    virtual ~AffinityGroupResolver() = default;

    // Exactly one of affinity_group and location must be given.
    // NOT_FOUND / UNSUPPORTED_CAPABILITY carry the usable alternatives.
    virtual AffinityGroupResolution resolve(const AffinitySelector& selector) = 0;

    // Called once the configuration naming the group has been stored.
    // A newly created group is only remembered from then on.
    virtual void commit(const AffinityGroupResolution& resolution) = 0;
};

// Resolves against the affinity groups and locations listed in the settings.
// Committed groups are remembered for the lifetime of the resolver only; the
// settings catalog is not written back.
class CatalogAffinityResolver : public AffinityGroupResolver {
private:
    std::vector<AffinityGroupInfo> groups;
    std::vector<LocationInfo> locations;
    std::string required_capability;
    std::mt19937 rng;

    bool has_capability(const std::vector<std::string>& capabilities) const;
    AffinityGroupResolution resolve_group(const std::string& name) const;
    AffinityGroupResolution resolve_location(const std::string& name);

public:
    CatalogAffinityResolver(std::vector<AffinityGroupInfo> groups,
                            std::vector<LocationInfo> locations,
                            std::string required_capability,
                            std::mt19937::result_type seed = std::random_device{}());

    AffinityGroupResolution resolve(const AffinitySelector& selector) override;
    void commit(const AffinityGroupResolution& resolution) override;

    const std::vector<AffinityGroupInfo>& get_groups() const { return groups; }
};

#endif
