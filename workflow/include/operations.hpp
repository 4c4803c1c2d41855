#ifndef OPERATIONS_HPP
#define OPERATIONS_HPP

#include <optional>
#include <random>
#include <string>
#include <vector>
#include "topology.hpp"
#include "config_store.hpp"
#include "affinity.hpp"
#include "allocator.hpp"
#include "settings.hpp"

// Everything one command talks to, handed explicitly to each operation
class ServiceContext {
public:
    ConfigurationStore& store;
    AffinityGroupResolver& affinity;
    const Settings& settings;
    std::mt19937 rng;

    ServiceContext(ConfigurationStore& store, AffinityGroupResolver& affinity, const Settings& settings,
                   std::mt19937::result_type seed = std::random_device{}());

    // An unknown configuration is an empty one
    NetworkConfiguration fetch_configuration();

    // Validates the whole document, then hands it to the store in one piece
    void replace_configuration(const NetworkConfiguration& config);
};

enum class DeleteOutcome {
    DELETED,
    NO_SITES
};

struct CreateVirtualNetworkRequest {
    std::string name;
    AllocationRequest addressing;
    std::optional<std::string> dns_server_id;
    AffinitySelector affinity;
};

struct CreateVirtualNetworkResult {
    VirtualNetworkSite site;
    AffinityGroupResolution affinity_group;
};

// Each mutation fetches the configuration once and replaces it at most once.
// On any error the stored configuration is left as it was.
class NetworkOperations {
public:
    static std::vector<DnsServer> list_dns_servers(ServiceContext& ctx);
    static std::vector<VirtualNetworkSite> list_virtual_networks(ServiceContext& ctx);
    static VirtualNetworkSite show_virtual_network(ServiceContext& ctx, const std::string& name);

    // Returns the stored entry; its name is generated when none was given
    static DnsServer register_dns_server(ServiceContext& ctx, const std::string& ip_address,
                                         const std::optional<std::string>& name);
    static DnsServer unregister_dns_server(ServiceContext& ctx, const std::optional<std::string>& name,
                                           const std::optional<std::string>& ip_address);

    static CreateVirtualNetworkResult create_virtual_network(ServiceContext& ctx,
                                                             const CreateVirtualNetworkRequest& request);
    static DeleteOutcome delete_virtual_network(ServiceContext& ctx, const std::string& name);

    static NetworkConfiguration export_configuration(ServiceContext& ctx, const std::string& path);
    static NetworkConfiguration import_configuration(ServiceContext& ctx, const std::string& path);
};

#endif
