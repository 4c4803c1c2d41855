#include <operations.hpp>
#include <network.hpp>
#include <state_manager.hpp>
#include <errors.hpp>
#include <logging.hpp>
#include <utilities.hpp>

#define GENERATED_DNS_NAME_PREFIX "DNS-"
#define GENERATED_DNS_SUFFIX_LENGTH 8

ServiceContext::ServiceContext(ConfigurationStore& store, AffinityGroupResolver& affinity,
                               const Settings& settings, std::mt19937::result_type seed)
    : store(store), affinity(affinity), settings(settings), rng(seed) {}

NetworkConfiguration ServiceContext::fetch_configuration() {
    try {
        return store.fetch();
    } catch (const NetConfigError& ex) {
        if (ex.kind() != ErrorKind::NOT_FOUND) throw;
        logger->debug("No network configuration stored yet: {}", ex.what());
        return NetworkConfiguration();
    }
}

void ServiceContext::replace_configuration(const NetworkConfiguration& config) {
    config.validate();
    store.replace(config);
}

std::vector<DnsServer> NetworkOperations::list_dns_servers(ServiceContext& ctx) {
    return ctx.fetch_configuration().dns_servers;
}

std::vector<VirtualNetworkSite> NetworkOperations::list_virtual_networks(ServiceContext& ctx) {
    return ctx.fetch_configuration().virtual_network_sites;
}

VirtualNetworkSite NetworkOperations::show_virtual_network(ServiceContext& ctx, const std::string& name) {
    NetworkConfiguration config = ctx.fetch_configuration();
    const VirtualNetworkSite* site = config.find_site(name);
    if (!site) {
        throw NetConfigError(ErrorKind::NOT_FOUND, "virtual network '" + name + "' not found");
    }
    return *site;
}

DnsServer NetworkOperations::register_dns_server(ServiceContext& ctx, const std::string& ip_address,
                                                 const std::optional<std::string>& name) {
    if (name && !is_valid_dns_server_name(*name)) {
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                             "--name: '" + *name + "' must start with a letter and contain at most 20 "
                             "letters, digits or hyphens");
    }
    DnsServer server;
    server.ip_address = address_to_str(parse_ipv4(ip_address, "--ip"));

    NetworkConfiguration config = ctx.fetch_configuration();
    if (name) {
        server.name = *name;
    } else {
        do {
            server.name = GENERATED_DNS_NAME_PREFIX + random_hex_suffix(ctx.rng, GENERATED_DNS_SUFFIX_LENGTH);
        } while (config.find_dns_server(server.name));
        logger->info("Generated DNS server name {}", server.name);
    }

    config.add_dns_server(server);
    ctx.replace_configuration(config);
    logger->info("Registered DNS server {} ({})", server.name, server.ip_address);
    return server;
}

DnsServer NetworkOperations::unregister_dns_server(ServiceContext& ctx, const std::optional<std::string>& name,
                                                   const std::optional<std::string>& ip_address) {
    if (name && ip_address) {
        throw NetConfigError(ErrorKind::MUTUALLY_EXCLUSIVE_PARAMETERS, "--name and --ip cannot be used together");
    }
    if (!name && !ip_address) {
        throw NetConfigError(ErrorKind::MISSING_DEPENDENT_PARAMETERS, "--name or --ip is required");
    }

    std::string canonical_ip;
    if (ip_address) {
        canonical_ip = address_to_str(parse_ipv4(*ip_address, "--ip"));
    }

    NetworkConfiguration config = ctx.fetch_configuration();
    const DnsServer* match = name ? config.find_dns_server(*name) : config.find_dns_server_by_ip(canonical_ip);
    if (!match) {
        throw NetConfigError(ErrorKind::NOT_FOUND,
                             "DNS server " + (name ? "'" + *name + "'" : canonical_ip) + " not found",
                             config.dns_server_names());
    }

    // Deletion is blocked while any site still points at the server
    if (const VirtualNetworkSite* site = config.find_site_referencing(match->name)) {
        throw NetConfigError(ErrorKind::REFERENCED_ENTITY,
                             "DNS server '" + match->name + "' is used by virtual network '" + site->name + "'");
    }

    DnsServer removed = *match;
    config.remove_dns_server(removed.name);
    ctx.replace_configuration(config);
    logger->info("Unregistered DNS server {} ({})", removed.name, removed.ip_address);
    return removed;
}

CreateVirtualNetworkResult NetworkOperations::create_virtual_network(ServiceContext& ctx,
                                                                     const CreateVirtualNetworkRequest& request) {
    if (request.name.empty()) {
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT, "virtual network name cannot be empty");
    }
    AddressLayout layout = AddressSpaceAllocator(ctx.settings.defaults).resolve(request.addressing);

    NetworkConfiguration config = ctx.fetch_configuration();
    if (const VirtualNetworkSite* existing = config.find_site(request.name)) {
        throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                             "a virtual network named '" + existing->name + "' already exists");
    }

    VirtualNetworkSite site;
    site.name = request.name;
    if (request.dns_server_id) {
        const DnsServer* server = config.find_dns_server(*request.dns_server_id);
        if (!server) {
            throw NetConfigError(ErrorKind::NOT_FOUND,
                                 "DNS server '" + *request.dns_server_id + "' is not registered",
                                 config.dns_server_names());
        }
        site.dns_servers_ref.push_back({server->name});
    }

    CreateVirtualNetworkResult result;
    result.affinity_group = ctx.affinity.resolve(request.affinity);

    site.affinity_group = result.affinity_group.name;
    site.address_space.push_back(layout.address_space_prefix());
    site.subnets.push_back({layout.subnet_name, layout.subnet_prefix()});

    config.add_site(site);
    ctx.replace_configuration(config);
    ctx.affinity.commit(result.affinity_group);
    logger->info("Created virtual network {} with address space {}", site.name, layout.address_space_prefix());

    result.site = site;
    return result;
}

DeleteOutcome NetworkOperations::delete_virtual_network(ServiceContext& ctx, const std::string& name) {
    NetworkConfiguration config = ctx.fetch_configuration();
    if (config.virtual_network_sites.empty()) {
        logger->warn("No virtual networks defined, nothing to delete");
        return DeleteOutcome::NO_SITES;
    }
    if (!config.remove_site(name)) {
        throw NetConfigError(ErrorKind::NOT_FOUND, "virtual network '" + name + "' not found");
    }
    ctx.replace_configuration(config);
    logger->info("Deleted virtual network {}", name);
    return DeleteOutcome::DELETED;
}

NetworkConfiguration NetworkOperations::export_configuration(ServiceContext& ctx, const std::string& path) {
    NetworkConfiguration config = ctx.fetch_configuration();
    StateManager::save(config, path);
    logger->info("Exported network configuration to {}", path);
    return config;
}

NetworkConfiguration NetworkOperations::import_configuration(ServiceContext& ctx, const std::string& path) {
    NetworkConfiguration config = StateManager::load(path);
    ctx.replace_configuration(config);
    logger->info("Imported network configuration from {}", path);
    return config;
}
