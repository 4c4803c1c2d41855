#include <topology.hpp>
#include <netparser.hpp>
#include <network.hpp>
#include <errors.hpp>
#include <logging.hpp>
#include <utilities.hpp>
#include <algorithm>
#include <regex>

bool same_identifier(const std::string& a, const std::string& b) {
    return iequals(a, b);
}

bool is_valid_dns_server_name(const std::string& name) {
    static const std::regex pattern("[A-Za-z][A-Za-z0-9-]{0,19}");
    return std::regex_match(name, pattern);
}

// Canonical dotted decimal; text that is not an address is compared as written
static std::string canonical_ip(const std::string& text) {
    try {
        return address_to_str(parse_ipv4(text, "IPAddress"));
    } catch (const NetConfigError&) {
        return text;
    }
}

// --- VirtualNetworkSite ---
bool VirtualNetworkSite::references_dns_server(const std::string& dns_name) const {
    return std::any_of(dns_servers_ref.begin(), dns_servers_ref.end(),
                       [&dns_name](const DnsServerRef& ref) { return same_identifier(ref.name, dns_name); });
}

// --- NetworkConfiguration ---
bool NetworkConfiguration::empty() const {
    return dns_servers.empty() && virtual_network_sites.empty();
}

const DnsServer* NetworkConfiguration::find_dns_server(const std::string& name) const {
    for (const auto& server : dns_servers) {
        if (same_identifier(server.name, name)) {
            return &server;
        }
    }
    return nullptr;
}

const DnsServer* NetworkConfiguration::find_dns_server_by_ip(const std::string& ip_address) const {
    std::string wanted = canonical_ip(ip_address);
    for (const auto& server : dns_servers) {
        if (canonical_ip(server.ip_address) == wanted) {
            return &server;
        }
    }
    return nullptr;
}

const VirtualNetworkSite* NetworkConfiguration::find_site(const std::string& name) const {
    for (const auto& site : virtual_network_sites) {
        if (same_identifier(site.name, name)) {
            return &site;
        }
    }
    return nullptr;
}

const VirtualNetworkSite* NetworkConfiguration::find_site_referencing(const std::string& dns_name) const {
    for (const auto& site : virtual_network_sites) {
        if (site.references_dns_server(dns_name)) {
            return &site;
        }
    }
    return nullptr;
}

void NetworkConfiguration::add_dns_server(const DnsServer& server) {
    if (const DnsServer* existing = find_dns_server(server.name)) {
        throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                             "a DNS server named '" + existing->name + "' is already registered");
    }
    if (const DnsServer* existing = find_dns_server_by_ip(server.ip_address)) {
        throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                             "IP address " + server.ip_address + " is already registered as DNS server '" +
                             existing->name + "'");
    }
    dns_servers.push_back(server);
}

void NetworkConfiguration::add_site(const VirtualNetworkSite& site) {
    if (const VirtualNetworkSite* existing = find_site(site.name)) {
        throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                             "a virtual network named '" + existing->name + "' already exists");
    }
    virtual_network_sites.push_back(site);
}

bool NetworkConfiguration::remove_dns_server(const std::string& name) {
    auto it = std::find_if(dns_servers.begin(), dns_servers.end(),
                           [&name](const DnsServer& s) { return same_identifier(s.name, name); });
    if (it == dns_servers.end()) return false;
    dns_servers.erase(it);
    return true;
}

bool NetworkConfiguration::remove_site(const std::string& name) {
    auto it = std::find_if(virtual_network_sites.begin(), virtual_network_sites.end(),
                           [&name](const VirtualNetworkSite& s) { return same_identifier(s.name, name); });
    if (it == virtual_network_sites.end()) return false;
    virtual_network_sites.erase(it);
    return true;
}

std::vector<std::string> NetworkConfiguration::dns_server_names() const {
    std::vector<std::string> names;
    for (const auto& server : dns_servers) {
        names.push_back(server.name + " (" + server.ip_address + ")");
    }
    return names;
}

static void validate_site(const VirtualNetworkSite& site, const NetworkConfiguration& config) {
    const std::string where = "virtual network '" + site.name + "'";

    if (site.address_space.empty()) {
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT, where + " has no address space");
    }

    std::vector<Network> spaces;
    for (const auto& block : site.address_space) {
        spaces.push_back(NetParser(block, where + " AddressSpace").get_network());
    }

    for (size_t i = 0; i < site.subnets.size(); ++i) {
        const Subnet& subnet = site.subnets[i];
        if (subnet.name.empty()) {
            throw NetConfigError(ErrorKind::INVALID_ARGUMENT, where + " has a subnet without a name");
        }
        for (size_t j = 0; j < i; ++j) {
            if (same_identifier(site.subnets[j].name, subnet.name)) {
                throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                                     where + " has two subnets named '" + subnet.name + "'");
            }
        }

        Network prefix = NetParser(subnet.address_prefix, where + " subnet '" + subnet.name + "'").get_network();
        bool inside = std::any_of(spaces.begin(), spaces.end(),
                                  [&prefix](const Network& space) { return space.contains(prefix); });
        if (!inside) {
            throw NetConfigError(ErrorKind::OUT_OF_RANGE,
                                 where + " subnet '" + subnet.name + "' (" + subnet.address_prefix +
                                 ") is outside the address space " + join(site.address_space, ", "));
        }
    }

    for (const auto& ref : site.dns_servers_ref) {
        if (!config.find_dns_server(ref.name)) {
            throw NetConfigError(ErrorKind::NOT_FOUND,
                                 where + " references DNS server '" + ref.name + "' which is not registered",
                                 config.dns_server_names());
        }
    }
}

void NetworkConfiguration::validate() const {
    logger->trace("Validating configuration: {} DNS server(s), {} virtual network(s)",
                  dns_servers.size(), virtual_network_sites.size());

    for (size_t i = 0; i < dns_servers.size(); ++i) {
        const DnsServer& server = dns_servers[i];
        if (server.name.empty()) {
            throw NetConfigError(ErrorKind::INVALID_ARGUMENT, "a DNS server has no name");
        }
        std::string ip = address_to_str(parse_ipv4(server.ip_address, "DNS server '" + server.name + "' IPAddress"));
        for (size_t j = 0; j < i; ++j) {
            if (same_identifier(dns_servers[j].name, server.name)) {
                throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                                     "DNS server name '" + server.name + "' is used more than once");
            }
            if (canonical_ip(dns_servers[j].ip_address) == ip) {
                throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                                     "DNS servers '" + dns_servers[j].name + "' and '" + server.name +
                                     "' share IP address " + ip);
            }
        }
    }

    for (size_t i = 0; i < virtual_network_sites.size(); ++i) {
        const VirtualNetworkSite& site = virtual_network_sites[i];
        if (site.name.empty()) {
            throw NetConfigError(ErrorKind::INVALID_ARGUMENT, "a virtual network has no name");
        }
        for (size_t j = 0; j < i; ++j) {
            if (same_identifier(virtual_network_sites[j].name, site.name)) {
                throw NetConfigError(ErrorKind::DUPLICATE_ENTITY,
                                     "virtual network name '" + site.name + "' is used more than once");
            }
        }
        validate_site(site, *this);
    }
}
