#ifndef TOPOLOGY_HPP
#define TOPOLOGY_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// The one identifier comparison used for DNS server and site names
bool same_identifier(const std::string& a, const std::string& b);

// ^[A-Za-z][A-Za-z0-9-]{0,19}$
bool is_valid_dns_server_name(const std::string& name);

// Each entity keeps the JSON object it was read from in `source`. Keys not
// modeled here are written back from it unchanged, in their original order.
// A null source marks an entity created in memory.

struct DnsServer {
    std::string name;
    std::string ip_address;
    nlohmann::ordered_json source;
};

struct Subnet {
    std::string name;
    std::string address_prefix;
    nlohmann::ordered_json source;
};

struct DnsServerRef {
    std::string name;
    nlohmann::ordered_json source;
};

struct VirtualNetworkSite {
    std::string name;
    std::string affinity_group;
    std::vector<std::string> address_space;
    std::vector<Subnet> subnets;
    std::vector<DnsServerRef> dns_servers_ref;
    nlohmann::ordered_json source;

    bool references_dns_server(const std::string& dns_name) const;
};

// Whole network configuration of a tenant. Fetched, changed and replaced as one unit.
class NetworkConfiguration
{
public:
    std::vector<DnsServer> dns_servers;
    std::vector<VirtualNetworkSite> virtual_network_sites;

    // Source objects of the document root, of VirtualNetworkConfiguration and of Dns
    nlohmann::ordered_json document_source;
    nlohmann::ordered_json network_source;
    nlohmann::ordered_json dns_source;

    bool empty() const;

    const DnsServer* find_dns_server(const std::string& name) const;
    const DnsServer* find_dns_server_by_ip(const std::string& ip_address) const;
    const VirtualNetworkSite* find_site(const std::string& name) const;
    const VirtualNetworkSite* find_site_referencing(const std::string& dns_name) const;

    // Throw DUPLICATE_ENTITY on name (or IP) collisions
    void add_dns_server(const DnsServer& server);
    void add_site(const VirtualNetworkSite& site);

    // Return false if nothing matched
    bool remove_dns_server(const std::string& name);
    bool remove_site(const std::string& name);

    std::vector<std::string> dns_server_names() const;

    // Checks uniqueness, DNS references and addressing of the whole document.
    // Throws the first violation found.
    void validate() const;
};

#endif
