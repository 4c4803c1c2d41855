#include "state_manager.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

using nlohmann::ordered_json;

namespace Key {
    const char* const ROOT            = "VirtualNetworkConfiguration";
    const char* const DNS             = "Dns";
    const char* const DNS_SERVERS     = "DnsServers";
    const char* const SITES           = "VirtualNetworkSites";
    const char* const NAME            = "Name";
    const char* const IP_ADDRESS      = "IPAddress";
    const char* const AFFINITY_GROUP  = "AffinityGroup";
    const char* const ADDRESS_SPACE   = "AddressSpace";
    const char* const SUBNETS         = "Subnets";
    const char* const ADDRESS_PREFIX  = "AddressPrefix";
    const char* const DNS_SERVERS_REF = "DnsServersRef";
}

// Helpers
static const ordered_json* member(const ordered_json& object, const char* key) {
    auto it = object.find(key);
    return it == object.end() || it->is_null() ? nullptr : &*it;
}

static ordered_json object_source(const ordered_json& j, const char* what) {
    if (!j.is_object()) {
        throw NetConfigError(ErrorKind::INVALID_FORMAT, std::string(what) + " must be a JSON object");
    }
    return j;
}

// A key read from the input is written back in place; an explicit null stays
// null until it carries a value. Other keys are written for entities created
// in memory, or once they carry a value.
static void put(ordered_json& out, const ordered_json& source, const char* key, const ordered_json& value,
                bool has_value) {
    if (source.contains(key)) {
        if (has_value || !source.at(key).is_null()) out[key] = value;
    } else if (source.is_null() || has_value) {
        out[key] = value;
    }
}

static DnsServer dns_server_from_json(const ordered_json& j) {
    DnsServer server;
    server.source = object_source(j, "DNS server entry");
    server.name = j.at(Key::NAME).get<std::string>();
    server.ip_address = j.at(Key::IP_ADDRESS).get<std::string>();
    return server;
}

static ordered_json dns_server_to_json(const DnsServer& server) {
    ordered_json j = server.source;
    j[Key::NAME] = server.name;
    j[Key::IP_ADDRESS] = server.ip_address;
    return j;
}

static VirtualNetworkSite site_from_json(const ordered_json& j) {
    VirtualNetworkSite site;
    site.source = object_source(j, "virtual network site");
    site.name = j.at(Key::NAME).get<std::string>();
    if (const ordered_json* group = member(j, Key::AFFINITY_GROUP)) {
        site.affinity_group = group->get<std::string>();
    }
    if (const ordered_json* spaces = member(j, Key::ADDRESS_SPACE)) {
        site.address_space = spaces->get<std::vector<std::string>>();
    }
    if (const ordered_json* subnets = member(j, Key::SUBNETS)) {
        for (const auto& s : *subnets) {
            Subnet subnet;
            subnet.source = object_source(s, "subnet");
            subnet.name = s.at(Key::NAME).get<std::string>();
            subnet.address_prefix = s.at(Key::ADDRESS_PREFIX).get<std::string>();
            site.subnets.push_back(subnet);
        }
    }
    if (const ordered_json* refs = member(j, Key::DNS_SERVERS_REF)) {
        for (const auto& r : *refs) {
            DnsServerRef ref;
            ref.source = object_source(r, "DNS server reference");
            ref.name = r.at(Key::NAME).get<std::string>();
            site.dns_servers_ref.push_back(ref);
        }
    }
    return site;
}

static ordered_json site_to_json(const VirtualNetworkSite& site) {
    const ordered_json& source = site.source;
    ordered_json j = source;
    j[Key::NAME] = site.name;
    put(j, source, Key::AFFINITY_GROUP, site.affinity_group, !site.affinity_group.empty());
    put(j, source, Key::ADDRESS_SPACE, site.address_space, !site.address_space.empty());

    ordered_json subnets = ordered_json::array();
    for (const auto& subnet : site.subnets) {
        ordered_json s = subnet.source;
        s[Key::NAME] = subnet.name;
        s[Key::ADDRESS_PREFIX] = subnet.address_prefix;
        subnets.push_back(s);
    }
    put(j, source, Key::SUBNETS, subnets, !site.subnets.empty());

    ordered_json refs = ordered_json::array();
    for (const auto& ref : site.dns_servers_ref) {
        ordered_json r = ref.source;
        r[Key::NAME] = ref.name;
        refs.push_back(r);
    }
    // New sites carry DnsServersRef only when they reference a server
    if (source.contains(Key::DNS_SERVERS_REF) || !site.dns_servers_ref.empty()) {
        put(j, source, Key::DNS_SERVERS_REF, refs, !site.dns_servers_ref.empty());
    }
    return j;
}

ordered_json StateManager::to_json(const NetworkConfiguration& config) {
    ordered_json servers = ordered_json::array();
    for (const auto& server : config.dns_servers) {
        servers.push_back(dns_server_to_json(server));
    }

    ordered_json sites = ordered_json::array();
    for (const auto& site : config.virtual_network_sites) {
        sites.push_back(site_to_json(site));
    }

    ordered_json dns = config.dns_source;
    put(dns, config.dns_source, Key::DNS_SERVERS, servers, !config.dns_servers.empty());

    ordered_json network = config.network_source;
    put(network, config.network_source, Key::DNS, dns, !config.dns_servers.empty());
    put(network, config.network_source, Key::SITES, sites, !config.virtual_network_sites.empty());

    ordered_json document = config.document_source;
    document[Key::ROOT] = network;
    return document;
}

NetworkConfiguration StateManager::from_json(const ordered_json& document) {
    NetworkConfiguration config;
    try {
        config.document_source = object_source(document, "network configuration");

        const ordered_json* network = member(document, Key::ROOT);
        if (!network) return config;
        config.network_source = object_source(*network, Key::ROOT);

        if (const ordered_json* dns = member(*network, Key::DNS)) {
            config.dns_source = object_source(*dns, Key::DNS);
            if (const ordered_json* servers = member(*dns, Key::DNS_SERVERS)) {
                for (const auto& s : *servers) {
                    config.dns_servers.push_back(dns_server_from_json(s));
                }
            }
        }
        if (const ordered_json* sites = member(*network, Key::SITES)) {
            for (const auto& s : *sites) {
                config.virtual_network_sites.push_back(site_from_json(s));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw NetConfigError(ErrorKind::INVALID_FORMAT, std::string("malformed network configuration: ") + ex.what());
    }
    return config;
}

std::string StateManager::dump(const NetworkConfiguration& config, int indent) {
    return to_json(config).dump(indent);
}

NetworkConfiguration StateManager::parse(const std::string& text, const std::string& source) {
    ordered_json document;
    try {
        document = ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw NetConfigError(ErrorKind::INVALID_FORMAT, source + " is not valid JSON: " + ex.what());
    }
    return from_json(document);
}

void StateManager::save(const NetworkConfiguration& config, const std::string& path) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw NetConfigError(ErrorKind::STORE_FAILURE, "could not open '" + tmp_path + "' for writing");
        }
        file << dump(config) << "\n";
        file.flush();
        if (!file) {
            throw NetConfigError(ErrorKind::STORE_FAILURE, "could not write '" + tmp_path + "'");
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw NetConfigError(ErrorKind::STORE_FAILURE, "could not replace '" + path + "'");
    }
    logger->debug("Network configuration written to {}", path);
}

NetworkConfiguration StateManager::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw NetConfigError(ErrorKind::NOT_FOUND, "network configuration '" + path + "' does not exist");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw NetConfigError(ErrorKind::STORE_FAILURE, "could not open '" + path + "' for reading");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    logger->debug("Loaded network configuration from {}", path);
    return parse(buffer.str(), path);
}
