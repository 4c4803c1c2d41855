#ifndef STATE_MANAGER_HPP
#define STATE_MANAGER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "topology.hpp"

// JSON form of the network configuration:
// { "VirtualNetworkConfiguration": { "Dns": { "DnsServers": [...] }, "VirtualNetworkSites": [...] } }
class StateManager {
public:
    static nlohmann::ordered_json to_json(const NetworkConfiguration& config);
    static NetworkConfiguration from_json(const nlohmann::ordered_json& document);

    static std::string dump(const NetworkConfiguration& config, int indent = 2);
    static NetworkConfiguration parse(const std::string& text, const std::string& source);

    // Writes a temporary file next to path, then renames it over path
    static void save(const NetworkConfiguration& config, const std::string& path);

    // NOT_FOUND when the file does not exist
    static NetworkConfiguration load(const std::string& path);
};

#endif
