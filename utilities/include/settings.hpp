#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <string>
#include <vector>
#include <spdlog/common.h>
#include "allocator.hpp"

#define DEFAULT_SETTINGS_FILE "vnetcfg.json"
#define DEFAULT_STORE_FILE "network_config.json"
#define DEFAULT_REQUIRED_CAPABILITY "PersistentVMRole"

struct AffinityGroupInfo {
    std::string name;
    std::string location;
    std::vector<std::string> capabilities;
};

struct LocationInfo {
    std::string name;
    std::vector<std::string> capabilities;
};

struct Settings {
    std::string store_path = DEFAULT_STORE_FILE;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    std::string log_file;
    AllocatorDefaults defaults;
    std::string required_capability = DEFAULT_REQUIRED_CAPABILITY;
    std::vector<AffinityGroupInfo> affinity_groups;
    std::vector<LocationInfo> locations;

    // Missing keys keep their defaults. Throws INVALID_FORMAT on bad JSON or types.
    static Settings parse(const std::string& text, const std::string& source);

    // A missing file yields defaults only when required is false
    static Settings load(const std::string& path, bool required);
};

#endif
