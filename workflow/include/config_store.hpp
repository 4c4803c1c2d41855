#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include <string>
#include "topology.hpp"

// Holder of the tenant's network configuration. Only whole documents go in
// or out; there is no locking, the last replace wins.
class ConfigurationStore {
public:
    virtual ~ConfigurationStore() = default;

    // Throws NOT_FOUND when no configuration has been stored yet
    virtual NetworkConfiguration fetch() = 0;

    virtual void replace(const NetworkConfiguration& config) = 0;
};

// Keeps the configuration as a JSON document on disk
class FileConfigurationStore : public ConfigurationStore {
private:
    std::string path;

public:
    explicit FileConfigurationStore(std::string path);

    NetworkConfiguration fetch() override;
    void replace(const NetworkConfiguration& config) override;

    const std::string& get_path() const { return path; }
};

#endif
