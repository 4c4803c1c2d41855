#include <config_store.hpp>
#include <state_manager.hpp>
#include <logging.hpp>
#include <utility>

FileConfigurationStore::FileConfigurationStore(std::string path) : path(std::move(path)) {}

NetworkConfiguration FileConfigurationStore::fetch() {
    logger->trace("Fetching network configuration from {}", path);
    return StateManager::load(path);
}

void FileConfigurationStore::replace(const NetworkConfiguration& config) {
    logger->trace("Replacing network configuration in {}", path);
    StateManager::save(config, path);
}
