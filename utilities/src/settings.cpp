#include "settings.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;

static std::vector<std::string> capabilities_of(const json& entry) {
    return entry.value("capabilities", std::vector<std::string>());
}

Settings Settings::parse(const std::string& text, const std::string& source) {
    Settings settings;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw NetConfigError(ErrorKind::INVALID_FORMAT, source + ": settings must be a JSON object");
        }

        settings.store_path = j.value("store", settings.store_path);
        settings.log_file = j.value("log_file", settings.log_file);
        if (j.contains("log_level")) {
            settings.log_level = parse_log_level(j.at("log_level").get<std::string>());
        }
        settings.required_capability = j.value("required_capability", settings.required_capability);

        if (j.contains("defaults")) {
            const json& d = j.at("defaults");
            settings.defaults.address_space = d.value("address_space", settings.defaults.address_space);
            settings.defaults.subnet_cidr_offset = d.value("subnet_cidr_offset", settings.defaults.subnet_cidr_offset);
            settings.defaults.subnet_name = d.value("subnet_name", settings.defaults.subnet_name);
            if (settings.defaults.subnet_cidr_offset < 0 || settings.defaults.subnet_cidr_offset > 32) {
                throw NetConfigError(ErrorKind::INVALID_ARGUMENT,
                                     source + ": defaults.subnet_cidr_offset must be between 0 and 32");
            }
        }

        for (const auto& g : j.value("affinity_groups", json::array())) {
            settings.affinity_groups.push_back({g.at("name").get<std::string>(),
                                                g.at("location").get<std::string>(),
                                                capabilities_of(g)});
        }
        for (const auto& l : j.value("locations", json::array())) {
            settings.locations.push_back({l.at("name").get<std::string>(), capabilities_of(l)});
        }
    } catch (const json::exception& ex) {
        throw NetConfigError(ErrorKind::INVALID_FORMAT, source + ": invalid settings: " + ex.what());
    }
    return settings;
}

Settings Settings::load(const std::string& path, bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            throw NetConfigError(ErrorKind::NOT_FOUND, "settings file '" + path + "' does not exist");
        }
        logger->debug("No settings file at {}, using defaults", path);
        return Settings();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw NetConfigError(ErrorKind::STORE_FAILURE, "could not open settings file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path);
}
