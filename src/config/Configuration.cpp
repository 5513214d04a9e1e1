#include "config/Configuration.hpp"
#include "const/defaults.hpp"
#include <fstream>
#include <cstdlib>
#include <cstring>
#include <cerrno>

namespace uppy {

void to_json(nlohmann::json& j, const Configuration& config) {
    j = nlohmann::json{{"host", config.host}, {"token", config.token}};
}

void from_json(const nlohmann::json& j, Configuration& config) {
    j.at("host").get_to(config.host);
    j.at("token").get_to(config.token);
}

bool containsControlCharacters(const std::string& value) {
    for (char c : value) {
        unsigned char u = static_cast<unsigned char>(c);
        if ((u < 0x20 && u != '\t') || u == 0x7f) return true;
    }
    return false;
}

ConfigStore::ConfigStore(const std::filesystem::path& configDir)
    : configDir_(configDir) {}

std::filesystem::path ConfigStore::getConfigFile() const {
    return configDir_ / CONFIG_FILE_NAME;
}

std::filesystem::path ConfigStore::configDirectoryFromEnvironment() {
    const char* profileVar = "HOME";
    const char* profile = std::getenv(profileVar);
    if (profile == nullptr || *profile == '\0') {
        throw ConfigError(std::string(profileVar) + " is not set, cannot locate the configuration directory");
    }
    return std::filesystem::path(profile) / CONFIG_SUBDIR / CONFIG_APP_DIR;
}

bool ConfigStore::bootstrap() const {
    std::error_code ec;
    if (std::filesystem::exists(configDir_, ec)) {
        return false;
    }
    if (ec) {
        throw ConfigError("Failed to inspect " + configDir_.string() + " (" + ec.message() + ")");
    }

    std::filesystem::create_directories(configDir_, ec);
    if (ec) {
        throw ConfigError("Failed to create " + configDir_.string() + " (" + ec.message() + ")");
    }

    writeTemplate();
    return true;
}

void ConfigStore::writeTemplate() const {
    Configuration blank{TEMPLATE_HOST, ""};
    nlohmann::json j = blank;

    std::ofstream file(getConfigFile());
    if (!file.is_open()) {
        throw ConfigError("Failed to write to configuration file " + getConfigFile().string() +
                          " (" + std::strerror(errno) + "), please fill it out manually");
    }
    file << j.dump(4) << '\n';
}

Configuration ConfigStore::load() const {
    std::ifstream file(getConfigFile());
    if (!file.is_open()) {
        throw ConfigError("Failed to read " + getConfigFile().string() + " (" + std::strerror(errno) + ")");
    }

    Configuration config;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = j.get<Configuration>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(getConfigFile().string() + " is not formatted properly: " + e.what());
    }

    if (containsControlCharacters(config.token)) {
        throw ConfigError("token in " + getConfigFile().string() + " contains control characters");
    }
    return config;
}

} // namespace uppy
