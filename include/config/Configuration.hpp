#pragma once

#include <string>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace uppy {

struct Configuration {
    std::string host;   // base URL, e.g. https://example.com
    std::string token;  // sent verbatim as the Authorization header
};

void to_json(nlohmann::json& j, const Configuration& config);
void from_json(const nlohmann::json& j, Configuration& config);

// CR, LF and other control bytes (tab excepted) are not allowed in header values
bool containsControlCharacters(const std::string& value);

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Owns the per-user config directory and the config.json inside it.
 * The program never rewrites an existing config; users edit it by hand.
 */
class ConfigStore {
public:
    explicit ConfigStore(const std::filesystem::path& configDir);

    /**
     * Creates the config directory and a template config.json when the directory is absent.
     * @return true when the template was just written (first run), false when it already existed
     * @throws ConfigError when the directory or the template cannot be written
     */
    bool bootstrap() const;

    /**
     * Reads and validates config.json.
     * @throws ConfigError on a missing/unreadable file, malformed JSON or a token
     *         that cannot be sent as a header value
     */
    Configuration load() const;

    const std::filesystem::path& getConfigDir() const { return configDir_; }
    std::filesystem::path getConfigFile() const;

    // $HOME/.config/uppy. Throws ConfigError if the variable is unset.
    static std::filesystem::path configDirectoryFromEnvironment();

private:
    std::filesystem::path configDir_;

    void writeTemplate() const;
};

} // namespace uppy
