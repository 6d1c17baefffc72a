#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace netguard {

// Domain under which every transport setting is stored.
inline constexpr const char* kNetworkDomain = "network";

// Lookup service mapping (domain, service name, version) to a JSON settings
// object. Storage and distribution of the settings live outside this library.
class ConfigSource {
public:
    virtual ~ConfigSource() = default;

    /**
     * Retrieves the settings object for a service.
     * @return JSON object text, or nullopt when no such entry exists.
     */
    virtual std::optional<std::string> lookup(const std::string& domain,
                                              const std::string& service_name,
                                              const std::string& version) const = 0;
};

// Thread-safe in-process ConfigSource, optionally filled from a delimited file.
class InMemoryConfigSource : public ConfigSource {
public:
    InMemoryConfigSource() = default;

    std::optional<std::string> lookup(const std::string& domain,
                                      const std::string& service_name,
                                      const std::string& version) const override;

    // Stores (or replaces) an entry. The settings text is stored verbatim.
    // Throws ConfigurationError unless every key part is a valid identifier.
    void add(const std::string& domain, const std::string& service_name,
             const std::string& version, const std::string& settings_json);

    /**
     * Loads rows of "service_type,service_name,version,settings" from a file
     * with that header line. The settings column runs to the end of the line.
     * Rows parsed before an error are kept.
     * @return false if the file is missing, the header is wrong, or a row is malformed.
     */
    bool load_delimited_file(const std::string& path);

    std::size_t size() const;

private:
    using Key = std::tuple<std::string, std::string, std::string>;

    std::map<Key, std::string> entries_;
    mutable std::mutex mutex_;
};

}
