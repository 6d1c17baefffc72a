#include "config_source.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"

#include <fstream>
#include <vector>

namespace netguard {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

// Splits the first `fields - 1` commas; the last field keeps the remainder.
std::vector<std::string> split_leading(const std::string& line, std::size_t fields) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (out.size() + 1 < fields) {
        auto pos = line.find(',', start);
        if (pos == std::string::npos) break;
        out.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    out.push_back(trim(line.substr(start)));
    return out;
}

}

std::optional<std::string> InMemoryConfigSource::lookup(const std::string& domain,
                                                        const std::string& service_name,
                                                        const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(Key{domain, service_name, version});
    if (it == entries_.end()) {
        SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::CONFIG_ERROR,
                            "internal", "Config not found: " + domain + "/" + service_name + "/" + version);
        return std::nullopt;
    }
    return it->second;
}

void InMemoryConfigSource::add(const std::string& domain, const std::string& service_name,
                               const std::string& version, const std::string& settings_json) {
    for (const auto* part : {&domain, &service_name, &version}) {
        if (!InputValidator::is_valid_identifier(*part)) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", "Invalid config key component: " + *part);
            throw ConfigurationError("Invalid config key component: '" + *part + "'");
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[Key{domain, service_name, version}] = settings_json;
}

bool InMemoryConfigSource::load_delimited_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                            "internal", "Cannot open config file: " + path);
        return false;
    }

    std::string header;
    if (!std::getline(file, header) ||
        split_leading(header, 4) != std::vector<std::string>{"service_type", "service_name", "version", "settings"}) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                            "internal", "Config file missing required columns: " + path);
        return false;
    }

    std::string line;
    std::size_t line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        auto fields = split_leading(line, 4);
        if (fields.size() != 4 || fields[0].empty() || fields[1].empty() || fields[2].empty()) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", path + ":" + std::to_string(line_no) + " malformed row");
            return false;
        }

        try {
            auto settings = InputValidator::safe_parse_json(fields[3]);
            if (!settings.is_object()) {
                SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                                    "internal", path + ":" + std::to_string(line_no) + " settings is not an object");
                return false;
            }
            add(fields[0], fields[1], fields[2], boost::json::serialize(settings));
        } catch (const std::exception& e) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                                "internal", path + ":" + std::to_string(line_no) + " " + e.what());
            return false;
        }
    }

    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE,
                        "internal", "Loaded " + std::to_string(size()) + " config entries from " + path);
    return true;
}

std::size_t InMemoryConfigSource::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
