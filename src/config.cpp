// =============================================================================
// config.cpp - Config loading
// =============================================================================

#include "clamm/config.hpp"
#include "clamm/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace clamm {

using json = nlohmann::json;

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;
    try {
        json doc = json::parse(content.begin(), content.end());
        if (!doc.is_object()) {
            throw std::runtime_error("Invalid config: top level must be an object");
        }

        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
        }
        if (doc.contains("owner")) {
            config.owner = addresses::from_hex(doc.at("owner").get<std::string>());
        }
        if (doc.contains("core_address")) {
            config.core_address = addresses::from_hex(doc.at("core_address").get<std::string>());
        }
        if (doc.contains("max_lock_depth")) {
            config.max_lock_depth = doc.at("max_lock_depth").get<uint32_t>();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    return config;
}

std::string Config::to_json() const {
    json doc = {
        {"log_level", log_level},
        {"owner", addresses::to_hex(owner)},
        {"core_address", addresses::to_hex(core_address)},
        {"max_lock_depth", max_lock_depth},
    };
    return doc.dump(2);
}

void Config::validate() const {
    parse_log_level(log_level);
    if (addresses::is_zero(core_address)) {
        throw std::invalid_argument("core_address must be nonzero");
    }
    if (max_lock_depth == 0) {
        throw std::invalid_argument("max_lock_depth must be at least 1");
    }
}

} // namespace clamm
