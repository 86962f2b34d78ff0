// =============================================================================
// config.cpp - Engine Configuration Loading
// =============================================================================

#include "dsc/config.hpp"
#include "dsc/errors.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dsc {

namespace {

spdlog::level::level_enum parse_level(const std::string& name) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        throw EngineError(ErrorKind::INVALID_CONFIGURATION, "unknown log level: " + name);
    }
    return level;
}

std::vector<Address> parse_address_list(const nlohmann::json& doc, const char* key) {
    std::vector<Address> out;
    if (!doc.contains(key)) return out;

    const nlohmann::json& list = doc.at(key);
    if (!list.is_array()) {
        throw EngineError(ErrorKind::INVALID_CONFIGURATION, std::string(key) + " must be an array");
    }
    for (const auto& item : list) {
        out.push_back(addresses::from_hex(item.get<std::string>()));
    }
    return out;
}

} // namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw EngineError(ErrorKind::INVALID_CONFIGURATION, "cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

EngineConfig EngineConfig::from_json(std::string_view content) {
    EngineConfig config;
    try {
        nlohmann::json doc = nlohmann::json::parse(content.begin(), content.end());
        if (!doc.is_object()) {
            throw EngineError(ErrorKind::INVALID_CONFIGURATION, "config root must be an object");
        }
        if (!doc.contains("engine_address")) {
            throw EngineError(ErrorKind::INVALID_CONFIGURATION, "engine_address is required");
        }

        config.engine_address = addresses::from_hex(doc.at("engine_address").get<std::string>());
        config.collateral_tokens = parse_address_list(doc, "collateral_tokens");
        config.price_feeds = parse_address_list(doc, "price_feeds");

        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
            parse_level(config.log_level);
        }
    } catch (const nlohmann::json::exception& e) {
        throw EngineError(ErrorKind::INVALID_CONFIGURATION, e.what());
    }
    return config;
}

void configure_logging(const EngineConfig& config) {
    spdlog::set_level(parse_level(config.log_level));
}

} // namespace dsc
