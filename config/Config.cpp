#include "Config.hpp"
#include "../src/utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace HonestMark {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["api_url"] = api_url;
    data["auth_token"] = auth_token;
    data["request_limit"] = request_limit;
    data["window_unit"] = window_unit;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_connect_timeout_ms"] = http_connect_timeout_ms;
    data["http_user_agent"] = http_user_agent;
    data["max_concurrency"] = max_concurrency;
    data["log_level"] = log_level;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    f.close();

    const Config defaults;
    try {
        api_url = data.value("api_url", defaults.api_url);
        auth_token = data.value("auth_token", defaults.auth_token);
        request_limit = data.value("request_limit", defaults.request_limit);
        window_unit = data.value("window_unit", defaults.window_unit);
        http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
        http_connect_timeout_ms = data.value("http_connect_timeout_ms", defaults.http_connect_timeout_ms);
        http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
        max_concurrency = data.value("max_concurrency", defaults.max_concurrency);
        log_level = data.value("log_level", defaults.log_level);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    // Append options missing from an older config.json; unknown keys are kept.
    bool changed = false;
    const nlohmann::json current = ToJson();
    for (const auto& item : current.items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path bak(path);
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(path, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            Logger::Log(LogLevel::Warn, "Could not write new config keys to " + path);
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << Config{}.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
