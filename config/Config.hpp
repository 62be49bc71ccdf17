#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace HonestMark {
    struct Config {
        std::string api_url = "https://ismp.crpt.ru/api/v3/lk/documents/create";
        std::string auth_token = "YOUR_AUTH_TOKEN_HERE";
        int request_limit = 5;
        std::string window_unit = "minutes";
        long http_timeout_ms = 30000;
        long http_connect_timeout_ms = 10000;
        std::string http_user_agent = "HonestMarkClient/1.0";
        int max_concurrency = 0; // 0 = half of the hardware threads
        std::string log_level = "info";

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}
