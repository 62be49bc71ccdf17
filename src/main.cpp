#include <algorithm>
#include <iostream>
#include <memory>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include "../config/Config.hpp"
#include "core/DocumentClient.hpp"
#include "errors/ClientError.hpp"
#include "network/CurlTransport.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUnit.hpp"

namespace {

// Initialize global resources
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

const char* kSampleDocument = "Document on introducing goods into circulation";

} // anonymous namespace

// Usage: honestmark_submit [product-document-file] [signature] [product-group]
int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    CurlGlobal curl_global;

    // Load Config
    if (!std::filesystem::exists(config_path)) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
        try {
            HonestMark::Config::GetInstance().CreateDefault(config_path_str);
            HonestMark::Logger::Log(HonestMark::LogLevel::Info, "Default config.json created. Please set your auth_token and run again.");
            return 0;
        } catch (const std::exception& e) {
            HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Failed to create default config: " + std::string(e.what()));
            return 1;
        }
    }
    try {
        HonestMark::Config::GetInstance().Load(config_path_str);
    } catch (const std::runtime_error& e) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return 1;
    }
    const auto& config = HonestMark::Config::GetInstance();
    HonestMark::Logger::Init(exe_dir.string(), HonestMark::Logger::FromString(config.log_level));
    HonestMark::Logger::Log(HonestMark::LogLevel::Info, "Configuration loaded from: " + config_path_str);

    if (config.auth_token == "YOUR_AUTH_TOKEN_HERE" || config.auth_token.empty()) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Please set your auth_token in " + config_path_str);
        return 1;
    }

    // Determine worker count
    const unsigned int hardware_cores = std::thread::hardware_concurrency();
    HonestMark::ClientOptions options;
    options.request_limit = config.request_limit;
    options.auth_token = config.auth_token;
    options.api_url = config.api_url;
    if (config.max_concurrency > 0) {
        options.worker_threads = static_cast<size_t>(config.max_concurrency);
    } else {
        options.worker_threads = std::max(1u, hardware_cores / 2);
    }
    try {
        options.window_length = HonestMark::ParseWindowUnit(config.window_unit);
    } catch (const std::invalid_argument& e) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Error, e.what());
        return 1;
    }

    // Build the document
    std::string content = kSampleDocument;
    if (argc > 1) {
        std::ifstream in(argv[1], std::ios::binary);
        if (!in.is_open()) {
            HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Could not open product document: " + std::string(argv[1]));
            return 1;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        content = ss.str();
    }
    const std::string signature = argc > 2 ? argv[2] : "example-signature";
    HonestMark::ProductGroup group = HonestMark::ProductGroup::Shoes;
    if (argc > 3) {
        auto parsed = HonestMark::ProductGroupFromString(argv[3]);
        if (!parsed) {
            HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Unknown product group: " + std::string(argv[3]));
            return 1;
        }
        group = *parsed;
    }

    HonestMark::Document document = HonestMark::DocumentBuilder()
        .ProductDocument(content)
        .Group(group)
        .Format(HonestMark::DocumentFormat::Manual)
        .Type(HonestMark::DocumentType::LpIntroduceGoods)
        .Build();

    try {
        HonestMark::DocumentClient client(options, std::make_unique<HonestMark::CurlTransport>());
        HonestMark::DocumentResponse response = client.Submit(document, signature).get();

        HonestMark::Logger::Log(HonestMark::LogLevel::Info, "Value: " + response.value);
        HonestMark::Logger::Log(HonestMark::LogLevel::Info, "Error code: " + response.error_code);
        HonestMark::Logger::Log(HonestMark::LogLevel::Info, "Error message: " + response.error_message);
        HonestMark::Logger::Log(HonestMark::LogLevel::Info, "Error description: " + response.error_description);
        client.Close();
    } catch (const HonestMark::ApiError& e) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Error, "API error (status " + std::to_string(e.status_code()) + "): " + e.what());
        return 1;
    } catch (const std::exception& e) {
        HonestMark::Logger::Log(HonestMark::LogLevel::Error, "Failed to submit document: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
