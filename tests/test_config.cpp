#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "config/Config.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUnit.hpp"

using namespace HonestMark;

namespace {

struct TempDir {
    TempDir() : path(std::filesystem::temp_directory_path() / ("honestmark_test_" + std::to_string(Catch::rngSeed()))) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::filesystem::path path;
};

}

TEST_CASE("ParseWindowUnit maps unit names to window lengths") {
    CHECK(ParseWindowUnit("minutes") == std::chrono::minutes(1));
    CHECK(ParseWindowUnit("SECOND") == std::chrono::seconds(1));
    CHECK(ParseWindowUnit("Hours") == std::chrono::hours(1));
    CHECK(ParseWindowUnit("days") == std::chrono::hours(24));
    CHECK(ParseWindowUnit("milliseconds") == std::chrono::milliseconds(1));
    CHECK_THROWS_AS(ParseWindowUnit("fortnight"), std::invalid_argument);
    CHECK_THROWS_AS(ParseWindowUnit(""), std::invalid_argument);
}

TEST_CASE("Config loads values and appends missing keys") {
    TempDir dir;
    const auto file = dir.path / "config.json";
    {
        std::ofstream o(file);
        o << R"({"auth_token":"abc","request_limit":3,"custom":"kept"})";
    }

    Config config;
    config.Load(file.string());
    CHECK(config.auth_token == "abc");
    CHECK(config.request_limit == 3);
    CHECK(config.window_unit == "minutes");

    std::ifstream in(file);
    auto written = nlohmann::json::parse(in);
    CHECK(written["custom"] == "kept");
    CHECK(written["window_unit"] == "minutes");
    CHECK(written["request_limit"] == 3);
    CHECK(std::filesystem::exists(dir.path / "config.json.bak"));
}

TEST_CASE("Config reports missing and malformed files") {
    TempDir dir;
    Config config;
    CHECK_THROWS_WITH(config.Load((dir.path / "absent.json").string()), Catch::Matchers::StartsWith("Could not open config file"));

    const auto file = dir.path / "broken.json";
    {
        std::ofstream o(file);
        o << R"({"request_limit": "five")";
    }
    CHECK_THROWS_AS(config.Load(file.string()), std::runtime_error);
}

TEST_CASE("Config default file round-trips") {
    TempDir dir;
    const auto file = dir.path / "nested" / "config.json";
    Config::GetInstance().CreateDefault(file.string());

    Config config;
    config.Load(file.string());
    CHECK(config.auth_token == "YOUR_AUTH_TOKEN_HERE");
    CHECK(config.request_limit == 5);
    CHECK(config.api_url == "https://ismp.crpt.ru/api/v3/lk/documents/create");
    CHECK_FALSE(std::filesystem::exists(dir.path / "nested" / "config.json.bak"));
}

TEST_CASE("Logger parses level names") {
    CHECK(Logger::FromString("DEBUG") == LogLevel::Debug);
    CHECK(Logger::FromString("warning") == LogLevel::Warn);
    CHECK(Logger::FromString("err") == LogLevel::Error);
    CHECK(Logger::FromString("verbose") == LogLevel::Info);
    CHECK(std::string(Logger::ToString(LogLevel::Warn)) == "WARN");
}
