#include "doctest_compatibility.h"

#include "cryptophage/config.hpp"

#include <unistd.h>  // for getpid

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <fmt/compile.h>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace std::string_literals;
using namespace std::string_view_literals;
using namespace std::chrono_literals;

TEST_CASE("config parse test")
{
    using cryptophage::gpg::TrustModel;

    SECTION("empty content gives the defaults")
    {
        const auto& config = cryptophage::parse_config(""sv);
        REQUIRE(config);
        REQUIRE(!config->gpg_path.has_value());
        REQUIRE(!config->home_directory.has_value());
        REQUIRE_EQ(config->timeout, 30000ms);
        REQUIRE_EQ(config->trust_model, TrustModel::Always);
        REQUIRE_EQ(config->log_level, spdlog::level::info);
        REQUIRE(!config->log_file.has_value());
    }
    SECTION("empty object gives the defaults")
    {
        const auto& config = cryptophage::parse_config("{}"sv);
        REQUIRE(config);
        REQUIRE_EQ(config->timeout, cryptophage::gpg::DEFAULT_TIMEOUT);
        REQUIRE_EQ(config->trust_model, TrustModel::Always);
    }
    SECTION("every key")
    {
        static constexpr auto content = R"({
    "gpg_path": "/opt/gnupg/bin/gpg2",
    "homedir": "/home/alice/.gnupg",
    "timeout_ms": 1500,
    "trust_model": "pgp",
    "log_level": "debug",
    "log_file": "/tmp/cryptophage.log"
})"sv;
        const auto& config = cryptophage::parse_config(content);
        REQUIRE(config);
        REQUIRE_EQ(config->gpg_path, "/opt/gnupg/bin/gpg2"s);
        REQUIRE_EQ(config->home_directory, "/home/alice/.gnupg"s);
        REQUIRE_EQ(config->timeout, 1500ms);
        REQUIRE_EQ(config->trust_model, TrustModel::Pgp);
        REQUIRE_EQ(config->log_level, spdlog::level::debug);
        REQUIRE_EQ(config->log_file, "/tmp/cryptophage.log"s);

        const auto& options = cryptophage::make_gpg_options(*config);
        REQUIRE_EQ(options.home_directory, "/home/alice/.gnupg"s);
        REQUIRE_EQ(options.trust_model, TrustModel::Pgp);
        REQUIRE_EQ(options.timeout, 1500ms);
    }
    SECTION("log level off is accepted")
    {
        const auto& config = cryptophage::parse_config(R"({"log_level": "off"})"sv);
        REQUIRE(config);
        REQUIRE_EQ(config->log_level, spdlog::level::off);
    }
    SECTION("invalid values")
    {
        auto config = cryptophage::parse_config(R"({"trust_model": "everyone"})"sv);
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), "Invalid trust_model 'everyone'. Must be one of: pgp, classic, direct, always, auto"s);

        config = cryptophage::parse_config(R"({"trust_model": 1})"sv);
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), "'trust_model' must be a string"s);

        config = cryptophage::parse_config(R"({"log_level": "loud"})"sv);
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), "Invalid log_level 'loud'"s);

        config = cryptophage::parse_config(R"({"gpg_path": ["gpg"]})"sv);
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), "'gpg_path' must be a string"s);

        config = cryptophage::parse_config(R"({"homedir": null})"sv);
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), "'homedir' must be a string"s);

        for (const auto content : {R"({"timeout_ms": 0})"sv, R"({"timeout_ms": -5})"sv, R"({"timeout_ms": "10"})"sv, R"({"timeout_ms": 1.5})"sv,
                 R"({"timeout_ms": 31536000001})"sv, R"({"timeout_ms": 10000000000000})"sv}) {
            CAPTURE(content);
            config = cryptophage::parse_config(content);
            REQUIRE(!config);
            REQUIRE_EQ(config.error(), "'timeout_ms' must be a positive integer not above 31536000000"s);
        }

        // a year is the longest timeout
        config = cryptophage::parse_config(R"({"timeout_ms": 31536000000})"sv);
        REQUIRE(config);
        REQUIRE_EQ(config->timeout, std::chrono::hours{24 * 365});
    }
    SECTION("malformed documents")
    {
        auto config = cryptophage::parse_config(R"({"homedir": )"sv);
        REQUIRE(!config);
        REQUIRE(config.error().starts_with("JSON parse error at offset "sv));

        config = cryptophage::parse_config(R"(["homedir"])"sv);
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), "JSON root must be an object"s);
    }
}

TEST_CASE("config load test")
{
    const auto& config_path = fs::temp_directory_path() / fmt::format(FMT_COMPILE("cryptophage-config-{}.json"), ::getpid());

    SECTION("missing file")
    {
        fs::remove(config_path);
        const auto& config = cryptophage::load_config(config_path.string());
        REQUIRE(!config);
        REQUIRE_EQ(config.error(), fmt::format(FMT_COMPILE("Failed to open config file '{}': No such file or directory"), config_path.string()));
    }
    SECTION("file content is parsed")
    {
        {
            std::ofstream config_file{config_path};
            config_file << R"({"timeout_ms": 250, "trust_model": "direct"})";
        }
        const auto& config = cryptophage::load_config(config_path.string());
        fs::remove(config_path);

        REQUIRE(config);
        REQUIRE_EQ(config->timeout, 250ms);
        REQUIRE_EQ(config->trust_model, cryptophage::gpg::TrustModel::Direct);
    }
    SECTION("defaults")
    {
        const auto& config  = cryptophage::get_default_config();
        const auto& options = cryptophage::make_gpg_options(config);
        REQUIRE(!options.home_directory.has_value());
        REQUIRE_EQ(options.trust_model, cryptophage::gpg::TrustModel::Always);
        REQUIRE_EQ(options.timeout, cryptophage::gpg::DEFAULT_TIMEOUT);
    }
}
