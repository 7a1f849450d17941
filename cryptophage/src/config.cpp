#include "cryptophage/config.hpp"

#include <cerrno>    // for errno
#include <cstring>   // for strerror
#include <fstream>   // for ifstream
#include <iterator>  // for istreambuf_iterator
#include <utility>   // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// one year
constexpr std::chrono::milliseconds MAX_TIMEOUT = std::chrono::hours{24 * 365};

auto parse_optional_string(const rapidjson::Document& doc, const char* name, std::optional<std::string>& value) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(name)) {
        return {};
    }
    if (!doc[name].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), name));
    }
    value = doc[name].GetString();
    return {};
}

}  // namespace

namespace cryptophage {

auto get_default_config() noexcept -> Config {
    return Config{
        .timeout     = gpg::DEFAULT_TIMEOUT,
        .trust_model = gpg::TrustModel::Always,
        .log_level   = spdlog::level::info,
    };
}

auto make_gpg_options(const Config& config) noexcept -> gpg::GpgOptions {
    return gpg::GpgOptions{
        .home_directory = config.home_directory,
        .trust_model    = config.trust_model,
        .timeout        = config.timeout,
    };
}

auto parse_config(std::string_view json_content) noexcept
    -> std::expected<Config, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"), doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    if (auto res = parse_optional_string(doc, "gpg_path", config.gpg_path); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = parse_optional_string(doc, "homedir", config.home_directory); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = parse_optional_string(doc, "log_file", config.log_file); !res) {
        return std::unexpected(std::move(res.error()));
    }

    // Parse timeout (optional, milliseconds)
    if (doc.HasMember("timeout_ms")) {
        if (!doc["timeout_ms"].IsInt64() || doc["timeout_ms"].GetInt64() <= 0 || doc["timeout_ms"].GetInt64() > MAX_TIMEOUT.count()) {
            return std::unexpected(fmt::format(FMT_COMPILE("'timeout_ms' must be a positive integer not above {}"), MAX_TIMEOUT.count()));
        }
        config.timeout = std::chrono::milliseconds{doc["timeout_ms"].GetInt64()};
    }

    // Parse trust_model (optional, default always)
    if (doc.HasMember("trust_model")) {
        if (!doc["trust_model"].IsString()) {
            return std::unexpected("'trust_model' must be a string");
        }
        const std::string_view model_str{doc["trust_model"].GetString(), doc["trust_model"].GetStringLength()};
        auto trust_model = gpg::trust_model_from_string(model_str);
        if (!trust_model) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid trust_model '{}'. Must be one of: pgp, classic, direct, always, auto"), model_str));
        }
        config.trust_model = *trust_model;
    }

    // Parse log_level (optional, default info)
    if (doc.HasMember("log_level")) {
        if (!doc["log_level"].IsString()) {
            return std::unexpected("'log_level' must be a string");
        }
        const std::string_view level_str{doc["log_level"].GetString(), doc["log_level"].GetStringLength()};
        const auto log_level = spdlog::level::from_str(std::string{level_str});
        if (log_level == spdlog::level::off && level_str != "off"sv) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid log_level '{}'"), level_str));
        }
        config.log_level = log_level;
    }

    return config;
}

auto load_config(std::string_view config_path) noexcept
    -> std::expected<Config, std::string> {
    std::ifstream config_file{std::string{config_path}};
    if (!config_file.is_open()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open config file '{}': {}"), config_path, std::strerror(errno)));
    }

    const std::string json_content{std::istreambuf_iterator<char>{config_file}, std::istreambuf_iterator<char>{}};
    if (config_file.bad()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read config file '{}'"), config_path));
    }

    spdlog::debug("[config] loaded '{}'", config_path);
    return parse_config(json_content);
}

}  // namespace cryptophage
