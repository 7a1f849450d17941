#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "cryptophage/gpg.hpp"
#include "cryptophage/gpg_command.hpp"

#include <chrono>       // for milliseconds
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/common.h>

namespace cryptophage {

/// Configuration of the command line front-end.
struct Config {
    // gpg
    std::optional<std::string> gpg_path{};
    std::optional<std::string> home_directory{};
    std::chrono::milliseconds timeout{gpg::DEFAULT_TIMEOUT};
    gpg::TrustModel trust_model{gpg::TrustModel::Always};

    // Logging
    spdlog::level::level_enum log_level{spdlog::level::info};
    std::optional<std::string> log_file{};
};

/// Parses configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return Config on success, or error string on failure.
[[nodiscard]] auto parse_config(std::string_view json_content) noexcept
    -> std::expected<Config, std::string>;

/// Reads and parses the configuration file.
/// @param config_path Path of the JSON file.
/// @return Config on success, or error string on failure.
[[nodiscard]] auto load_config(std::string_view config_path) noexcept
    -> std::expected<Config, std::string>;

/// Returns default Config.
[[nodiscard]] auto get_default_config() noexcept -> Config;

/// Options for the gpg helpers taken from the configuration.
[[nodiscard]] auto make_gpg_options(const Config& config) noexcept -> gpg::GpgOptions;

}  // namespace cryptophage

#endif  // CONFIG_HPP
