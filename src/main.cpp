// import cryptophage
#include "cryptophage/config.hpp"
#include "cryptophage/gpg.hpp"
#include "cryptophage/gpg_command_executor.hpp"
#include "cryptophage/logger.hpp"

#include <algorithm>    // for find
#include <chrono>       // for seconds, year_month_day
#include <expected>     // for expected, unexpected
#include <memory>       // for shared_ptr
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

#include <fmt/core.h>

#include <spdlog/async.h>                    // for create_async
#include <spdlog/common.h>                   // for level
#include <spdlog/sinks/basic_file_sink.h>    // for basic_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_mt
#include <spdlog/spdlog.h>                   // for set_default_logger, set_level

using namespace std::string_view_literals;

namespace {

constexpr auto USAGE = R"(Usage: cryptophage [--config=PATH] <command> [args]

Commands:
  encrypt INPUT OUTPUT RECIPIENT
  decrypt INPUT OUTPUT PASSPHRASE
  sign INPUT OUTPUT PASSPHRASE [--detached] [--clear]
  verify INPUT
  list-keys [--secret]
)"sv;

auto has_flag(const std::vector<std::string_view>& args, std::string_view flag) noexcept -> bool {
    return std::ranges::find(args, flag) != args.end();
}

// positional arguments of the command, flags removed
auto positional_args(const std::vector<std::string_view>& args) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> res{};
    for (auto&& arg : args) {
        if (!arg.starts_with("--"sv)) {
            res.push_back(arg);
        }
    }
    return res;
}

void init_logger(const cryptophage::Config& config) noexcept {
    std::shared_ptr<spdlog::logger> logger{};
    if (config.log_file) {
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("cryptophage_logger", *config.log_file);
        spdlog::flush_every(std::chrono::seconds(5));
    } else {
        logger = spdlog::stderr_color_mt("cryptophage_logger");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(config.log_level);

    // Set library logger.
    cryptophage::logger::set_logger(logger);
}

auto report(const std::expected<void, cryptophage::Error>& result, std::string_view command) noexcept -> int {
    if (!result) {
        fmt::print(stderr, "{} failed: {}\n", command, result.error().to_string());
        return 1;
    }
    return 0;
}

auto run_list_keys(const cryptophage::gpg::GpgCommandExecutor& executor, bool secret, const cryptophage::gpg::GpgOptions& options) noexcept -> int {
    auto keys = secret ? cryptophage::gpg::get_private_keys(executor, options) : cryptophage::gpg::get_public_keys(executor, options);
    if (!keys) {
        return report(std::unexpected(std::move(keys.error())), "list-keys"sv);
    }

    using cryptophage::gpg::GpgRecordType;
    for (auto&& key : *keys) {
        if (key.record_type == GpgRecordType::PublicKey || key.record_type == GpgRecordType::SecretKey) {
            const std::chrono::year_month_day created{std::chrono::floor<std::chrono::days>(key.creation_date)};
            fmt::print("{} {:>5} {} created {:04}-{:02}-{:02}\n", key.record_type == GpgRecordType::SecretKey ? "sec"sv : "pub"sv,
                key.key_length, key.key_id, static_cast<int>(created.year()), static_cast<unsigned>(created.month()), static_cast<unsigned>(created.day()));
        } else if (key.record_type == GpgRecordType::UserId) {
            fmt::print("uid       {}\n", key.user_id);
        }
    }
    return 0;
}

auto run_command(const cryptophage::Config& config, std::string_view command, const std::vector<std::string_view>& args) noexcept -> int {
    auto executor = config.gpg_path ? std::expected<cryptophage::gpg::GpgCommandExecutor, cryptophage::Error>{*config.gpg_path}
                                    : cryptophage::gpg::GpgCommandExecutor::discover();
    if (!executor) {
        return report(std::unexpected(std::move(executor.error())), command);
    }

    const auto& options    = cryptophage::make_gpg_options(config);
    const auto& positional = positional_args(args);

    if (command == "encrypt"sv && positional.size() == 3) {
        return report(cryptophage::gpg::encrypt(*executor, positional[0], positional[1], positional[2], options), command);
    } else if (command == "decrypt"sv && positional.size() == 3) {
        return report(cryptophage::gpg::decrypt(*executor, positional[0], positional[1], positional[2], options), command);
    } else if (command == "sign"sv && positional.size() == 3) {
        const bool detached  = has_flag(args, "--detached"sv);
        const bool cleartext = has_flag(args, "--clear"sv);
        return report(cryptophage::gpg::sign(*executor, positional[0], positional[1], detached, cleartext, positional[2], options), command);
    } else if (command == "verify"sv && positional.size() == 1) {
        auto verified = cryptophage::gpg::verify(*executor, positional[0], options);
        if (!verified) {
            return report(std::unexpected(std::move(verified.error())), command);
        }
        fmt::print("{}\n", *verified ? "Good signature"sv : "BAD signature"sv);
        return *verified ? 0 : 1;
    } else if (command == "list-keys"sv && positional.empty()) {
        return run_list_keys(*executor, has_flag(args, "--secret"sv), options);
    }

    fmt::print(stderr, "{}", USAGE);
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        fmt::print(stderr, "{}", USAGE);
        return 1;
    }
    const auto& all_args = std::span{argv, static_cast<std::size_t>(argc)}.subspan(1);

    std::string_view config_path{};
    std::vector<std::string_view> args{};
    for (const char* arg : all_args) {
        const std::string_view arg_view{arg};
        if (arg_view.starts_with("--config="sv)) {
            config_path = arg_view.substr("--config="sv.size());
        } else {
            args.push_back(arg_view);
        }
    }
    if (args.empty()) {
        fmt::print(stderr, "{}", USAGE);
        return 1;
    }

    auto config = config_path.empty() ? std::expected<cryptophage::Config, std::string>{cryptophage::get_default_config()}
                                      : cryptophage::load_config(config_path);
    if (!config) {
        return report(std::unexpected(cryptophage::make_error(cryptophage::ErrorKind::InvalidConfig, std::move(config.error()))), "load config"sv);
    }

    // Initialize logger.
    init_logger(*config);

    const auto command = args.front();
    args.erase(args.begin());
    const auto ret_code = run_command(*config, command, args);

    spdlog::shutdown();
    return ret_code;
}
