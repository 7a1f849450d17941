#include "cryptophage/gpg_command.hpp"
#include "cryptophage/argument_line.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace cryptophage::gpg {

auto trust_model_to_string(TrustModel model) noexcept -> std::string_view {
    switch (model) {
    case TrustModel::Pgp:
        return "pgp"sv;
    case TrustModel::Classic:
        return "classic"sv;
    case TrustModel::Direct:
        return "direct"sv;
    case TrustModel::Always:
        return "always"sv;
    case TrustModel::Auto:
        return "auto"sv;
    }
    return "auto"sv;
}

auto trust_model_from_string(std::string_view model_str) noexcept -> std::optional<TrustModel> {
    for (const auto model : {TrustModel::Pgp, TrustModel::Classic, TrustModel::Direct, TrustModel::Always, TrustModel::Auto}) {
        if (trust_model_to_string(model) == model_str) {
            return model;
        }
    }
    return std::nullopt;
}

GpgCommand::GpgCommand(std::string_view operation) noexcept
  : m_operation(operation) { }

auto GpgCommand::sign() noexcept -> GpgCommand {
    return GpgCommand{"--sign"sv};
}

auto GpgCommand::sign_detached() noexcept -> GpgCommand {
    return GpgCommand{"--detach-sign"sv};
}

auto GpgCommand::clear_sign() noexcept -> GpgCommand {
    return GpgCommand{"--clearsign"sv};
}

auto GpgCommand::encrypt() noexcept -> GpgCommand {
    return GpgCommand{"--encrypt"sv};
}

auto GpgCommand::encrypt_sign() noexcept -> GpgCommand {
    return GpgCommand{"--encrypt --sign"sv};
}

auto GpgCommand::decrypt() noexcept -> GpgCommand {
    return GpgCommand{"--decrypt"sv};
}

auto GpgCommand::verify() noexcept -> GpgCommand {
    return GpgCommand{"--verify"sv};
}

auto GpgCommand::list_public_keys() noexcept -> GpgCommand {
    return GpgCommand{"--list-public-keys"sv};
}

auto GpgCommand::list_secret_keys() noexcept -> GpgCommand {
    return GpgCommand{"--list-secret-keys"sv};
}

auto GpgCommand::command(std::string_view operation) noexcept -> GpgCommand {
    return GpgCommand{operation};
}

auto GpgCommand::recipient(std::string_view user_id) noexcept -> GpgCommand& {
    return add_option("--recipient"sv, user_id);
}

auto GpgCommand::local_user(std::string_view user_id) noexcept -> GpgCommand& {
    return add_option("--local-user"sv, user_id);
}

auto GpgCommand::armored_output() noexcept -> GpgCommand& {
    return add_option("--armor");
}

auto GpgCommand::non_armored_output() noexcept -> GpgCommand& {
    return add_option("--no-armor");
}

auto GpgCommand::compression_level(std::int32_t level) noexcept -> GpgCommand& {
    return add_option(fmt::format(FMT_COMPILE("-z {}"), level));
}

auto GpgCommand::home_directory(std::string_view path) noexcept -> GpgCommand& {
    return add_option("--homedir"sv, path);
}

auto GpgCommand::passphrase(std::string_view passphrase) noexcept -> GpgCommand& {
    return add_option("--passphrase"sv, passphrase);
}

auto GpgCommand::quiet() noexcept -> GpgCommand& {
    return add_option("--no-verbose --quiet --no-tty");
}

auto GpgCommand::batch(bool use_batch) noexcept -> GpgCommand& {
    return add_option(use_batch ? "--batch" : "--no-batch");
}

auto GpgCommand::trust_model(TrustModel model) noexcept -> GpgCommand& {
    return add_option(fmt::format(FMT_COMPILE("--trust-model {}"), trust_model_to_string(model)));
}

auto GpgCommand::with_colons() noexcept -> GpgCommand& {
    return add_option("--with-colons");
}

auto GpgCommand::fixed_list_mode() noexcept -> GpgCommand& {
    return add_option("--fixed-list-mode");
}

auto GpgCommand::input_file(std::string_view path) noexcept -> GpgCommand& {
    m_input_file = std::string{path};
    return *this;
}

auto GpgCommand::output_file(std::string_view path) noexcept -> GpgCommand& {
    return add_option("--output"sv, path);
}

auto GpgCommand::yes() noexcept -> GpgCommand& {
    return add_option("--yes");
}

auto GpgCommand::option(std::string_view option) noexcept -> GpgCommand& {
    return add_option(std::string{option});
}

auto GpgCommand::to_string() const noexcept -> std::string {
    std::string res{};
    for (const auto& option : m_options) {
        res += option;
        res += ' ';
    }
    res += m_operation;

    if (m_input_file) {
        res += ' ';
        res += utils::quote_argument(*m_input_file);
    }
    return res;
}

auto GpgCommand::add_option(std::string option) noexcept -> GpgCommand& {
    m_options.push_back(std::move(option));
    return *this;
}

auto GpgCommand::add_option(std::string_view name, std::string_view value) noexcept -> GpgCommand& {
    return add_option(fmt::format(FMT_COMPILE("{} {}"), name, utils::quote_argument(value)));
}

}  // namespace cryptophage::gpg
