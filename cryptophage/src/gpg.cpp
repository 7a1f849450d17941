#include "cryptophage/gpg.hpp"
#include "cryptophage/gpg_key_reader.hpp"
#include "cryptophage/stream.hpp"

#include <sstream>  // for stringstream
#include <utility>  // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using cryptophage::Error;
using cryptophage::gpg::GpgCommand;
using cryptophage::gpg::GpgCommandExecutor;
using cryptophage::gpg::GpgKey;
using cryptophage::gpg::GpgOptions;

// --batch --quiet with the configured trust model and home directory
auto apply_common_options(GpgCommand& command, const GpgOptions& options, bool with_trust_model = true) noexcept -> GpgCommand& {
    command.batch(true).quiet();
    if (with_trust_model) {
        command.trust_model(options.trust_model);
    }
    if (options.home_directory) {
        command.home_directory(*options.home_directory);
    }
    return command;
}

auto list_keys(const GpgCommandExecutor& executor, GpgCommand command, const GpgOptions& options) noexcept -> std::expected<std::vector<GpgKey>, Error> {
    command.with_colons().fixed_list_mode();
    apply_common_options(command, options, false);

    std::stringstream listing{};
    cryptophage::io::OutputStreamAdapter output{listing};
    if (auto res = executor.execute(command, nullptr, &output, options.timeout); !res) {
        return std::unexpected(std::move(res.error()));
    }

    cryptophage::io::InputStreamAdapter input{listing};
    return cryptophage::gpg::GpgKeyReader{input}.read_all_keys();
}

}  // namespace

namespace cryptophage::gpg {

auto encrypt(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file, std::string_view recipient, const GpgOptions& options) noexcept -> std::expected<void, Error> {
    auto command = GpgCommand::encrypt();
    apply_common_options(command, options)
        .input_file(input_file)
        .output_file(output_file)
        .recipient(recipient);

    return executor.execute(command, nullptr, nullptr, options.timeout);
}

auto encrypt_and_sign(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file, std::string_view recipient, std::string_view passphrase, const GpgOptions& options) noexcept -> std::expected<void, Error> {
    auto command = GpgCommand::encrypt_sign();
    apply_common_options(command, options)
        .input_file(input_file)
        .output_file(output_file)
        .recipient(recipient)
        .passphrase(passphrase);

    return executor.execute(command, nullptr, nullptr, options.timeout);
}

auto decrypt(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file, std::string_view passphrase, const GpgOptions& options) noexcept -> std::expected<void, Error> {
    auto command = GpgCommand::decrypt();
    apply_common_options(command, options)
        .input_file(input_file)
        .output_file(output_file)
        .passphrase(passphrase);

    return executor.execute(command, nullptr, nullptr, options.timeout);
}

auto sign(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file, bool detached, bool cleartext, std::string_view passphrase, const GpgOptions& options) noexcept -> std::expected<void, Error> {
    auto command = [&] {
        if (detached) {
            auto detached_cmd = GpgCommand::sign_detached();
            if (cleartext) {
                detached_cmd.armored_output();
            } else {
                detached_cmd.non_armored_output();
            }
            return detached_cmd;
        }
        return cleartext ? GpgCommand::clear_sign() : GpgCommand::sign();
    }();
    apply_common_options(command, options)
        .input_file(input_file)
        .output_file(output_file)
        .passphrase(passphrase);

    return executor.execute(command, nullptr, nullptr, options.timeout);
}

auto verify(const GpgCommandExecutor& executor, std::string_view input_file, const GpgOptions& options) noexcept -> std::expected<bool, Error> {
    auto command = GpgCommand::verify();
    apply_common_options(command, options)
        .input_file(input_file);

    auto res = executor.execute(command, nullptr, nullptr, options.timeout);
    if (!res) {
        // gpg reports a bad signature only through its error text
        if (res.error().kind == ErrorKind::SubprocessFailure && res.error().message.contains("BAD signature"sv)) {
            spdlog::warn("[gpg] bad signature on '{}'", input_file);
            return false;
        }
        return std::unexpected(std::move(res.error()));
    }
    return true;
}

auto get_public_keys(const GpgCommandExecutor& executor, const GpgOptions& options) noexcept -> std::expected<std::vector<GpgKey>, Error> {
    return list_keys(executor, GpgCommand::list_public_keys(), options);
}

auto get_private_keys(const GpgCommandExecutor& executor, const GpgOptions& options) noexcept -> std::expected<std::vector<GpgKey>, Error> {
    return list_keys(executor, GpgCommand::list_secret_keys(), options);
}

}  // namespace cryptophage::gpg

namespace cryptophage::gpg::async {

auto begin_encrypt(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, std::string recipient, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, input_file = std::move(input_file), output_file = std::move(output_file), recipient = std::move(recipient), options = std::move(options)] {
            return gpg::encrypt(executor, input_file, output_file, recipient, options);
        },
        std::move(callback), std::move(state));
}

auto end_encrypt(const Handle& handle) noexcept -> std::expected<void, Error> {
    return end_invoke(handle);
}

auto begin_encrypt_and_sign(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, std::string recipient, std::string passphrase, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, input_file = std::move(input_file), output_file = std::move(output_file), recipient = std::move(recipient), passphrase = std::move(passphrase), options = std::move(options)] {
            return gpg::encrypt_and_sign(executor, input_file, output_file, recipient, passphrase, options);
        },
        std::move(callback), std::move(state));
}

auto end_encrypt_and_sign(const Handle& handle) noexcept -> std::expected<void, Error> {
    return end_invoke(handle);
}

auto begin_decrypt(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, std::string passphrase, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, input_file = std::move(input_file), output_file = std::move(output_file), passphrase = std::move(passphrase), options = std::move(options)] {
            return gpg::decrypt(executor, input_file, output_file, passphrase, options);
        },
        std::move(callback), std::move(state));
}

auto end_decrypt(const Handle& handle) noexcept -> std::expected<void, Error> {
    return end_invoke(handle);
}

auto begin_sign(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, bool detached, bool cleartext, std::string passphrase, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, input_file = std::move(input_file), output_file = std::move(output_file), detached, cleartext, passphrase = std::move(passphrase), options = std::move(options)] {
            return gpg::sign(executor, input_file, output_file, detached, cleartext, passphrase, options);
        },
        std::move(callback), std::move(state));
}

auto end_sign(const Handle& handle) noexcept -> std::expected<void, Error> {
    return end_invoke(handle);
}

auto begin_verify(const GpgCommandExecutor& executor, std::string input_file, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, input_file = std::move(input_file), options = std::move(options)] {
            return gpg::verify(executor, input_file, options);
        },
        std::move(callback), std::move(state));
}

auto end_verify(const Handle& handle) noexcept -> std::expected<bool, Error> {
    return end_invoke<bool>(handle);
}

auto begin_get_public_keys(const GpgCommandExecutor& executor, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, options = std::move(options)] {
            return gpg::get_public_keys(executor, options);
        },
        std::move(callback), std::move(state));
}

auto end_get_public_keys(const Handle& handle) noexcept -> std::expected<std::vector<GpgKey>, Error> {
    return end_invoke<std::vector<GpgKey>>(handle);
}

auto begin_get_private_keys(const GpgCommandExecutor& executor, AsyncCallback callback, std::any state, GpgOptions options) noexcept -> Handle {
    return begin_invoke(
        [executor, options = std::move(options)] {
            return gpg::get_private_keys(executor, options);
        },
        std::move(callback), std::move(state));
}

auto end_get_private_keys(const Handle& handle) noexcept -> std::expected<std::vector<GpgKey>, Error> {
    return end_invoke<std::vector<GpgKey>>(handle);
}

}  // namespace cryptophage::gpg::async
