#include "doctest_compatibility.h"

#include "cryptophage/gpg.hpp"
#include "cryptophage/gpg_command.hpp"
#include "cryptophage/gpg_command_executor.hpp"
#include "cryptophage/logger.hpp"
#include "cryptophage/stream.hpp"

#include <unistd.h>  // for getpid

#include <any>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_literals;
using namespace std::string_view_literals;
using namespace std::chrono_literals;

namespace {

// Stands in for gpg. Writes its arguments one per line into the --output file,
// or onto stdout without one.
constexpr auto FAKE_GPG_SCRIPT = R"(#!/bin/sh
out=""
prev=""
for arg in "$@"; do
    if [ "$prev" = "--output" ]; then
        out="$arg"
    fi
    prev="$arg"
done

case "$*" in
    *--slow*)
        sleep 5
        exit 0 ;;
    *--verify*bad.sig*)
        echo 'gpg: BAD signature from "Alice Example <alice@example.com>" [ultimate]' >&2
        exit 1 ;;
    *--verify*garbage.sig*)
        echo 'gpg: no valid OpenPGP data found.' >&2
        exit 2 ;;
    *--verify*)
        echo 'gpg: Good signature from "Alice Example <alice@example.com>" [ultimate]' >&2
        exit 0 ;;
    *--list-public-keys*)
        printf 'pub:u:4096:1:0123456789ABCDEF:1700000000:::u:::scESC:\nuid:u::::1700000000::1234ABCD::Alice Example <alice@example.com>:\n'
        exit 0 ;;
    *--list-secret-keys*)
        printf 'sec:u:2048:17:FEDCBA9876543210:1700000000:::u:::sc:\n'
        exit 0 ;;
esac

if [ -n "$out" ]; then
    printf '%s\n' "$@" > "$out"
else
    printf '%s\n' "$@"
fi
)"sv;

class FakeGpg final {
 public:
    FakeGpg() noexcept
      : m_root(fs::temp_directory_path() / fmt::format(FMT_COMPILE("cryptophage-fake-gpg-{}"), ::getpid())) {
        fs::remove_all(m_root);
        fs::create_directories(m_root);
        {
            std::ofstream script{executable()};
            script << FAKE_GPG_SCRIPT;
        }
        std::error_code err{};
        fs::permissions(executable(), fs::perms::owner_all, fs::perm_options::replace, err);
    }
    ~FakeGpg() {
        std::error_code err{};
        fs::remove_all(m_root, err);
    }

    [[nodiscard]] auto executable() const noexcept -> fs::path { return m_root / "gpg"; }
    [[nodiscard]] auto file(std::string_view name) const noexcept -> fs::path { return m_root / name; }

    // arguments the fake gpg wrote into an output file
    [[nodiscard]] auto recorded_arguments(std::string_view name) const noexcept -> std::vector<std::string> {
        std::ifstream recorded{file(name)};
        std::vector<std::string> lines{};
        for (std::string line{}; std::getline(recorded, line);) {
            lines.push_back(line);
        }
        return lines;
    }

 private:
    fs::path m_root;
};

auto setup_logger() noexcept -> void {
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
    spdlog::set_default_logger(logger);
    cryptophage::logger::set_logger(logger);
}

}  // namespace

TEST_CASE("gpg command executor test")
{
    setup_logger();

    const FakeGpg fake_gpg{};
    const cryptophage::gpg::GpgCommandExecutor executor{fake_gpg.executable().string()};
    REQUIRE_EQ(executor.gpg_path(), fake_gpg.executable().string());

    using cryptophage::gpg::GpgCommand;

    SECTION("execute passes the rendered arguments")
    {
        auto command = GpgCommand::command("--print-md"sv);
        const auto& digest_path = fake_gpg.file("digest file"sv).string();
        command.option("SHA256"sv).output_file(digest_path);

        REQUIRE(executor.execute(command));
        REQUIRE_EQ(fake_gpg.recorded_arguments("digest file"sv), std::vector<std::string>{"SHA256", "--output", digest_path, "--print-md"});
    }
    SECTION("execute with an output stream")
    {
        std::ostringstream output_stream{};
        cryptophage::io::OutputStreamAdapter output{output_stream};

        REQUIRE(executor.execute(GpgCommand::list_public_keys(), nullptr, &output));
        REQUIRE(output_stream.str().starts_with("pub:u:4096:1:0123456789ABCDEF:"sv));
    }
    SECTION("execute reports gpg failures")
    {
        auto command = GpgCommand::verify();
        command.input_file(fake_gpg.file("garbage.sig"sv).string());

        auto res = executor.execute(command);
        REQUIRE(!res);
        REQUIRE_EQ(res.error().kind, cryptophage::ErrorKind::SubprocessFailure);
        REQUIRE_EQ(res.error().message, "gpg: no valid OpenPGP data found.\n"s);
    }
    SECTION("execute times out")
    {
        auto res = executor.execute(GpgCommand::command("--slow"sv), nullptr, nullptr, 200ms);
        REQUIRE(!res);
        REQUIRE_EQ(res.error().kind, cryptophage::ErrorKind::Timeout);
        REQUIRE_EQ(res.error().timeout, 200ms);
        REQUIRE_EQ(res.error().executable, "gpg"s);
    }
    SECTION("missing executable")
    {
        const cryptophage::gpg::GpgCommandExecutor missing{fake_gpg.file("no-such-gpg"sv).string()};
        auto res = missing.execute(GpgCommand::command("--version"sv));
        REQUIRE(!res);
        REQUIRE_EQ(res.error().kind, cryptophage::ErrorKind::Spawn);
    }
    SECTION("begin and end execute")
    {
        std::ostringstream output_stream{};
        cryptophage::io::OutputStreamAdapter output{output_stream};
        std::atomic_bool called{false};

        auto handle = executor.begin_execute(
            GpgCommand::list_secret_keys(), nullptr, &output,
            [&](cryptophage::AsyncResultBase& completed) {
                called = std::any_cast<std::string>(completed.state()) == "listing"s;
            },
            std::any{"listing"s});
        REQUIRE(handle != nullptr);
        REQUIRE(cryptophage::gpg::GpgCommandExecutor::end_execute(handle));
        REQUIRE_EQ(output_stream.str(), "sec:u:2048:17:FEDCBA9876543210:1700000000:::u:::sc:\n"s);

        for (int i = 0; i < 100 && !called; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        REQUIRE(called.load());
    }
    SECTION("end execute with a null handle")
    {
        auto res = cryptophage::gpg::GpgCommandExecutor::end_execute(nullptr);
        REQUIRE(!res);
        REQUIRE_EQ(res.error().kind, cryptophage::ErrorKind::MismatchedHandle);
    }
    SECTION("discover")
    {
        auto discovered = cryptophage::gpg::GpgCommandExecutor::discover();
        if (discovered) {
            REQUIRE(!discovered->gpg_path().empty());
        } else {
            REQUIRE_EQ(discovered.error().kind, cryptophage::ErrorKind::ExecutableNotFound);
            REQUIRE_EQ(discovered.error().message,
                "Could not automatically determine the location of the GPG executable. Specify the path of the executable explicitly."s);
        }
    }
}

TEST_CASE("gpg operations test")
{
    setup_logger();

    const FakeGpg fake_gpg{};
    const cryptophage::gpg::GpgCommandExecutor executor{fake_gpg.executable().string()};
    const cryptophage::gpg::GpgOptions options{
        .home_directory = "/home/alice/.gnupg"s,
        .trust_model    = cryptophage::gpg::TrustModel::Always,
        .timeout        = 10s,
    };
    const auto& out_path = fake_gpg.file("out.gpg"sv).string();
    using strings        = std::vector<std::string>;

    SECTION("encrypt")
    {
        REQUIRE(cryptophage::gpg::encrypt(executor, "plain text.txt"sv, out_path, "bob@example.com"sv, options));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv),
            strings{"--batch", "--no-verbose", "--quiet", "--no-tty", "--trust-model", "always", "--homedir", "/home/alice/.gnupg",
                "--output", out_path, "--recipient", "bob@example.com", "--encrypt", "plain text.txt"});
    }
    SECTION("encrypt and sign")
    {
        REQUIRE(cryptophage::gpg::encrypt_and_sign(executor, "in.txt"sv, out_path, "bob@example.com"sv, R"(pass "word")"sv));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv),
            strings{"--batch", "--no-verbose", "--quiet", "--no-tty", "--trust-model", "always",
                "--output", out_path, "--recipient", "bob@example.com", "--passphrase", R"(pass "word")", "--encrypt", "--sign", "in.txt"});
    }
    SECTION("decrypt")
    {
        REQUIRE(cryptophage::gpg::decrypt(executor, "in.gpg"sv, out_path, "secret"sv, options));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv),
            strings{"--batch", "--no-verbose", "--quiet", "--no-tty", "--trust-model", "always", "--homedir", "/home/alice/.gnupg",
                "--output", out_path, "--passphrase", "secret", "--decrypt", "in.gpg"});
    }
    SECTION("sign variants")
    {
        const strings common{"--batch", "--no-verbose", "--quiet", "--no-tty", "--trust-model", "always"};
        const auto expected_arguments = [&](strings prefix, std::string_view operation) {
            prefix.insert(prefix.end(), common.begin(), common.end());
            prefix.insert(prefix.end(), {"--output", out_path, "--passphrase", "pw", std::string{operation}, "in.txt"});
            return prefix;
        };

        REQUIRE(cryptophage::gpg::sign(executor, "in.txt"sv, out_path, true, true, "pw"sv));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv), expected_arguments({"--armor"}, "--detach-sign"sv));

        REQUIRE(cryptophage::gpg::sign(executor, "in.txt"sv, out_path, true, false, "pw"sv));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv), expected_arguments({"--no-armor"}, "--detach-sign"sv));

        REQUIRE(cryptophage::gpg::sign(executor, "in.txt"sv, out_path, false, true, "pw"sv));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv), expected_arguments({}, "--clearsign"sv));

        REQUIRE(cryptophage::gpg::sign(executor, "in.txt"sv, out_path, false, false, "pw"sv));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv), expected_arguments({}, "--sign"sv));
    }
    SECTION("verify")
    {
        REQUIRE_EQ(cryptophage::gpg::verify(executor, fake_gpg.file("good.sig"sv).string(), options), true);
        REQUIRE_EQ(cryptophage::gpg::verify(executor, fake_gpg.file("bad.sig"sv).string(), options), false);

        auto res = cryptophage::gpg::verify(executor, fake_gpg.file("garbage.sig"sv).string(), options);
        REQUIRE(!res);
        REQUIRE_EQ(res.error().kind, cryptophage::ErrorKind::SubprocessFailure);
    }
    SECTION("key listings")
    {
        auto public_keys = cryptophage::gpg::get_public_keys(executor, options);
        REQUIRE(public_keys);
        REQUIRE_EQ(public_keys->size(), 2U);
        REQUIRE_EQ(public_keys->front().record_type, cryptophage::gpg::GpgRecordType::PublicKey);
        REQUIRE_EQ(public_keys->front().key_id, "0123456789ABCDEF"s);
        REQUIRE_EQ(public_keys->back().user_id, "Alice Example <alice@example.com>"s);

        auto private_keys = cryptophage::gpg::get_private_keys(executor, options);
        REQUIRE(private_keys);
        REQUIRE_EQ(private_keys->size(), 1U);
        REQUIRE_EQ(private_keys->front().record_type, cryptophage::gpg::GpgRecordType::SecretKey);
        REQUIRE_EQ(private_keys->front().algorithm, cryptophage::gpg::GpgAlgorithm::Dsa);
    }
    SECTION("timeouts come from the options")
    {
        const cryptophage::gpg::GpgOptions short_timeout{.timeout = 200ms};
        const cryptophage::gpg::GpgCommandExecutor slow{fake_gpg.executable().string()};
        auto res = cryptophage::gpg::verify(slow, "--slow"sv, short_timeout);
        REQUIRE(!res);
        REQUIRE_EQ(res.error().kind, cryptophage::ErrorKind::Timeout);
    }
}

TEST_CASE("gpg async operations test")
{
    setup_logger();

    const FakeGpg fake_gpg{};
    const cryptophage::gpg::GpgCommandExecutor executor{fake_gpg.executable().string()};
    const auto& out_path = fake_gpg.file("out.gpg"sv).string();

    namespace async = cryptophage::gpg::async;

    SECTION("encrypt, decrypt and sign")
    {
        REQUIRE(async::end_encrypt(async::begin_encrypt(executor, "in.txt"s, out_path, "bob@example.com"s)));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv).back(), "in.txt"s);

        REQUIRE(async::end_encrypt_and_sign(async::begin_encrypt_and_sign(executor, "in2.txt"s, out_path, "bob@example.com"s, "pw"s)));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv).back(), "in2.txt"s);

        REQUIRE(async::end_decrypt(async::begin_decrypt(executor, "in.gpg"s, out_path, "pw"s)));
        REQUIRE_EQ(fake_gpg.recorded_arguments("out.gpg"sv).back(), "in.gpg"s);

        REQUIRE(async::end_sign(async::begin_sign(executor, "doc.txt"s, out_path, false, true, "pw"s)));
        const auto& arguments = fake_gpg.recorded_arguments("out.gpg"sv);
        REQUIRE_EQ(arguments[arguments.size() - 2], "--clearsign"s);
    }
    SECTION("verify with callback and state")
    {
        std::atomic_int seen_state{0};
        auto handle = async::begin_verify(
            executor, fake_gpg.file("bad.sig"sv).string(),
            [&](cryptophage::AsyncResultBase& completed) { seen_state = std::any_cast<int>(completed.state()); },
            std::any{5});
        REQUIRE_EQ(async::end_verify(handle), false);

        for (int i = 0; i < 100 && seen_state == 0; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        REQUIRE_EQ(seen_state.load(), 5);
    }
    SECTION("key listings")
    {
        auto public_handle  = async::begin_get_public_keys(executor);
        auto private_handle = async::begin_get_private_keys(executor);

        auto public_keys = async::end_get_public_keys(public_handle);
        REQUIRE(public_keys);
        REQUIRE_EQ(public_keys->size(), 2U);

        auto private_keys = async::end_get_private_keys(private_handle);
        REQUIRE(private_keys);
        REQUIRE_EQ(private_keys->size(), 1U);
    }
    SECTION("mismatched end operation")
    {
        auto handle = async::begin_verify(executor, fake_gpg.file("good.sig"sv).string());
        auto keys   = async::end_get_public_keys(handle);
        REQUIRE(!keys);
        REQUIRE_EQ(keys.error().kind, cryptophage::ErrorKind::MismatchedHandle);
        REQUIRE_EQ(async::end_verify(handle), true);
    }
}
