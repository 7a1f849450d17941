#ifndef GPG_HPP
#define GPG_HPP

#include "cryptophage/async_result.hpp"
#include "cryptophage/error.hpp"
#include "cryptophage/gpg_command.hpp"
#include "cryptophage/gpg_command_executor.hpp"
#include "cryptophage/gpg_key.hpp"

#include <any>          // for any
#include <chrono>       // for milliseconds, seconds
#include <expected>     // for expected
#include <memory>       // for shared_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptophage::gpg {

inline constexpr std::chrono::milliseconds DEFAULT_TIMEOUT = std::chrono::seconds{30};

/// Options shared by all operations of the helpers below.
struct GpgOptions final {
    /// Passed as --homedir when set.
    std::optional<std::string> home_directory{};
    TrustModel trust_model{TrustModel::Always};
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
};

/// @brief Encrypt a file for a recipient.
/// @param input_file Path of the file to encrypt.
/// @param output_file Path of the resulting encrypted file.
/// @param recipient Selects the public key to encrypt with.
auto encrypt(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file,
    std::string_view recipient, const GpgOptions& options = {}) noexcept -> std::expected<void, Error>;

/// @brief Encrypt a file for a recipient and sign it with the default private key.
/// @param passphrase Passphrase of the private key used for signing.
auto encrypt_and_sign(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file,
    std::string_view recipient, std::string_view passphrase, const GpgOptions& options = {}) noexcept -> std::expected<void, Error>;

/// @brief Decrypt a file.
/// @param passphrase Passphrase of the private key used for decryption.
auto decrypt(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file,
    std::string_view passphrase, const GpgOptions& options = {}) noexcept -> std::expected<void, Error>;

/// @brief Sign a file.
/// @param detached Write only the signature into @p output_file.
/// @param cleartext Produce readable output, armored for detached signatures.
auto sign(const GpgCommandExecutor& executor, std::string_view input_file, std::string_view output_file,
    bool detached, bool cleartext, std::string_view passphrase, const GpgOptions& options = {}) noexcept -> std::expected<void, Error>;

/// @brief Verify the signature of a signed file.
/// @return false for a bad signature, other failures as errors.
auto verify(const GpgCommandExecutor& executor, std::string_view input_file, const GpgOptions& options = {}) noexcept -> std::expected<bool, Error>;

/// @brief List the public keys of the key ring.
auto get_public_keys(const GpgCommandExecutor& executor, const GpgOptions& options = {}) noexcept -> std::expected<std::vector<GpgKey>, Error>;

/// @brief List the private keys of the key ring.
auto get_private_keys(const GpgCommandExecutor& executor, const GpgOptions& options = {}) noexcept -> std::expected<std::vector<GpgKey>, Error>;

}  // namespace cryptophage::gpg

// Asynchronous variants. Each begin_* runs the operation on its own thread,
// the matching end_* waits for it and returns its outcome.
namespace cryptophage::gpg::async {

using Handle = std::shared_ptr<AsyncResultBase>;

auto begin_encrypt(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, std::string recipient,
    AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_encrypt(const Handle& handle) noexcept -> std::expected<void, Error>;

auto begin_encrypt_and_sign(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, std::string recipient,
    std::string passphrase, AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_encrypt_and_sign(const Handle& handle) noexcept -> std::expected<void, Error>;

auto begin_decrypt(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, std::string passphrase,
    AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_decrypt(const Handle& handle) noexcept -> std::expected<void, Error>;

auto begin_sign(const GpgCommandExecutor& executor, std::string input_file, std::string output_file, bool detached, bool cleartext,
    std::string passphrase, AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_sign(const Handle& handle) noexcept -> std::expected<void, Error>;

auto begin_verify(const GpgCommandExecutor& executor, std::string input_file,
    AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_verify(const Handle& handle) noexcept -> std::expected<bool, Error>;

auto begin_get_public_keys(const GpgCommandExecutor& executor,
    AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_get_public_keys(const Handle& handle) noexcept -> std::expected<std::vector<GpgKey>, Error>;

auto begin_get_private_keys(const GpgCommandExecutor& executor,
    AsyncCallback callback = {}, std::any state = {}, GpgOptions options = {}) noexcept -> Handle;
auto end_get_private_keys(const Handle& handle) noexcept -> std::expected<std::vector<GpgKey>, Error>;

}  // namespace cryptophage::gpg::async

#endif  // GPG_HPP
