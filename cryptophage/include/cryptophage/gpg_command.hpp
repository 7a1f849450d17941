#ifndef GPG_COMMAND_HPP
#define GPG_COMMAND_HPP

#include <cstdint>      // for uint8_t, int32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cryptophage::gpg {

/// Valid values of --trust-model.
enum class TrustModel : std::uint8_t {
    Pgp,
    Classic,
    Direct,
    Always,
    Auto
};

/// Converts TrustModel to its command line spelling.
[[nodiscard]] auto trust_model_to_string(TrustModel model) noexcept -> std::string_view;

/// Converts a string to TrustModel.
/// @return The TrustModel or std::nullopt if invalid.
[[nodiscard]] auto trust_model_from_string(std::string_view model_str) noexcept -> std::optional<TrustModel>;

// Builder for the argument line of one gpg operation.
class GpgCommand final {
 public:
    // Operations
    [[nodiscard]] static auto sign() noexcept -> GpgCommand;
    [[nodiscard]] static auto sign_detached() noexcept -> GpgCommand;
    [[nodiscard]] static auto clear_sign() noexcept -> GpgCommand;
    [[nodiscard]] static auto encrypt() noexcept -> GpgCommand;
    [[nodiscard]] static auto encrypt_sign() noexcept -> GpgCommand;
    [[nodiscard]] static auto decrypt() noexcept -> GpgCommand;
    [[nodiscard]] static auto verify() noexcept -> GpgCommand;
    [[nodiscard]] static auto list_public_keys() noexcept -> GpgCommand;
    [[nodiscard]] static auto list_secret_keys() noexcept -> GpgCommand;
    [[nodiscard]] static auto command(std::string_view operation) noexcept -> GpgCommand;

    // Options

    /// @brief --recipient, a key id, user name or email.
    auto recipient(std::string_view user_id) noexcept -> GpgCommand&;
    /// @brief --local-user for signing or decryption.
    auto local_user(std::string_view user_id) noexcept -> GpgCommand&;
    auto armored_output() noexcept -> GpgCommand&;
    auto non_armored_output() noexcept -> GpgCommand&;
    /// @brief -z, from 0 to 9.
    auto compression_level(std::int32_t level) noexcept -> GpgCommand&;
    auto home_directory(std::string_view path) noexcept -> GpgCommand&;
    auto passphrase(std::string_view passphrase) noexcept -> GpgCommand&;
    /// @brief --no-verbose --quiet --no-tty
    auto quiet() noexcept -> GpgCommand&;
    auto batch(bool use_batch) noexcept -> GpgCommand&;
    auto trust_model(TrustModel model) noexcept -> GpgCommand&;
    auto with_colons() noexcept -> GpgCommand&;
    auto fixed_list_mode() noexcept -> GpgCommand&;
    auto input_file(std::string_view path) noexcept -> GpgCommand&;
    auto output_file(std::string_view path) noexcept -> GpgCommand&;
    auto yes() noexcept -> GpgCommand&;
    /// @brief Custom option, appended verbatim.
    auto option(std::string_view option) noexcept -> GpgCommand&;

    /// @brief Render the argument line: options, operation, then the quoted input file.
    [[nodiscard]] auto to_string() const noexcept -> std::string;

    [[nodiscard]] auto operation() const noexcept -> const std::string& { return m_operation; }

 private:
    explicit GpgCommand(std::string_view operation) noexcept;

    auto add_option(std::string option) noexcept -> GpgCommand&;
    auto add_option(std::string_view name, std::string_view value) noexcept -> GpgCommand&;

    std::string m_operation;
    std::vector<std::string> m_options{};
    std::optional<std::string> m_input_file{};
};

}  // namespace cryptophage::gpg

#endif  // GPG_COMMAND_HPP
