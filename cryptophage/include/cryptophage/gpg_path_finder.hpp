#ifndef GPG_PATH_FINDER_HPP
#define GPG_PATH_FINDER_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace cryptophage::gpg {

/// Used when no gpg executable is found on PATH.
inline constexpr std::string_view DEFAULT_GPG_PATH = "/usr/bin/gpg";

/// @brief Locate the gpg executable.
///
/// Computed on the first call and cached for the lifetime of the process.
/// @return The path, or std::nullopt if no gpg executable exists.
auto find_gpg_path() noexcept -> std::optional<std::string>;

/// @brief Search the directories of @p search_path for gpg2, then gpg.
/// @param search_path Colon separated list of directories, as in PATH.
/// @param fallback Checked when no directory holds an executable.
/// @return The first executable match, or std::nullopt.
auto search_gpg_path(std::string_view search_path, std::string_view fallback = DEFAULT_GPG_PATH) noexcept -> std::optional<std::string>;

}  // namespace cryptophage::gpg

#endif  // GPG_PATH_FINDER_HPP
