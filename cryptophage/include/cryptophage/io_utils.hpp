#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string_view>  // for string_view

namespace cryptophage::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @return true when the environment variable is set to "1".
auto env_flag_enabled(const char* env_name) noexcept -> bool;

}  // namespace cryptophage::utils

#endif  // IO_UTILS_HPP
