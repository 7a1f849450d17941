#include "cryptophage/io_utils.hpp"

#include <cstdlib>  // for getenv

using namespace std::string_view_literals;

namespace cryptophage::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = std::getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto env_flag_enabled(const char* env_name) noexcept -> bool {
    return utils::safe_getenv(env_name) == "1"sv;
}

}  // namespace cryptophage::utils
