#include "cryptophage/gpg_path_finder.hpp"
#include "cryptophage/io_utils.hpp"

#include <unistd.h>  // for access, X_OK

#include <array>         // for array
#include <filesystem>    // for path, is_regular_file
#include <system_error>  // for error_code

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

constexpr std::array GPG_EXECUTABLES{"gpg2"sv, "gpg"sv};

auto is_executable_file(const fs::path& file_path) noexcept -> bool {
    std::error_code err{};
    if (!fs::is_regular_file(file_path, err)) {
        return false;
    }
    return ::access(file_path.c_str(), X_OK) == 0;
}

}  // namespace

namespace cryptophage::gpg {

auto search_gpg_path(std::string_view search_path, std::string_view fallback) noexcept -> std::optional<std::string> {
    for (auto&& rng : search_path | ranges::views::split(':')) {
        const auto& directory = rng | ranges::to<std::string>();
        if (directory.empty()) {
            continue;
        }
        for (auto&& executable : GPG_EXECUTABLES) {
            const auto& candidate = fs::path{directory} / executable;
            if (is_executable_file(candidate)) {
                return candidate.string();
            }
        }
    }

    if (!fallback.empty() && is_executable_file(fs::path{fallback})) {
        return std::string{fallback};
    }
    return std::nullopt;
}

auto find_gpg_path() noexcept -> std::optional<std::string> {
    static const auto gpg_path = [] {
        auto found = search_gpg_path(utils::safe_getenv("PATH"));
        if (found) {
            spdlog::debug("[path_finder] using gpg at '{}'", *found);
        } else {
            spdlog::warn("[path_finder] no gpg executable found");
        }
        return found;
    }();
    return gpg_path;
}

}  // namespace cryptophage::gpg
