#include "cryptophage/argument_line.hpp"

#include <utility>  // for move

namespace {

constexpr auto is_space(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

namespace cryptophage::utils {

auto split_argument_line(std::string_view line) noexcept -> std::vector<std::string> {
    std::vector<std::string> args{};
    std::string current{};

    bool in_single{false};
    bool in_double{false};

    // needed to keep explicitly empty arguments like ""
    bool token_started{false};

    auto flush = [&] {
        if (token_started) {
            args.push_back(std::move(current));
            current.clear();
            token_started = false;
        }
    };

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];

        if (c == '\\' && !in_single && i + 1 < line.size()) {
            const char next = line[i + 1];

            const bool escapable = in_double
                ? (is_space(next) || next == '"' || next == '\\')
                : (is_space(next) || next == '"' || next == '\'');
            if (escapable) {
                ++i;
                current.push_back(next);
                token_started = true;
                continue;
            }
        }

        if (!in_double && c == '\'') {
            in_single     = !in_single;
            token_started = true;
            continue;
        }
        if (!in_single && c == '"') {
            in_double     = !in_double;
            token_started = true;
            continue;
        }

        if (!in_single && !in_double && is_space(c)) {
            flush();
            continue;
        }

        current.push_back(c);
        token_started = true;
    }

    flush();
    return args;
}

auto quote_argument(std::string_view value) noexcept -> std::string {
    std::string res{};
    res.reserve(value.size() + 2);
    res += '"';
    for (const char c : value) {
        if (c == '"' || c == '\\') {
            res += '\\';
        }
        res += c;
    }
    res += '"';
    return res;
}

}  // namespace cryptophage::utils
