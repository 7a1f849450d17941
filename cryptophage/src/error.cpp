#include "cryptophage/error.hpp"

#include <cstring>  // for strerror
#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

void flatten_into(std::vector<cryptophage::Error>& out, cryptophage::Error&& error) noexcept {
    if (error.kind != cryptophage::ErrorKind::Aggregate) {
        out.push_back(std::move(error));
        return;
    }
    for (auto& inner : error.inner_errors) {
        flatten_into(out, std::move(inner));
    }
}

}  // namespace

namespace cryptophage {

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::UnsupportedStream:
        return "unsupported stream"sv;
    case ErrorKind::SubprocessFailure:
        return "subprocess failure"sv;
    case ErrorKind::Timeout:
        return "timeout"sv;
    case ErrorKind::Aggregate:
        return "aggregate failure"sv;
    case ErrorKind::DoubleCompletion:
        return "double completion"sv;
    case ErrorKind::MismatchedHandle:
        return "mismatched handle"sv;
    case ErrorKind::Io:
        return "io error"sv;
    case ErrorKind::Spawn:
        return "spawn error"sv;
    case ErrorKind::ExecutableNotFound:
        return "executable not found"sv;
    case ErrorKind::InvalidConfig:
        return "invalid config"sv;
    }
    return "unknown"sv;
}

auto Error::to_string() const noexcept -> std::string {
    auto res = fmt::format(FMT_COMPILE("{}: {}"), error_kind_to_string(kind), message);
    for (const auto& inner : inner_errors) {
        res += fmt::format(FMT_COMPILE("\n  - {}"), inner.to_string());
    }
    return res;
}

auto make_error(ErrorKind kind, std::string message) noexcept -> Error {
    return Error{.kind = kind, .message = std::move(message)};
}

auto make_subprocess_failure(std::string error_text) noexcept -> Error {
    return Error{.kind = ErrorKind::SubprocessFailure, .message = std::move(error_text)};
}

auto make_timeout_error(std::chrono::milliseconds timeout, std::string_view executable) noexcept -> Error {
    return Error{
        .kind       = ErrorKind::Timeout,
        .message    = fmt::format(FMT_COMPILE("A timeout occurred after {} milliseconds waiting for the {} process to complete."), timeout.count(), executable),
        .timeout    = timeout,
        .executable = std::string{executable},
    };
}

auto make_errno_error(std::string_view context, int errnum, ErrorKind kind) noexcept -> Error {
    return Error{.kind = kind, .message = fmt::format(FMT_COMPILE("{}: {}"), context, std::strerror(errnum))};
}

auto aggregate_errors(std::vector<Error> errors) noexcept -> std::optional<Error> {
    std::vector<Error> flattened{};
    for (auto& error : errors) {
        flatten_into(flattened, std::move(error));
    }

    if (flattened.empty()) {
        return std::nullopt;
    }
    if (flattened.size() == 1) {
        return std::make_optional<Error>(std::move(flattened.front()));
    }

    auto message = fmt::format(FMT_COMPILE("{} concurrent failures occurred"), flattened.size());
    return Error{.kind = ErrorKind::Aggregate, .message = std::move(message), .inner_errors = std::move(flattened)};
}

}  // namespace cryptophage
