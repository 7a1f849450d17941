#include "cryptophage/gpg_command_executor.hpp"
#include "cryptophage/gpg_path_finder.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

namespace cryptophage::gpg {

GpgCommandExecutor::GpgCommandExecutor(std::string gpg_path) noexcept
  : m_gpg_path(std::move(gpg_path)) { }

auto GpgCommandExecutor::discover() noexcept -> std::expected<GpgCommandExecutor, Error> {
    auto gpg_path = find_gpg_path();
    if (!gpg_path) {
        return std::unexpected(make_error(ErrorKind::ExecutableNotFound,
            "Could not automatically determine the location of the GPG executable. Specify the path of the executable explicitly."));
    }
    return GpgCommandExecutor{std::move(*gpg_path)};
}

auto GpgCommandExecutor::execute(const GpgCommand& command, io::Stream* input, io::Stream* output, std::chrono::milliseconds timeout) const noexcept -> std::expected<void, Error> {
    const SubProcess process{m_gpg_path, command.to_string()};
    return process.run(input, output, timeout);
}

auto GpgCommandExecutor::begin_execute(const GpgCommand& command, io::Stream* input, io::Stream* output, AsyncCallback callback, std::any state, std::chrono::milliseconds timeout) const noexcept -> std::shared_ptr<AsyncResultBase> {
    return begin_invoke(
        [process = SubProcess{m_gpg_path, command.to_string()}, input, output, timeout] {
            return process.run(input, output, timeout);
        },
        std::move(callback), std::move(state));
}

auto GpgCommandExecutor::end_execute(const std::shared_ptr<AsyncResultBase>& handle) noexcept -> std::expected<void, Error> {
    auto result = end_invoke(handle);
    if (!result && result.error().kind == ErrorKind::MismatchedHandle) {
        spdlog::error("[executor] {}", result.error().message);
    }
    return result;
}

}  // namespace cryptophage::gpg
