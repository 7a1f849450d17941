#ifndef GPG_COMMAND_EXECUTOR_HPP
#define GPG_COMMAND_EXECUTOR_HPP

#include "cryptophage/async_result.hpp"
#include "cryptophage/error.hpp"
#include "cryptophage/gpg_command.hpp"
#include "cryptophage/stream.hpp"
#include "cryptophage/subprocess.hpp"

#include <any>       // for any
#include <chrono>    // for milliseconds
#include <expected>  // for expected
#include <memory>    // for shared_ptr
#include <string>    // for string

namespace cryptophage::gpg {

// Runs GpgCommands against one gpg executable.
class GpgCommandExecutor final {
 public:
    /// @param gpg_path Path to the gpg executable, not checked.
    explicit GpgCommandExecutor(std::string gpg_path) noexcept;

    /// @brief Executor for the gpg executable found by find_gpg_path.
    /// @return ExecutableNotFound error if there is none.
    static auto discover() noexcept -> std::expected<GpgCommandExecutor, Error>;

    /// @brief Execute the command and wait for it to finish.
    /// @param input Stream fed into gpg, or null.
    /// @param output Stream receiving the output of gpg, or null.
    auto execute(const GpgCommand& command, io::Stream* input = nullptr, io::Stream* output = nullptr,
        std::chrono::milliseconds timeout = WAIT_FOREVER) const noexcept -> std::expected<void, Error>;

    /// @brief Start executing the command on its own thread.
    ///
    /// The streams must stay alive until the operation has completed.
    /// @return Handle to pass into end_execute.
    auto begin_execute(const GpgCommand& command, io::Stream* input, io::Stream* output,
        AsyncCallback callback = {}, std::any state = {}, std::chrono::milliseconds timeout = WAIT_FOREVER) const noexcept
        -> std::shared_ptr<AsyncResultBase>;

    /// @brief Wait for an execution started by begin_execute.
    /// @return MismatchedHandle error for a null handle, the execution outcome otherwise.
    static auto end_execute(const std::shared_ptr<AsyncResultBase>& handle) noexcept -> std::expected<void, Error>;

    [[nodiscard]] auto gpg_path() const noexcept -> const std::string& { return m_gpg_path; }

 private:
    std::string m_gpg_path;
};

}  // namespace cryptophage::gpg

#endif  // GPG_COMMAND_EXECUTOR_HPP
