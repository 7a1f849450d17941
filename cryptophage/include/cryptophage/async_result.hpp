#ifndef ASYNC_RESULT_HPP
#define ASYNC_RESULT_HPP

#include "cryptophage/error.hpp"

#include <any>          // for any
#include <atomic>       // for atomic
#include <concepts>     // for invocable
#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <functional>   // for function, invoke
#include <memory>       // for shared_ptr, unique_ptr
#include <mutex>        // for once_flag
#include <optional>     // for optional
#include <thread>       // for thread
#include <type_traits>  // for invoke_result_t
#include <utility>      // for move

#include <spdlog/spdlog.h>

namespace cryptophage {

class AsyncResultBase;

/// Invoked once the asynchronous operation has completed.
using AsyncCallback = std::function<void(AsyncResultBase&)>;

/// @brief Single-completion result of an asynchronous operation without a value.
///
/// Completed exactly once, by complete() or fail(), from any thread. Blocking callers use
/// wait(), which returns the stored failure on every call. The operation is settled once
/// the callback, if any, has returned as well.
class AsyncResultBase {
 public:
    /// @param callback Optional callback, invoked after completion.
    /// @param state Caller-supplied correlation token, never interpreted.
    AsyncResultBase(AsyncCallback callback, std::any state) noexcept;
    virtual ~AsyncResultBase();

    AsyncResultBase(const AsyncResultBase&)     = delete;
    auto operator=(const AsyncResultBase&) = delete;

    /// @brief Mark the operation as completed.
    /// @return DoubleCompletion error when the operation was already completed.
    auto complete() noexcept -> std::expected<void, Error>;

    /// @brief Mark the operation as completed with a failure.
    /// @return DoubleCompletion error when the operation was already completed.
    auto fail(Error error) noexcept -> std::expected<void, Error>;

    /// @brief Block until the operation completes.
    /// @return The stored failure, if any.
    auto wait() const noexcept -> std::expected<void, Error>;

    /// @brief Block until the operation completes and its callback has returned.
    ///
    /// Called from within the callback it only waits for the completion.
    /// @return The stored failure, if any.
    auto wait_settled() const noexcept -> std::expected<void, Error>;

    [[nodiscard]] auto is_completed() const noexcept -> bool;
    [[nodiscard]] auto state() const noexcept -> const std::any& { return m_async_state; }

 protected:
    /// @brief Claim the right to complete the operation.
    /// @return false when another completion already claimed it.
    [[nodiscard]] auto try_begin_completion() noexcept -> bool;

    /// @brief Publish the completion, wake up waiters and run the callback.
    void finish_completion() noexcept;

    [[nodiscard]] static auto double_completion_error() noexcept -> Error;

 private:
    struct WaitHandle;

    enum class CompletionState : std::uint8_t {
        Pending,
        Completing,
        Completed
    };

    auto wait_handle() const noexcept -> WaitHandle&;
    void notify_waiters() const noexcept;

    std::atomic<CompletionState> m_completion_state{CompletionState::Pending};
    std::atomic_bool m_settled{false};
    std::atomic<std::thread::id> m_callback_thread{};
    std::optional<Error> m_error{};
    AsyncCallback m_callback{};
    std::any m_async_state{};

    // created on the first blocking wait only
    mutable std::once_flag m_wait_handle_once{};
    mutable std::unique_ptr<WaitHandle> m_wait_handle{};
    mutable std::atomic_bool m_wait_handle_created{false};
};

/// @brief Single-completion result of an asynchronous operation producing a T.
template <typename T>
class AsyncResult final : public AsyncResultBase {
 public:
    using AsyncResultBase::AsyncResultBase;

    /// @brief Mark the operation as completed with a value.
    /// @return DoubleCompletion error when the operation was already completed.
    auto complete(T value) noexcept -> std::expected<void, Error> {
        if (!try_begin_completion()) {
            return std::unexpected(double_completion_error());
        }
        m_value.emplace(std::move(value));
        finish_completion();
        return {};
    }

    /// @brief Block until the operation completes.
    /// @return The stored value or the stored failure, on every call.
    auto value() const noexcept -> std::expected<T, Error> {
        if (auto res = wait(); !res) {
            return std::unexpected(std::move(res.error()));
        }
        if (!m_value) {
            return std::unexpected(make_error(ErrorKind::MismatchedHandle, "The asynchronous operation completed without a value."));
        }
        return *m_value;
    }

 private:
    std::optional<T> m_value{};
};

namespace detail {

template <typename T>
struct async_result_for {
    using type = AsyncResult<T>;
};

template <>
struct async_result_for<void> {
    using type = AsyncResultBase;
};

template <typename R>
struct expected_value;

template <typename T>
struct expected_value<std::expected<T, Error>> {
    using type = T;
};

}  // namespace detail

/// @brief Run work on a separate thread, exposing its outcome through a handle.
///
/// The work is destroyed before the operation completes. Once end_invoke returns, the
/// worker thread only releases its reference to the handle and exits.
/// @param work Callable returning std::expected<T, Error>.
/// @param callback Optional callback, invoked once work has finished.
/// @param state Caller-supplied correlation token.
/// @return The handle, an AsyncResult<T> (AsyncResultBase for void).
template <std::invocable F>
auto begin_invoke(F work, AsyncCallback callback = {}, std::any state = {}) noexcept -> std::shared_ptr<AsyncResultBase> {
    using value_type  = typename detail::expected_value<std::invoke_result_t<F>>::type;
    using result_type = typename detail::async_result_for<value_type>::type;

    auto result = std::make_shared<result_type>(std::move(callback), std::move(state));
    std::thread([result, work = std::move(work)]() mutable {
        auto outcome = [&] {
            auto local_work = std::move(work);
            return std::invoke(local_work);
        }();

        std::expected<void, Error> completion{};
        if (!outcome) {
            completion = result->fail(std::move(outcome.error()));
        } else if constexpr (std::is_void_v<value_type>) {
            completion = result->complete();
        } else {
            completion = result->complete(std::move(*outcome));
        }
        if (!completion) {
            spdlog::error("[async] {}", completion.error().message);
        }
    }).detach();

    return result;
}

/// @brief Wait for an operation started by begin_invoke, callback included.
/// @return MismatchedHandle error for a null handle, the stored failure otherwise.
auto end_invoke(const AsyncResultBase* handle) noexcept -> std::expected<void, Error>;
auto end_invoke(const std::shared_ptr<AsyncResultBase>& handle) noexcept -> std::expected<void, Error>;

/// @brief Wait for an operation started by begin_invoke and fetch its value.
/// @return MismatchedHandle error unless handle is an AsyncResult<T>.
template <typename T>
auto end_invoke(const AsyncResultBase* handle) noexcept -> std::expected<T, Error> {
    const auto* typed = dynamic_cast<const AsyncResult<T>*>(handle);
    if (typed == nullptr) {
        return std::unexpected(make_error(ErrorKind::MismatchedHandle, "A mismatched async result was provided."));
    }
    if (auto res = typed->wait_settled(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return typed->value();
}

template <typename T>
auto end_invoke(const std::shared_ptr<AsyncResultBase>& handle) noexcept -> std::expected<T, Error> {
    return end_invoke<T>(handle.get());
}

}  // namespace cryptophage

#endif  // ASYNC_RESULT_HPP
