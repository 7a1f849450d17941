#include "cryptophage/async_result.hpp"

#include <condition_variable>  // for condition_variable
#include <mutex>               // for mutex, unique_lock, lock_guard, call_once
#include <thread>              // for this_thread

namespace cryptophage {

struct AsyncResultBase::WaitHandle {
    std::mutex mutex;
    std::condition_variable signaled;
};

AsyncResultBase::AsyncResultBase(AsyncCallback callback, std::any state) noexcept
  : m_callback(std::move(callback)), m_async_state(std::move(state)) { }

AsyncResultBase::~AsyncResultBase() = default;

auto AsyncResultBase::complete() noexcept -> std::expected<void, Error> {
    if (!try_begin_completion()) {
        return std::unexpected(double_completion_error());
    }
    finish_completion();
    return {};
}

auto AsyncResultBase::fail(Error error) noexcept -> std::expected<void, Error> {
    if (!try_begin_completion()) {
        return std::unexpected(double_completion_error());
    }
    m_error.emplace(std::move(error));
    finish_completion();
    return {};
}

auto AsyncResultBase::wait() const noexcept -> std::expected<void, Error> {
    if (!is_completed()) {
        auto& handle = wait_handle();
        std::unique_lock<std::mutex> lock(handle.mutex);
        handle.signaled.wait(lock, [this] { return is_completed(); });
    }

    if (m_error) {
        return std::unexpected(*m_error);
    }
    return {};
}

auto AsyncResultBase::wait_settled() const noexcept -> std::expected<void, Error> {
    if (m_callback_thread.load() == std::this_thread::get_id()) {
        return wait();
    }
    if (!m_settled.load()) {
        auto& handle = wait_handle();
        std::unique_lock<std::mutex> lock(handle.mutex);
        handle.signaled.wait(lock, [this] { return m_settled.load(); });
    }
    return wait();
}

auto AsyncResultBase::is_completed() const noexcept -> bool {
    return m_completion_state.load() == CompletionState::Completed;
}

auto AsyncResultBase::try_begin_completion() noexcept -> bool {
    auto expected = CompletionState::Pending;
    return m_completion_state.compare_exchange_strong(expected, CompletionState::Completing);
}

void AsyncResultBase::finish_completion() noexcept {
    m_completion_state.store(CompletionState::Completed);
    notify_waiters();

    if (m_callback) {
        m_callback_thread.store(std::this_thread::get_id());
        m_callback(*this);
    }

    m_settled.store(true);
    notify_waiters();
}

auto AsyncResultBase::double_completion_error() noexcept -> Error {
    return make_error(ErrorKind::DoubleCompletion, "An asynchronous operation can only complete once.");
}

auto AsyncResultBase::wait_handle() const noexcept -> WaitHandle& {
    std::call_once(m_wait_handle_once, [this] {
        m_wait_handle = std::make_unique<WaitHandle>();
        m_wait_handle_created.store(true);
    });
    return *m_wait_handle;
}

void AsyncResultBase::notify_waiters() const noexcept {
    // A waiter which created the handle after the state change sees it in its
    // wait predicate, so only an already created handle needs signaling.
    if (m_wait_handle_created.load()) {
        auto& handle = wait_handle();
        const std::lock_guard<std::mutex> lock(handle.mutex);
        handle.signaled.notify_all();
    }
}

auto end_invoke(const AsyncResultBase* handle) noexcept -> std::expected<void, Error> {
    if (handle == nullptr) {
        return std::unexpected(make_error(ErrorKind::MismatchedHandle, "A mismatched async result was provided."));
    }
    return handle->wait_settled();
}

auto end_invoke(const std::shared_ptr<AsyncResultBase>& handle) noexcept -> std::expected<void, Error> {
    return end_invoke(handle.get());
}

}  // namespace cryptophage
