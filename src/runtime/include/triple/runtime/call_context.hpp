#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace triple::runtime
{

namespace detail
{

struct CancelState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
    std::uint64_t next_id = 1;

    // Returns 0 when the callback already ran because cancellation happened first.
    std::uint64_t add_callback(std::function<void()> callback);
    void remove_callback(std::uint64_t id);
    void trigger();
};

}  // namespace detail

class CancelRegistration
{
public:
    CancelRegistration() = default;
    CancelRegistration(std::shared_ptr<detail::CancelState> state, std::uint64_t id)
        : state_(std::move(state))
        , id_(id)
    {
    }

    CancelRegistration(CancelRegistration&& other) noexcept
        : state_(std::move(other.state_))
        , id_(other.id_)
    {
        other.id_ = 0;
    }

    CancelRegistration& operator=(CancelRegistration&& other) noexcept
    {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

    ~CancelRegistration()
    {
        reset();
    }

    void reset()
    {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        id_ = 0;
        state_.reset();
    }

private:
    std::shared_ptr<detail::CancelState> state_;
    std::uint64_t id_ = 0;
};

class CancelToken
{
public:
    // An empty token is never cancelled.
    CancelToken() = default;

    bool is_cancelled() const noexcept
    {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    // The callback runs immediately when cancellation was already requested.
    [[nodiscard]] CancelRegistration on_cancel(std::function<void()> callback) const;

private:
    friend class CancelSource;

    explicit CancelToken(std::shared_ptr<detail::CancelState> state)
        : state_(std::move(state))
    {
    }

    std::shared_ptr<detail::CancelState> state_;
};

class CancelSource
{
public:
    CancelSource()
        : state_(std::make_shared<detail::CancelState>())
    {
    }

    CancelToken token() const noexcept
    {
        return CancelToken{state_};
    }

    void cancel()
    {
        state_->trigger();
    }

    bool is_cancelled() const noexcept
    {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::CancelState> state_;
};

using Clock = std::chrono::steady_clock;

/**
 * @brief Per-call metadata passed explicitly alongside every call.
 *
 * The interface key selects the remote service for calls resolved by method
 * name. The deadline and cancel token bound every blocking step of the call.
 */
struct CallContext {
    std::string interface_key;
    std::string request_id;
    std::optional<Clock::time_point> deadline;
    CancelToken cancel;

    static CallContext with_interface(std::string key)
    {
        CallContext ctx;
        ctx.interface_key = std::move(key);
        return ctx;
    }

    CallContext& set_timeout(std::chrono::milliseconds timeout)
    {
        deadline = Clock::now() + timeout;
        return *this;
    }

    bool expired() const
    {
        return deadline && Clock::now() >= *deadline;
    }
};

}  // namespace triple::runtime
