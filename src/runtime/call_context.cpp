#include "triple/runtime/call_context.hpp"

#include <algorithm>

namespace triple::runtime
{
namespace detail
{

std::uint64_t CancelState::add_callback(std::function<void()> callback)
{
    {
        std::lock_guard lock(mutex);
        if (!cancelled.load(std::memory_order_acquire)) {
            std::uint64_t id = next_id++;
            callbacks.emplace_back(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancelState::remove_callback(std::uint64_t id)
{
    std::lock_guard lock(mutex);
    callbacks.erase(std::remove_if(callbacks.begin(), callbacks.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    callbacks.end());
}

void CancelState::trigger()
{
    std::vector<std::function<void()>> to_invoke;
    {
        std::lock_guard lock(mutex);
        if (cancelled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& [id, callback] : callbacks) {
            to_invoke.push_back(std::move(callback));
        }
        callbacks.clear();
    }
    for (auto& callback : to_invoke) {
        callback();
    }
}

}  // namespace detail

CancelRegistration CancelToken::on_cancel(std::function<void()> callback) const
{
    if (!state_) {
        return {};
    }
    auto id = state_->add_callback(std::move(callback));
    if (id == 0) {
        return {};
    }
    return CancelRegistration{state_, id};
}

}  // namespace triple::runtime
