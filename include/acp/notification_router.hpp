// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file notification_router.hpp
/// @brief Fan-out of inbound notifications to subscribed listeners

#include <acp/jsonrpc.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace acp
{

/// An inbound message delivered to listeners
///
/// `id` is set when the message is an observed reverse request (already
/// answered by the time listeners see it).
struct Notification
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id;
};

/// Listener callback
using NotificationListener = std::function<void(const Notification& notification)>;

// =============================================================================
// Subscription - RAII subscription handle
// =============================================================================

/// RAII handle for listener subscriptions
/// Automatically unsubscribes when destroyed
class Subscription
{
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe)
        : unsubscribe_(std::move(unsubscribe))
    {
    }
    ~Subscription()
    {
        if (unsubscribe_)
            unsubscribe_();
    }

    // Move-only
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept : unsubscribe_(std::move(other.unsubscribe_))
    {
        other.unsubscribe_ = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            if (unsubscribe_)
                unsubscribe_();
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    /// Unsubscribe manually
    void unsubscribe()
    {
        if (unsubscribe_)
        {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    /// True until unsubscribed
    bool active() const
    {
        return static_cast<bool>(unsubscribe_);
    }

  private:
    std::function<void()> unsubscribe_;
};

// =============================================================================
// NotificationRouter
// =============================================================================

/// Listener registry with snapshot dispatch
///
/// Must be owned by a std::shared_ptr; subscriptions hold a weak reference and
/// may safely outlive the router.
///
/// Example usage:
/// @code
/// auto router = std::make_shared<NotificationRouter>();
/// auto sub = router->subscribe([](const Notification& n) {
///     if (n.method == "session/update")
///         handle(n.params);
/// });
/// @endcode
class NotificationRouter : public std::enable_shared_from_this<NotificationRouter>
{
  public:
    /// Register a listener
    /// @return Subscription handle (unsubscribes on destruction)
    Subscription subscribe(NotificationListener listener);

    /// Deliver a message to every listener registered when dispatch starts
    ///
    /// Listener exceptions are logged; the remaining listeners still run.
    void dispatch(const Notification& notification);

    /// Number of registered listeners
    size_t listener_count() const;

  private:
    void remove(uint64_t id);

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::vector<std::pair<uint64_t, NotificationListener>> listeners_;
};

} // namespace acp
