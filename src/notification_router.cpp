// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/logging.hpp>
#include <acp/notification_router.hpp>
#include <algorithm>

namespace acp
{

Subscription NotificationRouter::subscribe(NotificationListener listener)
{
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        listeners_.emplace_back(id, std::move(listener));
    }

    // Use weak_ptr to avoid UAF if Subscription outlives the router
    std::weak_ptr<NotificationRouter> weak_self = shared_from_this();
    return Subscription(
        [weak_self, id]()
        {
            if (auto self = weak_self.lock())
                self->remove(id);
        }
    );
}

void NotificationRouter::dispatch(const Notification& notification)
{
    std::vector<NotificationListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_)
            snapshot.push_back(listener);
    }

    for (const auto& listener : snapshot)
    {
        try
        {
            listener(notification);
        }
        catch (const std::exception& e)
        {
            logger()->warn("Listener for {} threw: {}", notification.method, e.what());
        }
    }
}

size_t NotificationRouter::listener_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void NotificationRouter::remove(uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove_if(
            listeners_.begin(),
            listeners_.end(),
            [id](const auto& pair) { return pair.first == id; }
        ),
        listeners_.end()
    );
}

} // namespace acp
