// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/correlator.hpp>
#include <acp/errors.hpp>
#include <acp/logging.hpp>
#include <vector>

namespace acp
{

std::future<json> RequestCorrelator::add(
    int64_t id, const std::string& method, std::chrono::milliseconds timeout
)
{
    auto pending = std::make_shared<PendingRequest>(id, method, timeout);
    auto future = pending->promise.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    pending_[id] = std::move(pending);
    return future;
}

bool RequestCorrelator::resolve(const JsonRpcResponse& response)
{
    auto* int_id = std::get_if<int64_t>(&response.id);
    std::shared_ptr<PendingRequest> pending = int_id ? take(*int_id) : nullptr;
    if (!pending)
    {
        // Late arrival after a timeout, or an id we never issued
        logger()->debug("Ignoring response for unknown request id {}", id_to_string(response.id));
        return false;
    }

    if (response.is_error())
    {
        const auto& err = *response.error;
        pending->promise.set_exception(
            std::make_exception_ptr(AgentError(err.code, err.describe(), err.data))
        );
    }
    else
    {
        pending->promise.set_value(response.result.value_or(json::object()));
    }
    return true;
}

bool RequestCorrelator::fail(int64_t id, std::exception_ptr error)
{
    auto pending = take(id);
    if (!pending)
        return false;
    pending->promise.set_exception(std::move(error));
    return true;
}

size_t RequestCorrelator::fail_all(const ErrorFactory& make_error)
{
    std::vector<std::shared_ptr<PendingRequest>> to_fail;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_fail.reserve(pending_.size());
        for (auto& [id, pending] : pending_)
            to_fail.push_back(pending);
        pending_.clear();
    }

    for (auto& pending : to_fail)
        pending->promise.set_exception(make_error());
    return to_fail.size();
}

json RequestCorrelator::await(int64_t id, std::future<json>& future, std::chrono::milliseconds timeout)
{
    if (future.wait_for(timeout) == std::future_status::timeout)
    {
        std::string method;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it != pending_.end())
                method = it->second->method;
        }
        // If fail() loses, the response arrived in the meantime and get() returns it
        if (fail(id, std::make_exception_ptr(TimeoutError(method))))
            logger()->warn("Request {} ({}) timed out after {} ms", id, method, timeout.count());
    }
    return future.get();
}

size_t RequestCorrelator::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::shared_ptr<PendingRequest> RequestCorrelator::take(int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end())
        return nullptr;
    auto pending = std::move(it->second);
    pending_.erase(it);
    return pending;
}

} // namespace acp
