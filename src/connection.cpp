// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <acp/connection.hpp>
#include <acp/errors.hpp>
#include <acp/logging.hpp>

namespace acp
{

Connection::Connection(
    std::unique_ptr<ITransport> transport,
    std::shared_ptr<NotificationRouter> router,
    std::shared_ptr<ReverseRequestHandler> handler
)
    : transport_(std::move(transport)), framer_(*transport_), router_(std::move(router)),
      handler_(std::move(handler))
{
}

Connection::~Connection()
{
    stop();
}

void Connection::start()
{
    if (running_.exchange(true))
        return; // Already running

    stopping_ = false;
    read_thread_ = std::thread([this] { read_loop(); });
}

void Connection::stop()
{
    stopping_ = true;
    if (transport_)
        transport_->close();
    {
        // A writer blocked on a full pipe sees the close and gives up the lock
        std::lock_guard<std::mutex> lock(write_mutex_);
    }

    if (read_thread_.joinable())
        read_thread_.join();

    running_ = false;
    correlator_.fail_all([] { return std::make_exception_ptr(ProcessTerminatedError()); });
}

void Connection::set_close_handler(CloseHandler handler)
{
    std::lock_guard<std::mutex> lock(close_mutex_);
    close_handler_ = std::move(handler);
}

json Connection::request(
    const std::string& method, const json& params, std::chrono::milliseconds timeout
)
{
    int64_t id = correlator_.next_id();
    auto future = correlator_.add(id, method, timeout);

    // The worker clears running_ before failing the table, so an entry added
    // after that sweep is caught here
    if (!running_)
        correlator_.fail(id, std::make_exception_ptr(ProcessTerminatedError()));

    else
    {
        JsonRpcRequest request{JsonRpcId{id}, method, params};
        logger()->debug("-> {} id={}", method, id);
        try
        {
            send_message(request.to_json());
        }
        catch (const TransportError& e)
        {
            correlator_.fail(id, std::make_exception_ptr(Error("ACP write failed: " + method)));
            logger()->warn("Write of {} failed: {}", method, e.what());
        }
    }

    return correlator_.await(id, future, timeout);
}

void Connection::notify(const std::string& method, const json& params)
{
    JsonRpcNotification notification{method, params};
    logger()->debug("-> {} (notification)", method);
    try
    {
        send_message(notification.to_json());
    }
    catch (const TransportError& e)
    {
        throw Error("ACP write failed: " + method + ": " + e.what());
    }
}

size_t Connection::fail_pending(const ErrorFactory& make_error)
{
    return correlator_.fail_all(make_error);
}

void Connection::send_message(const json& message)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    framer_.write_message(message.dump());
}

void Connection::read_loop()
{
    while (running_)
    {
        std::string line;
        try
        {
            line = framer_.read_message();
        }
        catch (const ConnectionClosedError&)
        {
            break;
        }
        catch (const TransportError& e)
        {
            if (!stopping_)
                logger()->warn("Agent stream failed: {}", e.what());
            break;
        }

        if (line.empty())
            continue;

        try
        {
            handle_frame(parse_frame(json::parse(line)));
        }
        catch (const json::exception& e)
        {
            logger()->warn("Skipping malformed frame ({}): {}", e.what(), line);
        }
        catch (const JsonRpcError& e)
        {
            logger()->warn("Skipping invalid frame ({}): {}", e.what(), line);
        }
    }

    on_stream_closed();
}

void Connection::handle_frame(Frame frame)
{
    if (auto* response = std::get_if<JsonRpcResponse>(&frame))
    {
        correlator_.resolve(*response);
    }
    else if (auto* request = std::get_if<JsonRpcRequest>(&frame))
    {
        handle_request(*request);
    }
    else
    {
        auto& notification = std::get<JsonRpcNotification>(frame);
        router_->dispatch(Notification{notification.method, notification.params, std::nullopt});
    }
}

void Connection::handle_request(const JsonRpcRequest& request)
{
    auto response = handler_->handle(request);
    try
    {
        send_message(response.to_json());
    }
    catch (const TransportError& e)
    {
        logger()->warn(
            "Could not answer {} id={}: {}", request.method, id_to_string(request.id), e.what()
        );
    }

    // Observers see the request only after it has been answered
    router_->dispatch(Notification{request.method, request.params, request.id});
}

void Connection::on_stream_closed()
{
    running_ = false;
    size_t failed =
        correlator_.fail_all([] { return std::make_exception_ptr(ProcessTerminatedError()); });
    if (!stopping_)
        logger()->info("Agent stream closed; failed {} pending request(s)", failed);

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        handler = close_handler_;
    }
    if (handler && !stopping_)
        handler();
}

} // namespace acp
