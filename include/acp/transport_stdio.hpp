// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <acp/process.hpp>
#include <acp/transport.hpp>
#include <atomic>
#include <string>

namespace acp
{

// =============================================================================
// PipeTransport - Transport adapter for Process pipes
// =============================================================================

/// Transport that wraps Process ReadPipe and WritePipe
///
/// This adapter carries the agent's stdio streams to the Connection. The pipes
/// are owned by the Process, so this transport doesn't close them. Closing the
/// transport only marks it unusable: a pending read() or write() notices within
/// one poll interval and throws ConnectionClosedError.
class PipeTransport : public ITransport
{
  public:
    /// Construct from WritePipe (for writing) and ReadPipe (for reading)
    /// @param write_pipe Reference to the process stdin pipe
    /// @param read_pipe Reference to the process stdout pipe
    /// @note The pipes must outlive this transport
    PipeTransport(WritePipe& write_pipe, ReadPipe& read_pipe)
        : write_pipe_(&write_pipe), read_pipe_(&read_pipe), open_(true)
    {
    }

    ~PipeTransport() override
    {
        // Don't close pipes - they're owned by Process
        open_ = false;
    }

    // Non-copyable, non-movable (references to external pipes)
    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;
    PipeTransport(PipeTransport&&) = delete;
    PipeTransport& operator=(PipeTransport&&) = delete;

    size_t read(char* buffer, size_t size) override
    {
        if (!open_ || !read_pipe_)
            throw ConnectionClosedError();
        try
        {
            // Poll so that close() releases a reader even if the pipe never reaches EOF
            while (!read_pipe_->has_data(kPollIntervalMs))
            {
                if (!open_)
                    throw ConnectionClosedError();
            }
            size_t bytes_read = read_pipe_->read(buffer, size);
            if (bytes_read == 0)
                open_ = false;
            return bytes_read;
        }
        catch (const ProcessError& e)
        {
            open_ = false;
            throw TransportError(e.what());
        }
    }

    void write(const char* data, size_t size) override
    {
        if (!open_ || !write_pipe_)
            throw ConnectionClosedError();
        try
        {
            // Chunked like read() so that close() releases a writer stuck on a full pipe
            size_t written = 0;
            while (written < size)
            {
                if (!open_)
                    throw ConnectionClosedError("Connection closed during write");
                written += write_pipe_->write_some(data + written, size - written, kPollIntervalMs);
            }
        }
        catch (const ProcessError& e)
        {
            open_ = false;
            throw TransportError(e.what());
        }
    }

    void close() override
    {
        open_ = false;
        // Don't close pipes - they're owned by Process
    }

    bool is_open() const override
    {
        return open_;
    }

  private:
    static constexpr int kPollIntervalMs = 100;

    WritePipe* write_pipe_;
    ReadPipe* read_pipe_;
    std::atomic<bool> open_;
};

} // namespace acp
