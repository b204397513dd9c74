// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace acp
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Exception thrown when transport operations fail
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// Exception thrown when connection is closed
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the underlying byte stream (subprocess pipes, in-memory
/// test pipes). Framing is handled separately by LineFramer.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @param buffer Destination buffer
    /// @param size Maximum bytes to read
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    /// @param data Source data
    /// @param size Number of bytes to write
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// Check if transport is open
    virtual bool is_open() const = 0;

    // Convenience overloads
    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }

    void write(const std::vector<char>& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Newline-Delimited Message Framer
// =============================================================================

/// Handles newline-delimited framing for JSON-RPC messages
///
/// Message format:
/// ```
/// {"jsonrpc":"2.0","id":1,"method":"initialize","params":{...}}\n
/// ```
///
/// One JSON text per line; the serializer never emits raw newlines inside a
/// message. Reading returns the line with surrounding whitespace (including a
/// trailing \r) removed; callers skip empty results.
class LineFramer
{
  public:
    explicit LineFramer(ITransport& transport) : transport_(transport) {}

    /// Read the next line
    /// @return The trimmed line (may be empty for blank lines)
    /// @throws TransportError on read failure
    /// @throws ConnectionClosedError if the stream ended with no pending data
    std::string read_message();

    /// Write a message followed by a newline in a single transport write
    /// @throws TransportError on write failure
    void write_message(const std::string& message);

  private:
    ITransport& transport_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
    bool eof_ = false;

    /// Ensure buffer has at least one unread byte; false on EOF
    bool fill_buffer();
};

/// Strip leading and trailing whitespace
inline std::string trim(const std::string& s)
{
    const char* whitespace = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

// =============================================================================
// Inline implementations
// =============================================================================

inline std::string LineFramer::read_message()
{
    std::string line;
    bool have_data = false;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer())
        {
            // Deliver an unterminated final line, then report EOF
            if (have_data)
                return trim(line);
            throw ConnectionClosedError("Connection closed while reading message");
        }

        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_);
        auto end = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_len_);
        auto newline = std::find(begin, end, '\n');

        line.append(begin, newline);
        have_data = true;
        buffer_pos_ += static_cast<size_t>(newline - begin);

        if (newline != end)
        {
            ++buffer_pos_; // consume '\n'
            return trim(line);
        }
    }
}

inline void LineFramer::write_message(const std::string& message)
{
    std::string frame;
    frame.reserve(message.size() + 1);
    frame += message;
    frame += '\n';
    transport_.write(frame);
}

inline bool LineFramer::fill_buffer()
{
    if (eof_)
        return false;

    constexpr size_t kMinBufferSize = 4096;
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    buffer_pos_ = 0;
    buffer_len_ = 0;

    size_t bytes_read = transport_.read(buffer_.data(), buffer_.size());
    if (bytes_read == 0)
    {
        eof_ = true;
        return false;
    }

    buffer_len_ = bytes_read;
    return true;
}

} // namespace acp
