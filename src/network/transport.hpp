//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// network/transport.hpp
//
// Byte stream abstraction under a backend connection
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace pgmux {

//===----------------------------------------------------------------------===//
// Transport
//
// Blocking calls are only made while no asynchronous operation is
// outstanding. Asynchronous completions run on the transport's own thread.
//===----------------------------------------------------------------------===//
class Transport {
public:
    using IoHandler = std::function<void(const std::error_code&, size_t)>;

    virtual ~Transport() = default;

    // Write the whole buffer
    virtual void Write(const uint8_t* data, size_t len, std::error_code& ec) = 0;

    // Read at least one byte, waiting up to timeout
    virtual size_t ReadSome(uint8_t* data, size_t len,
                            std::chrono::milliseconds timeout,
                            std::error_code& ec) = 0;

    virtual void AsyncWrite(std::vector<uint8_t> data, IoHandler handler) = 0;

    // The buffer must stay valid until the handler runs
    virtual void AsyncReadSome(uint8_t* data, size_t len, IoHandler handler) = 0;

    // Abort outstanding asynchronous operations; handlers still run
    virtual void Cancel() = 0;

    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    // Peer description for logs
    virtual std::string Describe() const = 0;
};

} // namespace pgmux
