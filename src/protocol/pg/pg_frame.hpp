//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_frame.hpp
//
// Stateless frame codec for the PostgreSQL v3 wire protocol
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <string>
#include <vector>

namespace pgmux {
namespace pg {

// Tag value used for the untagged startup-phase packets
// (StartupMessage, SSLRequest, GSSENCRequest, CancelRequest)
constexpr char UNTAGGED = 0;

// Servers refuse startup packets larger than this
constexpr size_t MAX_STARTUP_PACKET_LENGTH = 10000;

//===----------------------------------------------------------------------===//
// Frame
//===----------------------------------------------------------------------===//
struct Frame {
    char tag = UNTAGGED;
    std::vector<uint8_t> payload;

    Frame() = default;
    Frame(char tag_p, std::vector<uint8_t> payload_p)
        : tag(tag_p), payload(std::move(payload_p)) {}

    bool IsUntagged() const { return tag == UNTAGGED; }

    // Bytes on the wire: tag byte (if any) + length field + payload
    size_t WireSize() const { return (IsUntagged() ? 4 : 5) + payload.size(); }

    bool operator==(const Frame& other) const {
        return tag == other.tag && payload == other.payload;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }
};

//===----------------------------------------------------------------------===//
// Decoding
//===----------------------------------------------------------------------===//
enum class DecodeStatus {
    Ok,
    NeedMoreData,
    MalformedFrame
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::NeedMoreData;
    Frame frame;
    size_t consumed = 0;
    std::string error;

    bool Ok() const { return status == DecodeStatus::Ok; }
};

// Decode one tagged frame from the front of data. Never blocks and never
// allocates more than max_frame_size for the payload.
DecodeResult DecodeFrame(const uint8_t* data, size_t len,
                         size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

// Decode one untagged startup-phase packet (length >= 8)
DecodeResult DecodeStartupFrame(const uint8_t* data, size_t len,
                                size_t max_frame_size = MAX_STARTUP_PACKET_LENGTH);

//===----------------------------------------------------------------------===//
// Encoding
//===----------------------------------------------------------------------===//
std::vector<uint8_t> EncodeFrame(const Frame& frame);
void AppendFrame(std::vector<uint8_t>& out, const Frame& frame);

//===----------------------------------------------------------------------===//
// FrameDecoder - accumulates transport bytes and yields whole frames.
// Holds no protocol state beyond its buffer cursor.
//===----------------------------------------------------------------------===//
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    void Feed(const uint8_t* data, size_t len);

    // Next complete frame from the buffer; startup selects the untagged format
    DecodeResult Next(bool startup = false);

    // Bytes received but not yet returned as a frame
    size_t Buffered() const { return buffer.size() - offset; }
    bool HasPartialFrame() const { return Buffered() > 0; }

    size_t MaxFrameSize() const { return max_frame_size; }

    void Reset();

private:
    void Compact();

private:
    std::vector<uint8_t> buffer;
    size_t offset = 0;
    size_t max_frame_size;
};

} // namespace pg
} // namespace pgmux
