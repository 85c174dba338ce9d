//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_frame.cpp
//
// Frame codec implementation
//===----------------------------------------------------------------------===//

#include "protocol/pg/pg_frame.hpp"
#include "protocol/pg/pg_protocol.hpp"
#include <algorithm>
#include <cstring>

namespace pgmux {
namespace pg {

namespace {

int32_t ReadLength(const uint8_t* p) {
    int32_t value;
    std::memcpy(&value, p, 4);
    return NetworkToHost32(value);
}

void WriteLength(uint8_t* p, int32_t length) {
    int32_t network = HostToNetwork32(length);
    std::memcpy(p, &network, 4);
}

DecodeResult Malformed(std::string error) {
    DecodeResult result;
    result.status = DecodeStatus::MalformedFrame;
    result.error = std::move(error);
    return result;
}

} // anonymous namespace

DecodeResult DecodeFrame(const uint8_t* data, size_t len, size_t max_frame_size) {
    DecodeResult result;
    if (len < 5) {
        return result;
    }

    char tag = static_cast<char>(data[0]);
    if (tag == UNTAGGED) {
        return Malformed("invalid frame tag 0");
    }

    int32_t length = ReadLength(data + 1);
    if (length < 4) {
        return Malformed("invalid frame length " + std::to_string(length) +
                         " for tag '" + std::string(1, tag) + "'");
    }

    size_t payload_len = static_cast<size_t>(length) - 4;
    if (payload_len > max_frame_size) {
        return Malformed("frame length " + std::to_string(length) +
                         " exceeds maximum " + std::to_string(max_frame_size));
    }

    if (len - 1 < static_cast<size_t>(length)) {
        return result;
    }

    result.status = DecodeStatus::Ok;
    result.frame.tag = tag;
    result.frame.payload.assign(data + 5, data + 5 + payload_len);
    result.consumed = 1 + static_cast<size_t>(length);
    return result;
}

DecodeResult DecodeStartupFrame(const uint8_t* data, size_t len, size_t max_frame_size) {
    DecodeResult result;
    if (len < 4) {
        return result;
    }

    int32_t length = ReadLength(data);
    // Every startup-phase packet carries at least a 4-byte code after the length
    if (length < 8) {
        return Malformed("invalid startup packet length " + std::to_string(length));
    }

    size_t payload_len = static_cast<size_t>(length) - 4;
    if (payload_len > max_frame_size) {
        return Malformed("startup packet length " + std::to_string(length) +
                         " exceeds maximum " + std::to_string(max_frame_size));
    }

    if (len < static_cast<size_t>(length)) {
        return result;
    }

    result.status = DecodeStatus::Ok;
    result.frame.tag = UNTAGGED;
    result.frame.payload.assign(data + 4, data + 4 + payload_len);
    result.consumed = static_cast<size_t>(length);
    return result;
}

void AppendFrame(std::vector<uint8_t>& out, const Frame& frame) {
    size_t start = out.size();
    size_t header = frame.IsUntagged() ? 4 : 5;
    out.resize(start + header);
    if (!frame.IsUntagged()) {
        out[start] = static_cast<uint8_t>(frame.tag);
    }
    WriteLength(out.data() + start + header - 4,
                static_cast<int32_t>(frame.payload.size() + 4));
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
}

std::vector<uint8_t> EncodeFrame(const Frame& frame) {
    std::vector<uint8_t> out;
    out.reserve(frame.WireSize());
    AppendFrame(out, frame);
    return out;
}

//===----------------------------------------------------------------------===//
// FrameDecoder
//===----------------------------------------------------------------------===//

FrameDecoder::FrameDecoder(size_t max_frame_size_p)
    : max_frame_size(max_frame_size_p) {
}

void FrameDecoder::Feed(const uint8_t* data, size_t len) {
    Compact();
    buffer.insert(buffer.end(), data, data + len);
}

DecodeResult FrameDecoder::Next(bool startup) {
    const uint8_t* data = buffer.data() + offset;
    size_t remaining = buffer.size() - offset;

    DecodeResult result = startup
        ? DecodeStartupFrame(data, remaining, std::min(max_frame_size, MAX_STARTUP_PACKET_LENGTH))
        : DecodeFrame(data, remaining, max_frame_size);

    if (result.Ok()) {
        offset += result.consumed;
        if (offset == buffer.size()) {
            buffer.clear();
            offset = 0;
        }
    }
    return result;
}

void FrameDecoder::Reset() {
    buffer.clear();
    offset = 0;
}

void FrameDecoder::Compact() {
    // Compact once the consumed prefix is at least half of the buffer
    if (offset > 0 && offset >= buffer.size() / 2) {
        buffer.erase(buffer.begin(), buffer.begin() + offset);
        offset = 0;
    }
}

} // namespace pg
} // namespace pgmux
