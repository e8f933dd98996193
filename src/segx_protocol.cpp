#include "segx_protocol.h"

#include <arpa/inet.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <stdexcept>

using Clock = std::chrono::steady_clock;

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v >> 16));
    put_u16(out, static_cast<uint16_t>(v));
}

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    put_u32(out, static_cast<uint32_t>(v >> 32));
    put_u32(out, static_cast<uint32_t>(v));
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(get_u16(p)) << 16) | get_u16(p + 2);
}

uint64_t get_u64(const uint8_t* p) {
    return (static_cast<uint64_t>(get_u32(p)) << 32) | get_u32(p + 4);
}

constexpr uint32_t kPpm = 1000000;
constexpr uint32_t kBadPpm = 0xFFFFFFFFu;

bool single_type_bit(uint16_t type) {
    return type != 0 && (type & (type - 1)) == 0;
}

bool carries_retrans_id(uint16_t type) {
    return type == FLG_DATA || type == FLG_ACK || type == FLG_NACK;
}

} // namespace

const char* segx_error_name(SegxError e) {
    switch (e) {
    case SegxError::None:                return "None";
    case SegxError::FileNotFound:        return "FileNotFound";
    case SegxError::EmptyFilename:       return "EmptyFilename";
    case SegxError::FileTooSmall:        return "FileTooSmall";
    case SegxError::InvalidRequest:      return "InvalidRequest";
    case SegxError::ChecksumMismatch:    return "ChecksumMismatch";
    case SegxError::MalformedPacket:     return "MalformedPacket";
    case SegxError::Timeout:             return "Timeout";
    case SegxError::RetryBudgetExceeded: return "RetryBudgetExceeded";
    case SegxError::ConnectionLost:      return "ConnectionLost";
    case SegxError::Cancelled:           return "Cancelled";
    case SegxError::PeerAborted:         return "PeerAborted";
    case SegxError::ProtocolViolation:   return "ProtocolViolation";
    }
    return "Unknown";
}

uint32_t segx_now_ms() {
    auto now = Clock::now().time_since_epoch();
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count()
    );
}

uint16_t segx_checksum16(const void* data, size_t len) {
    // Words are read big-endian so the value does not depend on host order
    uint32_t sum = 0;
    const uint8_t* p = static_cast<const uint8_t*>(data);

    while (len > 1) {
        sum += get_u16(p);
        p += 2;
        len -= 2;
        // Fold early so the accumulator never overflows on large buffers
        if (sum & 0x80000000u) sum = (sum & 0xFFFFu) + (sum >> 16);
    }
    if (len == 1) {
        sum += static_cast<uint32_t>(*p) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFFu) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum & 0xFFFFu);
}

uint16_t segx_checksum16(const std::vector<uint8_t>& data) {
    return segx_checksum16(data.data(), data.size());
}

bool segx_verify_checksum(const std::vector<uint8_t>& data, uint16_t expected) {
    return segx_checksum16(data) == expected;
}

std::vector<uint8_t> segx_encode(const SegxPacket& p) {
    if (p.payload.size() > 0xFFFF) {
        throw std::invalid_argument("segx_encode: payload of " + std::to_string(p.payload.size()) +
                                    " bytes does not fit the length field");
    }
    if (p.retrans_id != 0 && !carries_retrans_id(p.type)) {
        throw std::invalid_argument("segx_encode: retrans_id set on a frame that does not carry one");
    }

    uint16_t flags = p.type;
    if (p.error_simulated) flags |= FLG_SIMERR;

    SegxHeader h{};
    h.seq = htonl(p.seq);
    h.flags = htons(flags);
    h.length = htons(static_cast<uint16_t>(p.payload.size()));
    h.checksum = htons(p.checksum);
    h.retrans_id = htons(p.retrans_id);

    std::vector<uint8_t> out(sizeof(SegxHeader) + p.payload.size());
    std::memcpy(out.data(), &h, sizeof(h));
    if (!p.payload.empty()) {
        std::memcpy(out.data() + sizeof(SegxHeader), p.payload.data(), p.payload.size());
    }
    return out;
}

std::vector<uint8_t> segx_encode_data(uint32_t seq, const std::vector<uint8_t>& payload,
                                      uint16_t checksum, bool error_simulated,
                                      uint16_t retrans_id) {
    SegxPacket p;
    p.type = FLG_DATA;
    p.error_simulated = error_simulated;
    p.seq = seq;
    p.checksum = checksum;
    p.retrans_id = retrans_id;
    p.payload = payload;
    return segx_encode(p);
}

SegxError segx_decode(const uint8_t* data, size_t len, SegxPacket& out,
                      size_t max_data_payload) {
    if (data == nullptr || len < sizeof(SegxHeader)) return SegxError::MalformedPacket;

    SegxHeader h{};
    std::memcpy(&h, data, sizeof(h));

    uint16_t flags = ntohs(h.flags);
    uint16_t length = ntohs(h.length);
    uint16_t type = flags & FLG_TYPE_MASK;
    uint16_t retrans_id = ntohs(h.retrans_id);

    if ((flags & ~(FLG_TYPE_MASK | FLG_SIMERR)) != 0) return SegxError::MalformedPacket;
    if (!single_type_bit(type)) return SegxError::MalformedPacket;
    if ((flags & FLG_SIMERR) && type != FLG_DATA) return SegxError::MalformedPacket;
    if (retrans_id != 0 && !carries_retrans_id(type)) return SegxError::MalformedPacket;
    if (static_cast<size_t>(length) != len - sizeof(SegxHeader)) return SegxError::MalformedPacket;

    size_t limit = (type == FLG_DATA) ? max_data_payload : kMaxControlPayload;
    if (length > limit) return SegxError::MalformedPacket;

    out.type = type;
    out.error_simulated = (flags & FLG_SIMERR) != 0;
    out.seq = ntohl(h.seq);
    out.checksum = ntohs(h.checksum);
    out.retrans_id = retrans_id;
    out.payload.assign(data + sizeof(SegxHeader), data + len);
    return SegxError::None;
}

SegxError segx_decode(const std::vector<uint8_t>& wire, SegxPacket& out,
                      size_t max_data_payload) {
    return segx_decode(wire.data(), wire.size(), out, max_data_payload);
}

SegxPacket segx_make_request(const std::string& filename, double error_prob) {
    if (filename.size() > kMaxControlPayload - 4) {
        throw std::invalid_argument("segx_make_request: filename longer than " +
                                    std::to_string(kMaxControlPayload - 4) + " bytes");
    }

    uint32_t ppm = kBadPpm;
    if (error_prob >= 0.0 && error_prob <= 1.0) {
        ppm = static_cast<uint32_t>(std::lround(error_prob * kPpm));
    }

    SegxPacket p;
    p.type = FLG_REQ;
    put_u32(p.payload, ppm);
    p.payload.insert(p.payload.end(), filename.begin(), filename.end());
    p.checksum = segx_checksum16(p.payload);
    return p;
}

bool segx_parse_request(const SegxPacket& p, std::string& filename, double& error_prob) {
    if (p.type != FLG_REQ || p.payload.size() < 4) return false;

    uint32_t ppm = get_u32(p.payload.data());
    if (ppm > kPpm) return false;

    error_prob = static_cast<double>(ppm) / kPpm;
    filename.assign(p.payload.begin() + 4, p.payload.end());
    return true;
}

SegxPacket segx_make_info(uint32_t segment_count, uint64_t file_size, uint16_t segment_size) {
    SegxPacket p;
    p.type = FLG_INFO;
    put_u32(p.payload, segment_count);
    put_u64(p.payload, file_size);
    put_u16(p.payload, segment_size);
    p.checksum = segx_checksum16(p.payload);
    return p;
}

bool segx_parse_info(const SegxPacket& p, uint32_t& segment_count, uint64_t& file_size,
                     uint16_t& segment_size) {
    if (p.type != FLG_INFO || p.payload.size() != 14) return false;

    segment_count = get_u32(p.payload.data());
    file_size = get_u64(p.payload.data() + 4);
    segment_size = get_u16(p.payload.data() + 12);
    return true;
}

SegxPacket segx_make_control(uint16_t type, uint32_t seq, uint16_t retrans_id) {
    SegxPacket p;
    p.type = type;
    p.seq = seq;
    p.retrans_id = retrans_id;
    p.checksum = segx_checksum16(nullptr, 0);
    return p;
}

SegxPacket segx_make_reason(uint16_t type, SegxError code, uint32_t seq, const std::string& msg) {
    SegxPacket p;
    p.type = type;
    p.seq = seq;
    put_u16(p.payload, static_cast<uint16_t>(code));

    size_t room = kMaxControlPayload - p.payload.size();
    p.payload.insert(p.payload.end(), msg.begin(),
                     msg.begin() + static_cast<std::ptrdiff_t>(msg.size() < room ? msg.size() : room));
    p.checksum = segx_checksum16(p.payload);
    return p;
}

bool segx_parse_reason(const SegxPacket& p, SegxError& code, std::string& msg) {
    if ((p.type != FLG_ERROR && p.type != FLG_ABORT) || p.payload.size() < 2) return false;

    uint16_t raw = get_u16(p.payload.data());
    if (raw > static_cast<uint16_t>(SegxError::ProtocolViolation)) {
        code = SegxError::ProtocolViolation;
    } else {
        code = static_cast<SegxError>(raw);
    }
    msg.assign(p.payload.begin() + 2, p.payload.end());
    return true;
}
