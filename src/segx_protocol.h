#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Protocol constants
static constexpr size_t kSegmentSize = 512;               // payload bytes per DATA
static constexpr int kMaxRetries = 5;                     // transmission attempts per segment
static constexpr double kDefaultErrorProbability = 0.30;  // chance of corrupting a DATA
static constexpr uint64_t kMinFileSize = 2000;            // files <= this are refused
static constexpr size_t kMaxControlPayload = 4096;        // REQ / ERROR / ABORT bodies
static constexpr size_t kMaxFrameBytes = 64 * 1024;       // stream framing limit

#pragma pack(push, 1)
struct SegxHeader {
    uint32_t seq;       // Segment sequence number (network order)
    uint16_t flags;     // Frame type bits (network order)
    uint16_t length;    // Payload bytes following the header (network order)
    uint16_t checksum;  // Checksum of the original payload (network order)
    uint16_t retrans_id; // Attempt number on DATA, echoed by ACK/NACK; zero otherwise
};
#pragma pack(pop)

static_assert(sizeof(SegxHeader) == 12, "SegxHeader must be 12 bytes");

// Frame types, exactly one per frame
enum : uint16_t {
    FLG_REQ   = 0x0001,
    FLG_INFO  = 0x0002,
    FLG_READY = 0x0004,
    FLG_DATA  = 0x0008,
    FLG_ACK   = 0x0010,
    FLG_NACK  = 0x0020,
    FLG_ABORT = 0x0040,
    FLG_ERROR = 0x0080,
    FLG_TYPE_MASK = 0x00FF,

    // Modifier on DATA: corruption was injected into this transmission
    FLG_SIMERR = 0x8000,
};

enum class SegxError : uint16_t {
    None = 0,
    FileNotFound,
    EmptyFilename,
    FileTooSmall,
    InvalidRequest,
    ChecksumMismatch,
    MalformedPacket,
    Timeout,
    RetryBudgetExceeded,
    ConnectionLost,
    Cancelled,
    PeerAborted,
    ProtocolViolation,
};

const char* segx_error_name(SegxError e);

struct SegxPacket {
    uint16_t type = 0;             // one of FLG_REQ..FLG_ERROR
    bool error_simulated = false;  // FLG_SIMERR, DATA only
    uint32_t seq = 0;
    uint16_t checksum = 0;
    uint16_t retrans_id = 0;       // DATA, ACK and NACK only
    std::vector<uint8_t> payload;

    bool operator==(const SegxPacket& o) const {
        return type == o.type && error_simulated == o.error_simulated &&
               seq == o.seq && checksum == o.checksum && retrans_id == o.retrans_id &&
               payload == o.payload;
    }
};

// Utilities
uint32_t segx_now_ms();

// 16-bit one's complement over big-endian words, odd tail padded with zero
uint16_t segx_checksum16(const void* data, size_t len);
uint16_t segx_checksum16(const std::vector<uint8_t>& data);
bool segx_verify_checksum(const std::vector<uint8_t>& data, uint16_t expected);

// Codec. Encoding throws std::invalid_argument for a payload over 65535 bytes
// or a retrans_id on a frame type that does not carry one.
std::vector<uint8_t> segx_encode(const SegxPacket& p);
std::vector<uint8_t> segx_encode_data(uint32_t seq, const std::vector<uint8_t>& payload,
                                      uint16_t checksum, bool error_simulated = false,
                                      uint16_t retrans_id = 1);
SegxError segx_decode(const uint8_t* data, size_t len, SegxPacket& out,
                      size_t max_data_payload = kSegmentSize);
SegxError segx_decode(const std::vector<uint8_t>& wire, SegxPacket& out,
                      size_t max_data_payload = kSegmentSize);

// Control frames. segx_make_request throws std::invalid_argument when the
// name does not fit a control body.
SegxPacket segx_make_request(const std::string& filename, double error_prob);
bool segx_parse_request(const SegxPacket& p, std::string& filename, double& error_prob);

SegxPacket segx_make_info(uint32_t segment_count, uint64_t file_size, uint16_t segment_size);
bool segx_parse_info(const SegxPacket& p, uint32_t& segment_count, uint64_t& file_size,
                     uint16_t& segment_size);

SegxPacket segx_make_control(uint16_t type, uint32_t seq, uint16_t retrans_id = 0);

// ERROR (before a transfer starts) and ABORT (during one) share a body layout
SegxPacket segx_make_reason(uint16_t type, SegxError code, uint32_t seq, const std::string& msg);
bool segx_parse_reason(const SegxPacket& p, SegxError& code, std::string& msg);
