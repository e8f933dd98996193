#pragma once

#include "segx_protocol.h"

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

enum class TransferState {
    Idle,
    AwaitingRequest,  // sender: waiting for REQ / receiver: waiting for INFO
    Fragmenting,
    SendingSegment,
    AwaitingAck,
    SegmentAcked,
    SegmentNacked,
    ReceivingSegment,
    Completed,
    Aborted,
};

const char* segx_state_name(TransferState s);

struct TransferStats {
    uint32_t segments_sent = 0;       // DATA frames sent (or seen by the receiver), retransmissions included
    uint32_t segments_delivered = 0;  // segments verified by the receiver
    uint32_t errors_detected = 0;
    uint32_t retransmissions = 0;
    uint32_t timeouts = 0;
    uint64_t bytes = 0;               // payload bytes delivered
    long long elapsed_ms = 0;

    double rate_kibps() const {
        if (elapsed_ms <= 0) return 0.0;
        return (bytes / 1024.0) / (elapsed_ms / 1000.0);
    }
};

struct TransferOutcome {
    SegxError error = SegxError::None;
    uint32_t failed_segment = 0;
    std::string message;
};

enum class SegmentOutcome {
    Success,
    Error,
    Retry,
};

struct TransferStart {
    std::string filename;
    uint32_t total_segments = 0;
    uint64_t file_size = 0;
};

struct SegmentStatus {
    uint32_t segment = 0;
    uint32_t total_segments = 0;
    uint64_t file_size = 0;
    SegmentOutcome status = SegmentOutcome::Success;
    uint32_t attempt = 1;
    bool error_simulated = false;
    std::string message;
};

struct TransferComplete {
    std::string filename;
    uint32_t total_segments = 0;
    uint64_t file_size = 0;
    TransferStats stats;
};

struct TransferFailed {
    std::string filename;
    SegxError error = SegxError::None;
    uint32_t segment = 0;
    std::string message;
    TransferStats stats;
};

using TransferEvent = std::variant<TransferStart, SegmentStatus, TransferComplete, TransferFailed>;
using EventSink = std::function<void(const TransferEvent&)>;

// One line per event, for terminals and logs
std::string segx_describe(const TransferEvent& ev);
