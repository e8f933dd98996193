#pragma once

#include "SegxChannel.h"
#include "segx_events.h"
#include "segx_fragment.h"
#include "segx_protocol.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

struct SegReceiverArgs {
    std::string filename;                          // file requested from the sender
    double error_prob = kDefaultErrorProbability;  // corruption chance asked of the sender
    int idle_timeout_ms = 30000;                   // longest silence tolerated from the sender
    std::string tag;                               // log prefix
};

// Receiving end of one transfer. Verifies each segment, answers ACK/NACK
// and only exposes the file once every segment has been verified.
class SegReceiver {
public:
    SegReceiver(const SegReceiverArgs& args, SegxChannel& channel, EventSink sink = {});

    SegReceiver(const SegReceiver&) = delete;
    SegReceiver& operator=(const SegReceiver&) = delete;

    bool run();

    // Safe to call from another thread
    void abort();

    // Snapshots as of the latest event; safe to poll while run() is in progress
    TransferState state() const { return st.load(); }
    TransferStats stats() const;
    TransferOutcome outcome() const;

    // Reassembled file; only read once run() has returned true
    const std::vector<uint8_t>& file() const { return output; }

private:
    enum class Next { Continue, Done, Failed };

    bool await_info();
    Next on_frame(const std::vector<uint8_t>& frame);
    void on_data(const SegxPacket& p);
    void reject_segment(uint32_t seq, uint16_t retrans_id, bool error_simulated, const std::string& why);
    bool send_verdict(uint16_t type, uint32_t seq, uint16_t retrans_id);
    bool complete();

    bool fail(SegxError code, uint32_t seq, const std::string& msg, bool notify_peer);
    void emit(const TransferEvent& ev);
    void publish();
    void finish_stats();
    std::ostream& log();

private:
    SegReceiverArgs A;
    SegxChannel& chan;
    EventSink sink;

    std::atomic<TransferState> st{TransferState::Idle};
    std::atomic<bool> cancelled{false};

    TransferStats stats_;
    TransferOutcome result;
    uint32_t start_ms = 0;

    mutable std::mutex mu;  // guards the published copies below
    TransferStats published_stats;
    TransferOutcome published_result;

    uint32_t total = 0;
    uint64_t file_size = 0;
    uint16_t segment_size = 0;

    uint32_t expected = 0;            // next sequence number to accept
    uint32_t attempts = 0;            // DATA frames seen for `expected`
    bool send_failed = false;
    std::vector<SegxSegment> received;
    std::vector<uint8_t> output;
};
