#pragma once

#include "ErrorInjector.h"
#include "SegxChannel.h"
#include "segx_events.h"
#include "segx_fragment.h"
#include "segx_protocol.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Looks up a requested file; returns FileNotFound (or another fatal code) on failure
using FileSource = std::function<SegxError(const std::string& name, std::vector<uint8_t>& out)>;

struct SegSenderArgs {
    std::string root = ".";                        // directory files are served from
    size_t segment_size = kSegmentSize;            // payload bytes per DATA
    int max_retries = kMaxRetries;                 // transmission attempts per segment
    std::optional<double> force_error_prob;        // overrides the probability in the request
    int ack_timeout_ms = 5000;                     // wait for ACK/NACK before retransmitting
    int request_timeout_ms = 30000;                // wait for REQ / READY
    uint64_t min_file_size = kMinFileSize;         // files <= this are refused
    std::optional<uint32_t> seed;                  // error injection seed (random if unset)
    std::string tag;                               // log prefix
};

// Sending end of one transfer. Bound to a single channel, runs one
// request/response loop with one segment in flight at a time.
class SegSender {
public:
    SegSender(const SegSenderArgs& args, SegxChannel& channel, EventSink sink = {},
              FileSource source = {});

    SegSender(const SegSender&) = delete;
    SegSender& operator=(const SegSender&) = delete;

    // Waits for a request, looks the file up and transfers it
    bool run();

    // Transfers an already loaded file; starts by announcing it with INFO
    bool transfer(const std::string& name, const std::vector<uint8_t>& file, double error_prob);

    // Safe to call from another thread
    void abort();

    // Snapshots as of the latest event; safe to poll while run() is in progress
    TransferState state() const { return st.load(); }
    TransferStats stats() const;
    TransferOutcome outcome() const;

private:
    enum class Verdict { Ack, Nack, Timeout, PeerAbort, Lost, Cancelled };

    bool await_request(std::string& name, double& error_prob);
    bool await_ready();
    bool send_segment(const SegxSegment& seg, ErrorInjector& inj, uint16_t attempt);
    Verdict wait_verdict(uint32_t seq, uint16_t attempt);
    RecvStatus recv_packet(SegxPacket& out, int timeout_ms, bool& malformed);

    SegxError load_file(const std::string& name, std::vector<uint8_t>& out);
    bool reject(SegxError code, const std::string& msg);
    bool fail(SegxError code, uint32_t seq, const std::string& msg, bool notify_peer);

    void emit(const TransferEvent& ev);
    void publish();
    void finish_stats();
    std::ostream& log();

private:
    SegSenderArgs A;
    SegxChannel& chan;
    EventSink sink;
    FileSource source;

    std::atomic<TransferState> st{TransferState::Idle};
    std::atomic<bool> cancelled{false};

    TransferStats stats_;
    TransferOutcome result;
    uint32_t start_ms = 0;

    mutable std::mutex mu;  // guards the published copies below
    TransferStats published_stats;
    TransferOutcome published_result;

    std::string filename;
    uint32_t total = 0;
    uint64_t file_size = 0;
    std::vector<SegxSegment> segments;
    bool last_simulated = false;  // corruption injected into the latest DATA

    SegxError peer_code = SegxError::None;  // reason carried by the receiver's ABORT
    std::string peer_msg;
};
