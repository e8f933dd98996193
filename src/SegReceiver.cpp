#include "SegReceiver.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

using Clock = std::chrono::steady_clock;

namespace {

constexpr int kPollSliceMs = 100;

int ms_left(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

SegReceiver::SegReceiver(const SegReceiverArgs& args, SegxChannel& channel, EventSink s)
    : A(args), chan(channel), sink(std::move(s)) {}

void SegReceiver::abort() {
    cancelled.store(true);
}

TransferStats SegReceiver::stats() const {
    std::lock_guard<std::mutex> lock(mu);
    return published_stats;
}

TransferOutcome SegReceiver::outcome() const {
    std::lock_guard<std::mutex> lock(mu);
    return published_result;
}

std::ostream& SegReceiver::log() {
    if (!A.tag.empty()) std::cerr << "[" << A.tag << "] ";
    return std::cerr;
}

bool SegReceiver::run() {
    if (A.filename.empty()) {
        return fail(SegxError::EmptyFilename, 0, "Filename cannot be empty", false);
    }
    if (!(A.error_prob >= 0.0 && A.error_prob <= 1.0)) {
        return fail(SegxError::InvalidRequest, 0, "Error probability must be within [0, 1]", false);
    }
    if (A.filename.size() > kMaxControlPayload - 4) {
        return fail(SegxError::InvalidRequest, 0, "Filename too long", false);
    }

    st = TransferState::AwaitingRequest;
    log() << "Requesting " << A.filename << " (error probability " << A.error_prob << ")\n";
    if (!chan.send_frame(segx_encode(segx_make_request(A.filename, A.error_prob)))) {
        return fail(SegxError::ConnectionLost, 0, "Failed to send request", false);
    }

    if (!await_info()) return false;

    if (!chan.send_frame(segx_encode(segx_make_control(FLG_READY, 0)))) {
        return fail(SegxError::ConnectionLost, 0, "Failed to accept transfer", false);
    }

    stats_ = TransferStats{};
    start_ms = segx_now_ms();
    st = TransferState::ReceivingSegment;
    log() << "Expecting " << total << " segments (" << file_size << " bytes)\n";
    emit(TransferStart{ A.filename, total, file_size });

    if (total == 0) return complete();

    auto deadline = Clock::now() + std::chrono::milliseconds(A.idle_timeout_ms);
    std::vector<uint8_t> frame;
    while (true) {
        if (cancelled) return fail(SegxError::Cancelled, expected, "Transfer cancelled", true);

        int left = ms_left(deadline);
        if (left == 0) return fail(SegxError::Timeout, expected, "Sender went silent", true);

        RecvStatus rs = chan.recv_frame(frame, std::min(left, kPollSliceMs));
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Closed) {
            return fail(SegxError::ConnectionLost, expected, "Connection closed by sender", false);
        }
        deadline = Clock::now() + std::chrono::milliseconds(A.idle_timeout_ms);

        Next n = on_frame(frame);
        if (n == Next::Failed) return false;
        if (send_failed) {
            return fail(SegxError::ConnectionLost, expected, "Failed to send verdict", false);
        }
        if (n == Next::Done) return complete();
    }
}

bool SegReceiver::await_info() {
    auto deadline = Clock::now() + std::chrono::milliseconds(A.idle_timeout_ms);

    while (true) {
        if (cancelled) return fail(SegxError::Cancelled, 0, "Transfer cancelled", true);

        int left = ms_left(deadline);
        if (left == 0) return fail(SegxError::Timeout, 0, "No response from sender", true);

        std::vector<uint8_t> frame;
        RecvStatus rs = chan.recv_frame(frame, std::min(left, kPollSliceMs));
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Closed) {
            return fail(SegxError::ConnectionLost, 0, "Connection closed before transfer", false);
        }

        SegxPacket p;
        if (segx_decode(frame, p) != SegxError::None) {
            return fail(SegxError::ProtocolViolation, 0, "Malformed response from sender", true);
        }

        if (p.type == FLG_ERROR || p.type == FLG_ABORT) {
            SegxError code = SegxError::PeerAborted;
            std::string msg;
            if (!segx_parse_reason(p, code, msg)) msg = "unspecified";
            if (code == SegxError::None) code = SegxError::PeerAborted;
            return fail(code, 0, "Server error: " + msg, false);
        }
        if (p.type != FLG_INFO) {
            log() << "Ignoring frame type 0x" << std::hex << p.type << std::dec << " before transfer info\n";
            continue;
        }

        if (!segx_parse_info(p, total, file_size, segment_size) || segment_size == 0) {
            return fail(SegxError::ProtocolViolation, 0, "Invalid transfer info", true);
        }
        uint64_t want = (file_size + segment_size - 1) / segment_size;
        if (want != total) {
            return fail(SegxError::ProtocolViolation, 0,
                        "Segment count " + std::to_string(total) + " does not match file size " +
                        std::to_string(file_size), true);
        }

        received.clear();
        received.reserve(total);
        expected = 0;
        attempts = 0;
        return true;
    }
}

SegReceiver::Next SegReceiver::on_frame(const std::vector<uint8_t>& frame) {
    SegxPacket p;
    if (segx_decode(frame, p, segment_size) != SegxError::None) {
        // Treated as a corrupted segment. The NACK names no attempt, so the
        // sender falls back on its verdict timeout.
        ++attempts;
        reject_segment(expected, 0, false, "Malformed packet");
        return Next::Continue;
    }

    switch (p.type) {
    case FLG_DATA:
        on_data(p);
        return expected == total ? Next::Done : Next::Continue;

    case FLG_ABORT:
    case FLG_ERROR: {
        SegxError code = SegxError::PeerAborted;
        std::string msg;
        if (!segx_parse_reason(p, code, msg)) msg = "unspecified";
        if (code == SegxError::None) code = SegxError::PeerAborted;
        fail(code, p.seq, "Sender aborted: " + msg, false);
        return Next::Failed;
    }

    default:
        log() << "Ignoring frame type 0x" << std::hex << p.type << std::dec << " during transfer\n";
        return Next::Continue;
    }
}

void SegReceiver::on_data(const SegxPacket& p) {
    ++stats_.segments_sent;

    if (p.seq == expected) {
        ++attempts;
        if (attempts > 1) ++stats_.retransmissions;

        if (p.payload.size() != segx_segment_length(p.seq, file_size, segment_size)) {
            reject_segment(p.seq, p.retrans_id, p.error_simulated, "Unexpected segment length");
            return;
        }
        if (!segx_verify_checksum(p.payload, p.checksum)) {
            reject_segment(p.seq, p.retrans_id, p.error_simulated, "Checksum verification failed");
            return;
        }

        received.push_back(SegxSegment{ p.seq, p.payload });
        ++stats_.segments_delivered;
        stats_.bytes += p.payload.size();

        if (!send_verdict(FLG_ACK, p.seq, p.retrans_id)) return;

        bool retried = attempts > 1;
        log() << "DATA seq=" << p.seq << " len=" << p.payload.size() << " -> verified"
              << (retried ? " after retransmission" : "") << "\n";
        emit(SegmentStatus{ p.seq, total, file_size,
                            retried ? SegmentOutcome::Retry : SegmentOutcome::Success,
                            attempts, p.error_simulated,
                            retried ? "Retransmission successful" : "Segment received successfully" });

        ++expected;
        attempts = 0;
    } else if (expected > 0 && p.seq == expected - 1) {
        // Sender gave up waiting before our ACK arrived
        send_verdict(FLG_ACK, p.seq, p.retrans_id);
        log() << "Duplicate DATA seq=" << p.seq << " -> re-ACK\n";
    } else {
        log() << "Out-of-order DATA seq=" << p.seq << " (expected " << expected
              << ") -> ignoring\n";
    }
}

void SegReceiver::reject_segment(uint32_t seq, uint16_t retrans_id, bool error_simulated,
                                 const std::string& why) {
    ++stats_.errors_detected;
    log() << "DATA seq=" << seq << ": " << why << " -> NACK\n";
    if (!send_verdict(FLG_NACK, seq, retrans_id)) return;

    emit(SegmentStatus{ seq, total, file_size, SegmentOutcome::Error, attempts, error_simulated, why });
}

bool SegReceiver::send_verdict(uint16_t type, uint32_t seq, uint16_t retrans_id) {
    if (!chan.send_frame(segx_encode(segx_make_control(type, seq, retrans_id)))) {
        send_failed = true;
        return false;
    }
    return true;
}

bool SegReceiver::complete() {
    if (!segx_reassemble(received, output) || output.size() != file_size) {
        return fail(SegxError::ProtocolViolation, expected, "Reassembled file does not match announced size",
                    false);
    }
    received.clear();

    st = TransferState::Completed;
    finish_stats();
    log() << "Received " << A.filename << ": " << output.size() << " bytes, "
          << stats_.errors_detected << " errors, " << stats_.retransmissions
          << " retransmissions, " << stats_.elapsed_ms << " ms\n";
    emit(TransferComplete{ A.filename, total, file_size, stats_ });
    return true;
}

bool SegReceiver::fail(SegxError code, uint32_t seq, const std::string& msg, bool notify_peer) {
    if (notify_peer && !chan.send_frame(segx_encode(segx_make_reason(FLG_ABORT, code, seq, msg)))) {
        log() << "  could not deliver abort to sender\n";
    }

    // Partial data never leaves the session
    received.clear();
    received.shrink_to_fit();
    output.clear();

    st = TransferState::Aborted;
    result = TransferOutcome{ code, seq, msg };
    finish_stats();

    log() << "Transfer of " << (A.filename.empty() ? "<none>" : A.filename) << " failed ("
          << segx_error_name(code) << "): " << msg << "\n";
    emit(TransferFailed{ A.filename, code, seq, msg, stats_ });
    return false;
}

void SegReceiver::emit(const TransferEvent& ev) {
    publish();
    if (sink) sink(ev);
}

void SegReceiver::publish() {
    std::lock_guard<std::mutex> lock(mu);
    published_stats = stats_;
    published_result = result;
}

void SegReceiver::finish_stats() {
    if (start_ms != 0) stats_.elapsed_ms = static_cast<uint32_t>(segx_now_ms() - start_ms);
}
