#include "SegSender.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <utility>

using Clock = std::chrono::steady_clock;

namespace {

constexpr int kPollSliceMs = 100;  // upper bound on how late abort() is noticed

int ms_left(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool valid_name(const std::string& name) {
    if (name.find('/') != std::string::npos) return false;
    if (name.find('\0') != std::string::npos) return false;
    return name != "." && name != "..";
}

} // namespace

SegSender::SegSender(const SegSenderArgs& args, SegxChannel& channel, EventSink s, FileSource src)
    : A(args), chan(channel), sink(std::move(s)), source(std::move(src)) {
    if (A.segment_size == 0 || A.segment_size > 0xFFFF) {
        throw std::invalid_argument("SegSender: segment_size must be within 1..65535");
    }
    if (A.max_retries < 1 || A.max_retries > 0xFFFF) {
        throw std::invalid_argument("SegSender: max_retries must be within 1..65535");
    }
}

void SegSender::abort() {
    cancelled.store(true);
}

TransferStats SegSender::stats() const {
    std::lock_guard<std::mutex> lock(mu);
    return published_stats;
}

TransferOutcome SegSender::outcome() const {
    std::lock_guard<std::mutex> lock(mu);
    return published_result;
}

std::ostream& SegSender::log() {
    if (!A.tag.empty()) std::cerr << "[" << A.tag << "] ";
    return std::cerr;
}

bool SegSender::run() {
    st = TransferState::AwaitingRequest;

    std::string name;
    double error_prob = kDefaultErrorProbability;
    if (!await_request(name, error_prob)) return false;

    log() << "Requested file: " << name << " (error probability " << error_prob << ")\n";
    if (A.force_error_prob) error_prob = *A.force_error_prob;

    std::vector<uint8_t> file;
    SegxError e = load_file(name, file);
    if (e != SegxError::None) {
        return reject(e, e == SegxError::FileNotFound ? "File not found: " + name
                                                      : "Cannot read file: " + name);
    }

    if (file.size() <= A.min_file_size) {
        return reject(SegxError::FileTooSmall,
                      "File is too small (must be > " + std::to_string(A.min_file_size) + " bytes)");
    }

    return transfer(name, file, error_prob);
}

bool SegSender::transfer(const std::string& name, const std::vector<uint8_t>& file, double error_prob) {
    filename = name;
    file_size = file.size();

    if (!(error_prob >= 0.0 && error_prob <= 1.0)) {
        return reject(SegxError::InvalidRequest, "Error probability must be within [0, 1]");
    }

    st = TransferState::Fragmenting;
    segments = segx_fragment(file, A.segment_size);
    total = static_cast<uint32_t>(segments.size());
    log() << "File " << name << " (" << file_size << " bytes) split into "
          << total << " segments\n";

    stats_ = TransferStats{};
    start_ms = segx_now_ms();

    std::mt19937 rng(A.seed ? *A.seed : std::random_device{}());
    ErrorInjector inj(error_prob, std::move(rng));

    SegxPacket info = segx_make_info(total, file_size, static_cast<uint16_t>(A.segment_size));
    if (!chan.send_frame(segx_encode(info))) {
        return fail(SegxError::ConnectionLost, 0, "Failed to send transfer info", false);
    }
    if (!await_ready()) return false;

    emit(TransferStart{ filename, total, file_size });

    for (const auto& seg : segments) {
        uint16_t attempt = 0;

        while (true) {
            if (cancelled) return fail(SegxError::Cancelled, seg.seq, "Transfer cancelled", true);

            ++attempt;
            if (!send_segment(seg, inj, attempt)) {
                return fail(SegxError::ConnectionLost, seg.seq,
                            "Failed to send segment " + std::to_string(seg.seq), false);
            }

            st = TransferState::AwaitingAck;
            Verdict v = wait_verdict(seg.seq, attempt);

            if (v == Verdict::Ack) {
                st = TransferState::SegmentAcked;
                ++stats_.segments_delivered;
                stats_.bytes += seg.data.size();
                emit(SegmentStatus{ seg.seq, total, file_size, SegmentOutcome::Success, attempt, false,
                                    attempt > 1 ? "Retransmission acknowledged" : "Segment acknowledged" });
                break;
            }
            if (v == Verdict::Cancelled) {
                return fail(SegxError::Cancelled, seg.seq, "Transfer cancelled", true);
            }
            if (v == Verdict::PeerAbort) {
                return fail(SegxError::PeerAborted, seg.seq,
                            std::string("Receiver aborted (") + segx_error_name(peer_code) + "): " + peer_msg,
                            false);
            }
            if (v == Verdict::Lost) {
                return fail(SegxError::ConnectionLost, seg.seq, "Connection lost", false);
            }

            st = TransferState::SegmentNacked;
            if (v == Verdict::Nack) {
                ++stats_.errors_detected;
                log() << "  NACK for seq=" << seg.seq << "\n";
            } else {
                ++stats_.timeouts;
                log() << "  timeout waiting verdict for seq=" << seg.seq << "\n";
            }

            if (attempt >= A.max_retries) {
                return fail(SegxError::RetryBudgetExceeded, seg.seq,
                            "Segment " + std::to_string(seg.seq) + " not delivered after " +
                            std::to_string(attempt) + " attempts",
                            true);
            }

            ++stats_.retransmissions;
            emit(SegmentStatus{ seg.seq, total, file_size, SegmentOutcome::Retry, attempt, last_simulated,
                                v == Verdict::Nack ? "Checksum rejected by receiver, retransmitting"
                                                   : "No verdict before timeout, retransmitting" });
        }
    }

    segments.clear();
    st = TransferState::Completed;
    finish_stats();

    log() << "Transfer of " << filename << " complete: " << total << " segments, "
          << stats_.errors_detected << " errors, " << stats_.retransmissions
          << " retransmissions, " << stats_.elapsed_ms << " ms\n";
    emit(TransferComplete{ filename, total, file_size, stats_ });
    return true;
}

bool SegSender::await_request(std::string& name, double& error_prob) {
    auto deadline = Clock::now() + std::chrono::milliseconds(A.request_timeout_ms);

    while (true) {
        if (cancelled) return fail(SegxError::Cancelled, 0, "Cancelled before request", false);

        int left = ms_left(deadline);
        if (left == 0) return fail(SegxError::Timeout, 0, "No request received", false);

        SegxPacket p;
        bool malformed = false;
        RecvStatus rs = recv_packet(p, std::min(left, kPollSliceMs), malformed);
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Closed) {
            return fail(SegxError::ConnectionLost, 0, "Connection closed before request", false);
        }

        if (malformed) return reject(SegxError::InvalidRequest, "Malformed request");
        if (p.type == FLG_ABORT) {
            return fail(SegxError::PeerAborted, 0, "Receiver aborted before request", false);
        }
        if (p.type != FLG_REQ) {
            log() << "Ignoring frame type 0x" << std::hex << p.type << std::dec << " before request\n";
            continue;
        }

        if (!segx_parse_request(p, name, error_prob)) {
            return reject(SegxError::InvalidRequest, "Invalid request");
        }
        filename = name;
        if (name.empty()) return reject(SegxError::EmptyFilename, "Empty filename");
        if (!valid_name(name)) return reject(SegxError::InvalidRequest, "Invalid filename: " + name);
        return true;
    }
}

bool SegSender::await_ready() {
    auto deadline = Clock::now() + std::chrono::milliseconds(A.request_timeout_ms);

    while (true) {
        if (cancelled) return fail(SegxError::Cancelled, 0, "Transfer cancelled", true);

        int left = ms_left(deadline);
        if (left == 0) return fail(SegxError::Timeout, 0, "Receiver did not accept transfer info", true);

        SegxPacket p;
        bool malformed = false;
        RecvStatus rs = recv_packet(p, std::min(left, kPollSliceMs), malformed);
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Closed) {
            return fail(SegxError::ConnectionLost, 0, "Connection closed before transfer", false);
        }
        if (malformed) continue;

        if (p.type == FLG_READY) return true;
        if (p.type == FLG_ABORT) {
            segx_parse_reason(p, peer_code, peer_msg);
            return fail(SegxError::PeerAborted, 0, "Receiver refused transfer: " + peer_msg, false);
        }
    }
}

bool SegSender::send_segment(const SegxSegment& seg, ErrorInjector& inj, uint16_t attempt) {
    st = TransferState::SendingSegment;

    // Checksum covers the uncorrupted payload
    bool simulated = false;
    std::vector<uint8_t> wire = inj.maybe_corrupt(seg.data, &simulated);
    uint16_t sum = segx_checksum16(seg.data);

    if (!chan.send_frame(segx_encode_data(seg.seq, wire, sum, simulated, attempt))) return false;
    ++stats_.segments_sent;
    last_simulated = simulated;

    log() << "DATA seq=" << seg.seq << "/" << total << " len=" << wire.size()
          << " (try " << attempt << (simulated ? ", corrupted" : "") << ")\n";
    return true;
}

SegSender::Verdict SegSender::wait_verdict(uint32_t seq, uint16_t attempt) {
    auto deadline = Clock::now() + std::chrono::milliseconds(A.ack_timeout_ms);

    while (true) {
        if (cancelled) return Verdict::Cancelled;

        int left = ms_left(deadline);
        if (left == 0) return Verdict::Timeout;

        SegxPacket p;
        bool malformed = false;
        RecvStatus rs = recv_packet(p, std::min(left, kPollSliceMs), malformed);
        if (rs == RecvStatus::Timeout) continue;
        if (rs == RecvStatus::Closed) return Verdict::Lost;
        if (malformed) {
            log() << "  malformed frame while waiting for verdict on seq=" << seq << "\n";
            continue;
        }

        if (p.type == FLG_ABORT) {
            segx_parse_reason(p, peer_code, peer_msg);
            return Verdict::PeerAbort;
        }
        if (p.type != FLG_ACK && p.type != FLG_NACK) continue;
        if (p.seq != seq || p.retrans_id != attempt) {
            // Late verdict for an earlier attempt, or one that names no attempt
            log() << "  stale verdict for seq=" << p.seq << " retrans_id=" << p.retrans_id
                  << " (waiting " << seq << "/" << attempt << ")\n";
            continue;
        }
        return p.type == FLG_ACK ? Verdict::Ack : Verdict::Nack;
    }
}

RecvStatus SegSender::recv_packet(SegxPacket& out, int timeout_ms, bool& malformed) {
    std::vector<uint8_t> frame;
    RecvStatus rs = chan.recv_frame(frame, timeout_ms);
    if (rs == RecvStatus::Ok) malformed = segx_decode(frame, out, A.segment_size) != SegxError::None;
    return rs;
}

SegxError SegSender::load_file(const std::string& name, std::vector<uint8_t>& out) {
    if (source) return source(name, out);

    std::string path = A.root.empty() ? name : A.root + "/" + name;
    std::ifstream f(path, std::ios::binary);
    if (!f) return SegxError::FileNotFound;

    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad()) {
        log() << "Read error on " << path << "\n";
        return SegxError::FileNotFound;
    }
    return SegxError::None;
}

bool SegSender::reject(SegxError code, const std::string& msg) {
    log() << "Rejecting request (" << segx_error_name(code) << "): " << msg << "\n";
    if (!chan.send_frame(segx_encode(segx_make_reason(FLG_ERROR, code, 0, msg)))) {
        log() << "  could not deliver error to receiver\n";
    }
    return fail(code, 0, msg, false);
}

bool SegSender::fail(SegxError code, uint32_t seq, const std::string& msg, bool notify_peer) {
    if (notify_peer && !chan.send_frame(segx_encode(segx_make_reason(FLG_ABORT, code, seq, msg)))) {
        log() << "  could not deliver abort to receiver\n";
    }

    segments.clear();
    segments.shrink_to_fit();

    st = TransferState::Aborted;
    result = TransferOutcome{ code, seq, msg };
    finish_stats();

    log() << "Transfer of " << (filename.empty() ? "<none>" : filename) << " aborted ("
          << segx_error_name(code) << "): " << msg << "\n";
    emit(TransferFailed{ filename, code, seq, msg, stats_ });
    return false;
}

void SegSender::emit(const TransferEvent& ev) {
    publish();
    if (sink) sink(ev);
}

void SegSender::publish() {
    std::lock_guard<std::mutex> lock(mu);
    published_stats = stats_;
    published_result = result;
}

void SegSender::finish_stats() {
    if (start_ms != 0) stats_.elapsed_ms = static_cast<uint32_t>(segx_now_ms() - start_ms);
}
