#include "segx_events.h"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace {

const char* outcome_name(SegmentOutcome o) {
    switch (o) {
    case SegmentOutcome::Success: return "success";
    case SegmentOutcome::Error:   return "error";
    case SegmentOutcome::Retry:   return "retry";
    }
    return "unknown";
}

void put_stats(std::ostringstream& os, const TransferStats& st) {
    os << "sent=" << st.segments_sent
       << " errors=" << st.errors_detected
       << " retransmissions=" << st.retransmissions
       << " timeouts=" << st.timeouts
       << " elapsed=" << st.elapsed_ms << " ms"
       << " rate=" << std::fixed << std::setprecision(1) << st.rate_kibps() << " KiB/s";
}

} // namespace

const char* segx_state_name(TransferState s) {
    switch (s) {
    case TransferState::Idle:             return "Idle";
    case TransferState::AwaitingRequest:  return "AwaitingRequest";
    case TransferState::Fragmenting:      return "Fragmenting";
    case TransferState::SendingSegment:   return "SendingSegment";
    case TransferState::AwaitingAck:      return "AwaitingAck";
    case TransferState::SegmentAcked:     return "SegmentAcked";
    case TransferState::SegmentNacked:    return "SegmentNacked";
    case TransferState::ReceivingSegment: return "ReceivingSegment";
    case TransferState::Completed:        return "Completed";
    case TransferState::Aborted:          return "Aborted";
    }
    return "Unknown";
}

std::string segx_describe(const TransferEvent& ev) {
    std::ostringstream os;
    std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TransferStart>) {
            os << "Transfer started: " << e.filename << " (" << e.file_size
               << " bytes, " << e.total_segments << " segments)";
        } else if constexpr (std::is_same_v<T, SegmentStatus>) {
            os << "Segment " << (e.segment + 1) << "/" << e.total_segments
               << ": " << outcome_name(e.status) << " - " << e.message
               << " (attempt " << e.attempt
               << ", error simulated: " << (e.error_simulated ? "yes" : "no") << ")";
        } else if constexpr (std::is_same_v<T, TransferComplete>) {
            os << "Transfer complete: " << e.filename << " (" << e.file_size << " bytes) ";
            put_stats(os, e.stats);
        } else if constexpr (std::is_same_v<T, TransferFailed>) {
            os << "Transfer failed: " << e.filename << " [" << segx_error_name(e.error)
               << " at segment " << e.segment << "] " << e.message << " ";
            put_stats(os, e.stats);
        }
    }, ev);
    return os.str();
}
