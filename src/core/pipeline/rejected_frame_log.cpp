#include <pumpevents/core/pipeline/rejected_frame_log.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace PumpEvents {

const char* toString(RejectReason reason) {
    switch (reason) {
        case RejectReason::MALFORMED_HEADER:   return "malformed_header";
        case RejectReason::UNKNOWN_EVENT_TYPE: return "unknown_event_type";
        case RejectReason::MALFORMED_PAYLOAD:  return "malformed_payload";
    }
    return "unknown";
}

RejectedFrameLog::RejectedFrameLog(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {
    spdlog::debug("[RejectedFrameLog] Initialized (max stored: {})", capacity_);
}

void RejectedFrameLog::push(const RejectedFrame& frame) {
    total_rejected_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    // Ring buffer: remove oldest if at capacity
    if (stored_.size() >= capacity_) {
        stored_.pop_front();
    }
    stored_.push_back(frame);
}

std::vector<RejectedFrame> RejectedFrameLog::getRecent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<RejectedFrame> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

void RejectedFrameLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.clear();
    spdlog::info("[RejectedFrameLog] Buffer cleared (total rejected remains: {})",
                 total_rejected_.load(std::memory_order_relaxed));
}

} // namespace PumpEvents
