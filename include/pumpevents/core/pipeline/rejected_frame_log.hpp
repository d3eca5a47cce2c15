#pragma once

#include <pumpevents/core/frame/frame.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace PumpEvents {

enum struct RejectReason {
    MALFORMED_HEADER,
    UNKNOWN_EVENT_TYPE,
    MALFORMED_PAYLOAD,
};

const char* toString(RejectReason reason);

struct RejectedFrame {
    size_t frame_index = 0;        // position of the frame within its blob
    RejectReason reason = RejectReason::UNKNOWN_EVENT_TYPE;
    uint16_t type_id = 0;          // 0 when the header itself was unreadable
    uint32_t sequence_number = 0;
    std::string message;
    RawFrame raw{};
};

/**
 * @class RejectedFrameLog
 * @brief Record of frames the decode pipeline skipped.
 *
 * Frames land here when the skip policy is active and a single frame fails
 * (unknown type id, malformed header or payload). Features:
 * - Tracks total rejected count (atomic)
 * - Stores recent N frames for inspection (ring buffer)
 * - Thread-safe push, so one log can be shared by concurrent decodes
 */
class RejectedFrameLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit RejectedFrameLog(size_t capacity = DEFAULT_CAPACITY);
    ~RejectedFrameLog() = default;

    void push(const RejectedFrame& frame);

    /**
     * @brief Total frames ever rejected (cumulative, survives clear())
     */
    size_t totalRejected() const {
        return total_rejected_.load(std::memory_order_relaxed);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_.size();
    }

    size_t capacity() const { return capacity_; }

    /**
     * @brief Recently rejected frames, newest first
     */
    std::vector<RejectedFrame> getRecent(size_t max_count = 100) const;

    void clear();

private:
    const size_t capacity_;
    std::atomic<size_t> total_rejected_{0};
    mutable std::mutex mutex_;
    std::deque<RejectedFrame> stored_;
};

} // namespace PumpEvents
