#pragma once
#include <pumpevents/core/events/decoded_event.hpp>
#include <pumpevents/core/events/event_registry.hpp>
#include <pumpevents/core/frame/frame.hpp>
#include <pumpevents/core/pipeline/rejected_frame_log.hpp>
#include <pumpevents/core/time/timestamp_resolver.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PumpEvents {

enum struct FrameErrorPolicy {
    SKIP,    // log, record in the rejected list, continue with the next frame
    ABORT,   // rethrow the first FrameDecodeError
};

enum struct TrailingBytesPolicy {
    DROP,    // warn and ignore a trailing partial frame
    REJECT,  // throw TruncatedFrameError before decoding anything
};

struct DecodeOptions {
    FrameErrorPolicy on_frame_error = FrameErrorPolicy::SKIP;
    TrailingBytesPolicy on_trailing_bytes = TrailingBytesPolicy::DROP;
};

struct DecodeResult {
    std::vector<DecodedEvent> events;
    std::vector<RejectedFrame> rejected;
    size_t frame_count = 0;
    size_t trailing_bytes = 0;
};

/**
 * @class DecodedEventStream
 * @brief Lazy, restartable sequence of decoded events in frame order.
 *
 * Owns the decoded bytes; each increment of an iterator decodes the next
 * frame. Starting a new begin() decodes again from the first frame and
 * yields the same events. The optional RejectedFrameLog is not owned and
 * must outlive the stream; each skipped frame is pushed to it (and logged)
 * once per stream, however many passes are made. Copies of a stream share
 * that record.
 */
class DecodedEventStream {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = DecodedEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const DecodedEvent*;
        using reference = const DecodedEvent&;

        Iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        Iterator& operator++();

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        friend bool operator==(const Iterator& a, const Iterator& b) {
            return a.stream_ == b.stream_ && (a.stream_ == nullptr || a.next_ == b.next_);
        }
        friend bool operator!=(const Iterator& a, const Iterator& b) { return !(a == b); }

    private:
        friend class DecodedEventStream;
        explicit Iterator(const DecodedEventStream* stream);

        const DecodedEventStream* stream_ = nullptr;   // nullptr once exhausted
        size_t next_ = 0;                              // next frame to decode
        std::optional<DecodedEvent> current_;
    };

    Iterator begin() const { return Iterator(this); }
    Iterator end() const { return Iterator(); }

    /**
     * @brief Decode every frame eagerly
     * @throws FrameDecodeError under the abort policy
     */
    DecodeResult collect() const;

    size_t frameCount() const { return bytes_->size() / FRAME_SIZE; }
    size_t trailingBytes() const { return bytes_->size() % FRAME_SIZE; }
    const std::vector<uint8_t>& bytes() const { return *bytes_; }

private:
    friend class EventDecodePipeline;

    DecodedEventStream(std::shared_ptr<const std::vector<uint8_t>> bytes,
                       EventRegistryPtr registry,
                       TimestampResolver resolver,
                       DecodeOptions options,
                       RejectedFrameLog* rejectedLog);

    /// Decode one complete frame; throws FrameDecodeError subclasses
    DecodedEvent decodeFrame(const RawFrame& frame) const;

    /**
     * Decode forward from index until a frame succeeds. index is left one
     * past the returned frame; nullopt means no frames remain. Rejections
     * are logged and appended to sink when it is non-null.
     */
    std::optional<DecodedEvent> advance(size_t& index, std::vector<RejectedFrame>* sink) const;

    /// True for the first pass to reject frameIndex; later passes stay quiet
    bool firstRejection(size_t frameIndex) const;

    std::shared_ptr<const std::vector<uint8_t>> bytes_;
    EventRegistryPtr registry_;
    TimestampResolver resolver_;
    DecodeOptions options_;
    RejectedFrameLog* rejected_log_;   // Non-owned, may be null
    // Frames below this index have already been reported; shared by copies
    std::shared_ptr<std::atomic<size_t>> reported_through_;
};

/**
 * @class EventDecodePipeline
 * @brief base64 blob (or raw bytes) -> ordered sequence of typed events.
 *
 * Stages: base64 decode -> FrameSplitter -> HeaderCodec -> TimestampResolver
 * -> EventRegistry lookup -> PayloadDecoder. Holds no mutable state of its
 * own, so one instance may serve several threads.
 */
class EventDecodePipeline {
public:
    EventDecodePipeline(EventRegistryPtr registry, TimestampResolver resolver,
                        DecodeOptions options = {});

    /**
     * @throws InvalidEncodingError if text is not valid base64
     * @throws TruncatedFrameError under TrailingBytesPolicy::REJECT
     */
    DecodedEventStream decode(const std::string& base64Text) const;

    /**
     * @brief Same as decode() for bytes that are already base64-decoded
     * (blobs re-read from the blob store)
     */
    DecodedEventStream decodeBytes(std::vector<uint8_t> bytes) const;

    DecodeResult decodeAll(const std::string& base64Text) const {
        return decode(base64Text).collect();
    }

    void setRejectedFrameLog(RejectedFrameLog* log) { rejected_log_ = log; }

    const EventRegistry& registry() const { return *registry_; }
    const TimestampResolver& resolver() const { return resolver_; }
    const DecodeOptions& options() const { return options_; }

private:
    EventRegistryPtr registry_;
    TimestampResolver resolver_;
    DecodeOptions options_;
    RejectedFrameLog* rejected_log_ = nullptr;
};

} // namespace PumpEvents
