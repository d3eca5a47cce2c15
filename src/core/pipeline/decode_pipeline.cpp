#include <pumpevents/core/pipeline/decode_pipeline.hpp>
#include <pumpevents/core/codec/base64.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <pumpevents/core/frame/frame_splitter.hpp>
#include <pumpevents/core/frame/header_codec.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace PumpEvents {

// ============================================================================
// DecodedEventStream
// ============================================================================

DecodedEventStream::Iterator::Iterator(const DecodedEventStream* stream) : stream_(stream) {
    current_ = stream_->advance(next_, nullptr);
    if (!current_) stream_ = nullptr;
}

DecodedEventStream::Iterator& DecodedEventStream::Iterator::operator++() {
    if (stream_ == nullptr) return *this;
    current_ = stream_->advance(next_, nullptr);
    if (!current_) stream_ = nullptr;
    return *this;
}

DecodedEventStream::DecodedEventStream(std::shared_ptr<const std::vector<uint8_t>> bytes,
                                       EventRegistryPtr registry,
                                       TimestampResolver resolver,
                                       DecodeOptions options,
                                       RejectedFrameLog* rejectedLog)
    : bytes_(std::move(bytes)),
      registry_(std::move(registry)),
      resolver_(std::move(resolver)),
      options_(options),
      rejected_log_(rejectedLog),
      reported_through_(std::make_shared<std::atomic<size_t>>(0)) {}

bool DecodedEventStream::firstRejection(size_t frameIndex) const {
    // Passes scan frames in order, so any pass past frameIndex has seen it
    size_t mark = reported_through_->load(std::memory_order_relaxed);
    while (frameIndex >= mark) {
        if (reported_through_->compare_exchange_weak(mark, frameIndex + 1, std::memory_order_relaxed))
            return true;
    }
    return false;
}

DecodedEvent DecodedEventStream::decodeFrame(const RawFrame& frame) const {
    FrameHeader header = decodeHeader(frame);
    const PayloadDecoder& decoder = registry_->lookup(header.type_id);

    DecodedEvent event = decoder.decode(frame.data() + HEADER_SIZE, frame.size() - HEADER_SIZE,
                                        header, resolver_.resolve(header.raw_timestamp));
    commonOf(event).raw = frame;
    return event;
}

std::optional<DecodedEvent> DecodedEventStream::advance(size_t& index,
                                                        std::vector<RejectedFrame>* sink) const {
    FrameSplitter splitter(*bytes_);

    while (index < splitter.frameCount()) {
        const size_t current = index++;
        RawFrame frame = splitter.frameAt(current);

        RejectedFrame rejected;
        try {
            return decodeFrame(frame);
        } catch (const MalformedHeaderError& e) {
            if (options_.on_frame_error == FrameErrorPolicy::ABORT) throw;
            rejected.reason = RejectReason::MALFORMED_HEADER;
            rejected.message = e.what();
        } catch (const UnknownEventTypeError& e) {
            if (options_.on_frame_error == FrameErrorPolicy::ABORT) throw;
            rejected.reason = RejectReason::UNKNOWN_EVENT_TYPE;
            rejected.message = e.what();
        } catch (const MalformedPayloadError& e) {
            if (options_.on_frame_error == FrameErrorPolicy::ABORT) throw;
            rejected.reason = RejectReason::MALFORMED_PAYLOAD;
            rejected.message = e.what();
        }

        // A frame is always complete here, so the header can be read for context
        FrameHeader header = decodeHeader(frame);
        rejected.frame_index = current;
        rejected.type_id = header.type_id;
        rejected.sequence_number = header.sequence_number;
        rejected.raw = frame;

        if (firstRejection(current)) {
            spdlog::warn("[Pipeline] Skipping frame {} (type={} seq={}): {}",
                         current, rejected.type_id, rejected.sequence_number, rejected.message);
            if (rejected_log_) rejected_log_->push(rejected);
        }
        if (sink) sink->push_back(std::move(rejected));
    }
    return std::nullopt;
}

DecodeResult DecodedEventStream::collect() const {
    DecodeResult result;
    result.frame_count = frameCount();
    result.trailing_bytes = trailingBytes();
    result.events.reserve(result.frame_count);

    size_t index = 0;
    while (auto event = advance(index, &result.rejected)) {
        result.events.push_back(std::move(*event));
    }

    spdlog::debug("[Pipeline] Decoded {} of {} frames ({} rejected)",
                  result.events.size(), result.frame_count, result.rejected.size());
    return result;
}

// ============================================================================
// EventDecodePipeline
// ============================================================================

EventDecodePipeline::EventDecodePipeline(EventRegistryPtr registry, TimestampResolver resolver,
                                         DecodeOptions options)
    : registry_(std::move(registry)), resolver_(std::move(resolver)), options_(options) {
    if (!registry_)
        throw std::invalid_argument("EventDecodePipeline requires an event registry");
}

DecodedEventStream EventDecodePipeline::decode(const std::string& base64Text) const {
    return decodeBytes(Base64::decode(base64Text));
}

DecodedEventStream EventDecodePipeline::decodeBytes(std::vector<uint8_t> bytes) const {
    const size_t trailing = bytes.size() % FRAME_SIZE;
    if (trailing != 0) {
        if (options_.on_trailing_bytes == TrailingBytesPolicy::REJECT)
            throw TruncatedFrameError(bytes.size(), trailing);
        spdlog::warn("[Pipeline] Dropping {} trailing bytes after {} complete frames",
                     trailing, bytes.size() / FRAME_SIZE);
    }

    auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    return DecodedEventStream(std::move(shared), registry_, resolver_, options_, rejected_log_);
}

} // namespace PumpEvents
