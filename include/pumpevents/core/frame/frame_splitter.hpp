#pragma once
#include <pumpevents/core/frame/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace PumpEvents {

/**
 * @class FrameSplitter
 * @brief Non-owning view that slices a byte buffer into fixed-size frames.
 *
 * Frames are produced lazily, in input order, without overlap. A trailing
 * chunk shorter than FRAME_SIZE is never yielded; its length is reported by
 * trailingBytes() so the caller can decide whether to drop or reject it.
 * Iterating twice over the same buffer yields the same frames.
 *
 * The buffer must outlive the splitter and its iterators.
 */
class FrameSplitter {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = RawFrame;
        using difference_type = std::ptrdiff_t;
        using pointer = const RawFrame*;
        using reference = const RawFrame&;

        Iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        Iterator& operator++() {
            ++index_;
            load();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        size_t index() const { return index_; }

        friend bool operator==(const Iterator& a, const Iterator& b) {
            return a.splitter_ == b.splitter_ && a.index_ == b.index_;
        }
        friend bool operator!=(const Iterator& a, const Iterator& b) { return !(a == b); }

    private:
        friend class FrameSplitter;
        Iterator(const FrameSplitter* splitter, size_t index) : splitter_(splitter), index_(index) {
            load();
        }

        void load() {
            if (splitter_ && index_ < splitter_->frameCount())
                current_ = splitter_->frameAt(index_);
        }

        const FrameSplitter* splitter_ = nullptr;
        size_t index_ = 0;
        RawFrame current_{};
    };

    FrameSplitter(const uint8_t* data, size_t len) : data_(data), len_(data ? len : 0) {}
    explicit FrameSplitter(const std::vector<uint8_t>& buffer)
        : FrameSplitter(buffer.data(), buffer.size()) {}

    size_t frameCount() const { return len_ / FRAME_SIZE; }
    size_t trailingBytes() const { return len_ % FRAME_SIZE; }
    size_t bufferSize() const { return len_; }

    /**
     * @brief Copy out frame i
     * @throws std::out_of_range if i >= frameCount()
     */
    RawFrame frameAt(size_t i) const;

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, frameCount()); }

private:
    const uint8_t* data_;
    size_t len_;
};

} // namespace PumpEvents
