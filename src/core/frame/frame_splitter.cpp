#include <pumpevents/core/frame/frame_splitter.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace PumpEvents {

RawFrame FrameSplitter::frameAt(size_t i) const {
    if (i >= frameCount())
        throw std::out_of_range("Frame index " + std::to_string(i) + " past last complete frame");

    RawFrame frame;
    const uint8_t* start = data_ + i * FRAME_SIZE;
    std::copy(start, start + FRAME_SIZE, frame.begin());
    return frame;
}

} // namespace PumpEvents
