#pragma once
#include <pumpevents/core/pipeline/decode_pipeline.hpp>
#include <cstddef>
#include <string>

namespace AppConfig {

struct DecoderConfig {
    std::string timezone;
    std::string catalog;
    PumpEvents::DecodeOptions options;
    size_t rejected_frame_capacity = PumpEvents::RejectedFrameLog::DEFAULT_CAPACITY;
};

struct LoggingConfig {
    std::string level = "info";
};

struct StorageConfig {
    std::string path;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    DecoderConfig decoder;
    LoggingConfig logging;
    StorageConfig storage;
};

} // namespace AppConfig
