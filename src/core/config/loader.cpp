#include <pumpevents/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <absl/time/time.h>
#include <cstdlib>
#include <stdexcept>

using namespace AppConfig;

namespace {

template <typename T>
T readRequired(const YAML::Node& parent, const char* key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node)
        throw std::runtime_error("Missing required config field: " + path);
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Invalid type for config field: " + path);
    }
}

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const std::string& path, T fallback) {
    if (!parent || !parent[key]) return fallback;
    return readRequired<T>(parent, key, path);
}

bool validZoneName(const std::string& zone) {
    if (zone.empty()) return false;
    for (char c : zone) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                  c == '/' || c == '_' || c == '-' || c == '+';
        if (!ok) return false;
    }
    return zone.front() != '/' && zone.find("..") == std::string::npos;
}

bool validLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // anonymous namespace

AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    // Lookups on a const node never insert missing keys
    const YAML::Node& cfg = root;

    AppConfiguration config;
    config.app_name = readRequired<std::string>(cfg, "app_name", "app_name");
    config.version = readRequired<std::string>(cfg, "version", "version");

    const YAML::Node decoder = cfg["decoder"];
    if (!decoder || !decoder.IsMap())
        throw std::runtime_error("Missing required config section: decoder");

    config.decoder.timezone = readRequired<std::string>(decoder, "timezone", "decoder.timezone");
    config.decoder.catalog = readRequired<std::string>(decoder, "catalog", "decoder.catalog");

    const std::string onFrameError =
        readOptional<std::string>(decoder, "on_frame_error", "decoder.on_frame_error", "skip");
    if (onFrameError == "skip")
        config.decoder.options.on_frame_error = PumpEvents::FrameErrorPolicy::SKIP;
    else if (onFrameError == "abort")
        config.decoder.options.on_frame_error = PumpEvents::FrameErrorPolicy::ABORT;
    else
        throw std::runtime_error("decoder.on_frame_error must be 'skip' or 'abort', got: " + onFrameError);

    const std::string onTrailing =
        readOptional<std::string>(decoder, "on_trailing_bytes", "decoder.on_trailing_bytes", "drop");
    if (onTrailing == "drop")
        config.decoder.options.on_trailing_bytes = PumpEvents::TrailingBytesPolicy::DROP;
    else if (onTrailing == "reject")
        config.decoder.options.on_trailing_bytes = PumpEvents::TrailingBytesPolicy::REJECT;
    else
        throw std::runtime_error("decoder.on_trailing_bytes must be 'drop' or 'reject', got: " + onTrailing);

    const int capacity = readOptional<int>(decoder, "rejected_frame_capacity",
                                           "decoder.rejected_frame_capacity",
                                           static_cast<int>(PumpEvents::RejectedFrameLog::DEFAULT_CAPACITY));
    if (capacity <= 0)
        throw std::runtime_error("decoder.rejected_frame_capacity must be greater than 0");
    config.decoder.rejected_frame_capacity = static_cast<size_t>(capacity);

    config.logging.level = readOptional<std::string>(cfg["logging"], "level", "logging.level", "info");
    if (!validLogLevel(config.logging.level))
        throw std::runtime_error("Invalid logging.level: " + config.logging.level);

    config.storage.path = readOptional<std::string>(cfg["storage"], "path", "storage.path",
                                                    "data/raw_blobs.bin");

    // The pump records local wall time; the zone comes from the environment when set
    if (const char* envZone = std::getenv(TIMEZONE_ENV_VAR)) {
        if (*envZone != '\0') {
            spdlog::info("Timezone overridden by {}: {}", TIMEZONE_ENV_VAR, envZone);
            config.decoder.timezone = envZone;
        }
    }

    if (!validZoneName(config.decoder.timezone))
        throw std::runtime_error("Invalid timezone identifier: " + config.decoder.timezone);

    absl::TimeZone tz;
    if (!absl::LoadTimeZone(config.decoder.timezone, &tz))
        throw std::runtime_error("Timezone not found in the zone database: " + config.decoder.timezone);

    return config;
}
