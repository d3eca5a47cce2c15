#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <pumpevents/core/codec/base64.hpp>
#include <pumpevents/core/config/loader.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <pumpevents/core/events/event_catalog.hpp>
#include <pumpevents/core/events/event_registry.hpp>
#include <pumpevents/core/pipeline/decode_pipeline.hpp>
#include <pumpevents/core/pipeline/rejected_frame_log.hpp>
#include <pumpevents/core/storage/raw_blob_store.hpp>

using namespace PumpEvents;

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const std::string& level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <config.yaml> <command> [file]\n"
              << "Commands:\n"
              << "  decode-base64 <file>  decode a base64 event blob (API response body)\n"
              << "  decode-raw <file>     decode an already base64-decoded blob\n"
              << "  store <file>          append a base64 blob to the blob store, then decode it\n"
              << "  replay                re-decode every blob in the blob store\n";
}

static std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw std::runtime_error("Cannot open input file: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// The vendor returns the blob as a JSON string literal; accept it verbatim
static std::string stripJsonQuotes(std::string text) {
    size_t a = text.find_first_not_of(" \t\r\n");
    size_t b = text.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    text = text.substr(a, b - a + 1);
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
        text = text.substr(1, text.size() - 2);
    return text;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    std::unique_ptr<RejectedFrameLog> rejectedLog;
    std::unique_ptr<EventDecodePipeline> pipeline;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    auto schemas = EventCatalogLoader::loadFile(config.decoder.catalog);
    auto registry = std::make_shared<const EventRegistry>(schemas);
    spdlog::info("Registered event ids: {}", registry->eventIdsQuery());

    c.rejectedLog = std::make_unique<RejectedFrameLog>(config.decoder.rejected_frame_capacity);
    c.pipeline = std::make_unique<EventDecodePipeline>(
        registry, TimestampResolver(config.decoder.timezone), config.decoder.options);
    c.pipeline->setRejectedFrameLog(c.rejectedLog.get());

    spdlog::info("Decoder ready (zone={}, on_frame_error={}, on_trailing_bytes={})",
                 config.decoder.timezone,
                 config.decoder.options.on_frame_error == FrameErrorPolicy::SKIP ? "skip" : "abort",
                 config.decoder.options.on_trailing_bytes == TrailingBytesPolicy::DROP ? "drop" : "reject");
    return c;
}

// ============================================================================
// Commands
// ============================================================================

struct Summary {
    size_t events = 0;
    std::map<std::string, size_t> perName;
};

static void emit(const DecodedEventStream& stream, Summary& summary) {
    for (const auto& event : stream) {
        std::cout << describe(event) << '\n';
        ++summary.events;
        ++summary.perName[commonOf(event).name];
    }
}

static void printSummary(const Summary& summary, const RejectedFrameLog& rejectedLog) {
    spdlog::info("=== DECODE SUMMARY ===");
    for (const auto& entry : summary.perName)
        spdlog::info("  {:<36} {}", entry.first, entry.second);
    spdlog::info("Decoded {} events, skipped {} frames", summary.events, rejectedLog.totalRejected());
}

static int run(const std::string& command, const std::vector<std::string>& args,
               const AppConfig::AppConfiguration& config, Components& c) {
    Summary summary;

    if (command == "decode-base64" && args.size() == 1) {
        emit(c.pipeline->decode(stripJsonQuotes(readFile(args[0]))), summary);
    } else if (command == "decode-raw" && args.size() == 1) {
        std::string raw = readFile(args[0]);
        emit(c.pipeline->decodeBytes(std::vector<uint8_t>(raw.begin(), raw.end())), summary);
    } else if (command == "store" && args.size() == 1) {
        std::vector<uint8_t> blob = Base64::decode(stripJsonQuotes(readFile(args[0])));
        {
            RawBlobStore store(config.storage.path);
            store.append(blob);
        }
        spdlog::info("Stored {} bytes in {}", blob.size(), config.storage.path);
        emit(c.pipeline->decodeBytes(std::move(blob)), summary);
    } else if (command == "replay" && args.empty()) {
        auto blobs = RawBlobStore::readAll(config.storage.path);
        for (auto& blob : blobs)
            emit(c.pipeline->decodeBytes(std::move(blob)), summary);
    } else {
        return -1;
    }

    printSummary(summary, *c.rejectedLog);
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("PumpEventDecoder starting, config: {}", argv[1]);

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(argv[1]);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    setupLogging(config.logging.level);
    spdlog::info("{} v{} configuration loaded", config.app_name, config.version);

    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    try {
        Components components = initializeComponents(config);
        int rc = run(command, args, config, components);
        if (rc < 0) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        return rc;
    } catch (const DecodeError& e) {
        spdlog::error("Decode failed: {}", e.what());
    } catch (const std::logic_error& e) {
        spdlog::error("Event catalog rejected: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
    }
    return EXIT_FAILURE;
}
