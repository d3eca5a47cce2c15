// ============================================================================
// BENCHMARK: EVENT DECODE PIPELINE
// ============================================================================
// Throughput of the decode stages on a synthetic pump history
//
// Test scenarios:
// 1. Base64 decode of a large blob
// 2. Eager decode (collect) of every frame
// 3. Lazy iteration, consumer stops after the first 10%
// 4. Concurrent decodes sharing one pipeline
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <iomanip>
#include <memory>
#include <pumpevents/core/codec/base64.hpp>
#include <pumpevents/core/events/event_catalog.hpp>
#include <pumpevents/core/frame/header_codec.hpp>
#include <pumpevents/core/pipeline/decode_pipeline.hpp>
#include <spdlog/spdlog.h>

using namespace PumpEvents;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t elapsed_ns;
    double ops_per_sec;
    double ns_per_op;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::left << std::setw(30) << r.name
              << std::right
              << std::setw(12) << r.total_ops << " ops | "
              << std::setw(10) << std::fixed << std::setprecision(2) << (r.ops_per_sec / 1e6) << "M ops/s | "
              << std::setw(8) << std::fixed << std::setprecision(1) << r.ns_per_op << " ns/op"
              << std::endl;
}

template <typename Fn>
BenchmarkResult measure(const std::string& name, uint64_t ops, Fn&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    fn();
    auto end = std::chrono::high_resolution_clock::now();
    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    if (elapsed_ns == 0) elapsed_ns = 1;
    return {name, ops, elapsed_ns, (ops * 1e9) / elapsed_ns, (double)elapsed_ns / ops};
}

// Alternating CGM readings and basal deliveries, 5 minutes apart
std::vector<uint8_t> synthetic_history(uint32_t frames) {
    std::vector<uint8_t> buffer;
    buffer.reserve(static_cast<size_t>(frames) * FRAME_SIZE);

    for (uint32_t i = 0; i < frames; ++i) {
        RawFrame frame{};
        FrameHeader header;
        header.source = 0;
        header.type_id = (i % 2 == 0) ? 256 : 279;
        header.raw_timestamp = 500000000u + i * 300u;
        header.sequence_number = i;
        encodeHeader(header, frame.data());

        uint8_t* payload = frame.data() + HEADER_SIZE;
        uint16_t value = static_cast<uint16_t>(80 + i % 200);
        payload[6] = static_cast<uint8_t>(value >> 8);
        payload[7] = static_cast<uint8_t>(value & 0xFF);
        buffer.insert(buffer.end(), frame.begin(), frame.end());
    }
    return buffer;
}

// ============================================================================
// TEST SUITES
// ============================================================================

void test_base64(const std::string& blob, uint64_t frames) {
    print_header("Base64 decode");
    auto r = measure("Base64::decode", frames, [&]() {
        volatile size_t n = Base64::decode(blob).size();
        (void)n;
    });
    print_result(r);
}

void test_collect(const EventDecodePipeline& pipeline, const std::string& blob, uint64_t frames) {
    print_header("Eager decode (decodeAll)");
    size_t decoded = 0;
    auto r = measure("decodeAll", frames, [&]() {
        decoded = pipeline.decodeAll(blob).events.size();
    });
    print_result(r);
    std::cout << "Decoded events: " << decoded << std::endl;
}

void test_lazy_prefix(const EventDecodePipeline& pipeline, const std::string& blob, uint64_t frames) {
    print_header("Lazy iteration (first 10% only)");
    const uint64_t wanted = frames / 10;
    auto r = measure("lazy prefix", wanted, [&]() {
        uint64_t seen = 0;
        for (const auto& event : pipeline.decode(blob)) {
            (void)event;
            if (++seen == wanted) break;
        }
    });
    print_result(r);
}

void test_concurrent(const EventDecodePipeline& pipeline, const std::string& blob,
                     uint64_t frames, unsigned threads) {
    print_header("Concurrent decodes (" + std::to_string(threads) + " threads, shared pipeline)");
    auto r = measure("concurrent decodeAll", frames * threads, [&]() {
        std::vector<std::thread> thread_vec;
        for (unsigned t = 0; t < threads; ++t) {
            thread_vec.emplace_back([&]() {
                volatile size_t n = pipeline.decodeAll(blob).events.size();
                (void)n;
            });
        }
        for (auto& t : thread_vec) {
            t.join();
        }
    });
    print_result(r);
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    const uint32_t FRAMES = 200000;

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "PUMP EVENT DECODE BENCHMARK (" << FRAMES << " frames)" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    try {
        auto registry = std::make_shared<const EventRegistry>(
            EventCatalogLoader::loadFile("config/event_catalog.yaml"));
        EventDecodePipeline pipeline(registry, TimestampResolver("America/Los_Angeles"));

        const std::string blob = Base64::encode(synthetic_history(FRAMES));

        test_base64(blob, FRAMES);
        test_collect(pipeline, blob, FRAMES);
        test_lazy_prefix(pipeline, blob, FRAMES);
        test_concurrent(pipeline, blob, FRAMES, 4);
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    return 0;
}
