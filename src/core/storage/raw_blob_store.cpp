#include <pumpevents/core/storage/raw_blob_store.hpp>
#include <pumpevents/core/frame/byte_order.hpp>
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace PumpEvents {

RawBlobStore::RawBlobStore(const std::string& storagePath) : path_(storagePath) {
    storageFile_.open(storagePath, std::ios::binary | std::ios::app);
    if (!storageFile_.is_open()) {
        spdlog::error("Failed to open blob store at {}", storagePath);
        throw std::runtime_error("Failed to open blob store: " + storagePath);
    }
}

RawBlobStore::~RawBlobStore() {
    if (storageFile_.is_open()) {
        storageFile_.flush();
        storageFile_.close();
    }
}

void RawBlobStore::flush() {
    std::lock_guard<std::mutex> lock(storageMutex_);
    if (storageFile_.is_open()) {
        storageFile_.flush();
    }
}

void RawBlobStore::append(const std::vector<uint8_t>& blob) {
    if (blob.size() > std::numeric_limits<uint32_t>::max())
        throw std::runtime_error("Blob too large for the blob store");

    std::lock_guard<std::mutex> lock(storageMutex_);

    // Length prefix and body in one contiguous write
    std::vector<uint8_t> buffer;
    buffer.reserve(sizeof(uint32_t) + blob.size());

    uint32_t len = static_cast<uint32_t>(blob.size());
    buffer.push_back(static_cast<uint8_t>((len >> 24) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((len >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(len & 0xFF));
    buffer.insert(buffer.end(), blob.begin(), blob.end());

    storageFile_.write(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<std::streamsize>(buffer.size()));
    if (!storageFile_.good()) {
        spdlog::error("Failed to write blob of {} bytes to {}", blob.size(), path_);
        throw std::runtime_error("Failed to write blob to store");
    }

    ++blobs_written_;
    spdlog::debug("[RawBlobStore] Stored blob #{} ({} bytes)", blobs_written_, blob.size());
}

std::vector<std::vector<uint8_t>> RawBlobStore::readAll(const std::string& storagePath) {
    std::ifstream in(storagePath, std::ios::binary);
    if (!in.is_open())
        throw std::runtime_error("Failed to open blob store: " + storagePath);

    in.seekg(0, std::ios::end);
    const std::streamoff fileSize = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<std::vector<uint8_t>> blobs;
    uint8_t prefix[sizeof(uint32_t)];
    while (in.read(reinterpret_cast<char*>(prefix), sizeof(prefix))) {
        uint32_t len = detail::readUint32BE(prefix);

        // Check the declared length against the file before allocating for it
        const std::streamoff remaining = fileSize - in.tellg();
        if (static_cast<std::streamoff>(len) > remaining)
            throw std::runtime_error("Blob store " + storagePath + " ends inside a record");

        std::vector<uint8_t> blob(len);
        if (len > 0 && !in.read(reinterpret_cast<char*>(blob.data()), len))
            throw std::runtime_error("Blob store " + storagePath + " ends inside a record");
        blobs.push_back(std::move(blob));
    }

    if (in.gcount() != 0)
        throw std::runtime_error("Blob store " + storagePath + " ends inside a length prefix");

    spdlog::info("[RawBlobStore] Read {} blobs from {}", blobs.size(), storagePath);
    return blobs;
}

} // namespace PumpEvents
