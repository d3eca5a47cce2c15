#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace PumpEvents {

/**
 * @class RawBlobStore
 * @brief Append-only file of fetched event blobs, kept for offline re-decoding.
 *
 * Record layout: [4B big-endian length][blob bytes]. Blobs are stored
 * already base64-decoded, so replaying them goes through
 * EventDecodePipeline::decodeBytes().
 */
class RawBlobStore {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending
     */
    explicit RawBlobStore(const std::string& storagePath);
    ~RawBlobStore();

    void append(const std::vector<uint8_t>& blob);
    void flush();

    size_t blobsWritten() const { return blobs_written_; }

    /**
     * @brief Read every blob in file order
     * @throws std::runtime_error if the file is missing or ends inside a record
     */
    static std::vector<std::vector<uint8_t>> readAll(const std::string& storagePath);

private:
    std::string path_;
    std::ofstream storageFile_;
    std::mutex storageMutex_;
    size_t blobs_written_ = 0;
};

} // namespace PumpEvents
