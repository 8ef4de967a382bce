// include/persist/append_log.h
#pragma once

#include "../registry_error/result.h"

#include <string>
#include <vector>
#include <fstream>
#include <functional>
#include <mutex>
#include <cstdint>

namespace schemata {
namespace persist {

/**
 * @class AppendLog
 * @brief Single-file append-only record log.
 *
 * Each record on disk is [u32 payload_len][payload][u32 crc32(payload)].
 * Replay stops at the first short or checksum-failing record and truncates
 * the file there, so a write torn by a crash is discarded.
 */
class AppendLog {
public:
    // Called once per intact record, in file order. An error aborts replay.
    using ReplayFn = std::function<registry::Status(const std::string& payload)>;

    struct ReplayStats {
        size_t records = 0;
        uint64_t valid_bytes = 0;
        uint64_t truncated_bytes = 0;
    };

    AppendLog(std::string path, bool flush_on_write);
    ~AppendLog();

    AppendLog(const AppendLog&) = delete;
    AppendLog& operator=(const AppendLog&) = delete;

    // Replays existing records, drops a torn tail, then opens for appending.
    registry::Result<ReplayStats> openAndReplay(const ReplayFn& on_record);

    registry::Status append(const std::string& payload);
    // All payloads go out in one write.
    registry::Status appendBatch(const std::vector<std::string>& payloads);

    // Pushes buffered records to the OS regardless of flush_on_write.
    registry::Status flush();
    void close();
    bool isOpen() const;
    const std::string& path() const { return path_; }

    static std::string frame(const std::string& payload);
    static constexpr uint32_t MAX_PAYLOAD_BYTES = 64 * 1024 * 1024;

private:
    registry::Status writeLocked(const std::string& bytes);

    const std::string path_;
    const bool flush_on_write_;
    mutable std::mutex mutex_;
    std::ofstream out_;
};

} // namespace persist
} // namespace schemata
