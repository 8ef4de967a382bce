// src/persist/append_log.cpp

#include "../../include/persist/append_log.h"
#include "../../include/serialization_utils.h"
#include "../../include/debug_utils.h"

#include <zlib.h>

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace schemata {
namespace persist {

namespace {

uint32_t checksum(const std::string& payload) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(payload.data()), static_cast<uInt>(payload.size()));
    return static_cast<uint32_t>(crc);
}

} // anonymous namespace

AppendLog::AppendLog(std::string path, bool flush_on_write)
    : path_(std::move(path)), flush_on_write_(flush_on_write) {}

AppendLog::~AppendLog() {
    close();
}

std::string AppendLog::frame(const std::string& payload) {
    std::ostringstream out(std::ios::binary);
    SerializeString(out, payload);
    SerializeInt<uint32_t>(out, checksum(payload));
    return out.str();
}

registry::Result<AppendLog::ReplayStats> AppendLog::openAndReplay(const ReplayFn& on_record) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplayStats stats;

    std::error_code ec;
    if (fs::exists(path_, ec)) {
        uint64_t file_size = fs::file_size(path_, ec);
        if (ec) {
            return registry::RegistryError::ioError(registry::ErrorCode::IO_READ_ERROR, "stat", path_)
                .withDetails(ec.message());
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in.is_open()) {
            return registry::RegistryError::ioError(registry::ErrorCode::IO_READ_ERROR, "open for replay", path_);
        }

        try {
            while (stats.valid_bytes < file_size) {
                uint64_t remaining = file_size - stats.valid_bytes;
                if (remaining < 2 * sizeof(uint32_t)) {
                    break;
                }
                uint32_t len = DeserializeInt<uint32_t>(in);
                if (len > MAX_PAYLOAD_BYTES || remaining < 2 * sizeof(uint32_t) + len) {
                    break;
                }
                std::string payload(len, '\0');
                if (len > 0) {
                    in.read(&payload[0], len);
                    if (static_cast<uint32_t>(in.gcount()) != len) {
                        break;
                    }
                }
                uint32_t stored_crc = DeserializeInt<uint32_t>(in);
                if (stored_crc != checksum(payload)) {
                    LOG_WARN("[AppendLog] Checksum mismatch in ", path_, " at offset ", stats.valid_bytes,
                             ". Treating the rest of the file as a torn tail.");
                    break;
                }

                auto applied = on_record(payload);
                if (!applied.isOk()) {
                    LOG_ERROR("[AppendLog] Record at offset ", stats.valid_bytes, " of ", path_,
                              " could not be applied: ", applied.error().toString());
                    return std::move(applied.error()).withFilePath(path_);
                }
                stats.valid_bytes += 2 * sizeof(uint32_t) + len;
                ++stats.records;
            }
        } catch (const std::exception& e) {
            return registry::RegistryError::ioError(registry::ErrorCode::IO_READ_ERROR, "replay", path_)
                .withDetails(e.what());
        }
        in.close();

        if (stats.valid_bytes < file_size) {
            stats.truncated_bytes = file_size - stats.valid_bytes;
            LOG_WARN("[AppendLog] Truncating ", stats.truncated_bytes, " byte(s) of torn tail from ", path_);
            fs::resize_file(path_, stats.valid_bytes, ec);
            if (ec) {
                return registry::RegistryError::ioError(registry::ErrorCode::IO_WRITE_ERROR, "truncate torn tail", path_)
                    .withDetails(ec.message());
            }
        }
    }

    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_.is_open()) {
        return registry::RegistryError::ioError(registry::ErrorCode::IO_WRITE_ERROR, "open for append", path_);
    }
    LOG_TRACE("[AppendLog] Opened ", path_, " after replaying ", stats.records, " record(s)");
    return stats;
}

registry::Status AppendLog::writeLocked(const std::string& bytes) {
    if (!out_.is_open()) {
        return registry::RegistryError::ioError(registry::ErrorCode::IO_WRITE_ERROR, "append to closed log", path_);
    }
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (flush_on_write_) {
        out_.flush();
    }
    if (!out_) {
        out_.clear();
        return registry::RegistryError::ioError(registry::ErrorCode::IO_WRITE_ERROR, "append", path_);
    }
    return registry::Status();
}

registry::Status AppendLog::append(const std::string& payload) {
    if (payload.size() > MAX_PAYLOAD_BYTES) {
        return registry::RegistryError::internal("log payload of " + std::to_string(payload.size()) +
                                                 " bytes exceeds the record limit");
    }
    std::string framed = frame(payload);
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(framed);
}

registry::Status AppendLog::appendBatch(const std::vector<std::string>& payloads) {
    std::string framed;
    for (const auto& payload : payloads) {
        if (payload.size() > MAX_PAYLOAD_BYTES) {
            return registry::RegistryError::internal("log payload of " + std::to_string(payload.size()) +
                                                     " bytes exceeds the record limit");
        }
        framed += frame(payload);
    }
    if (framed.empty()) {
        return registry::Status();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return writeLocked(framed);
}

registry::Status AppendLog::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        return registry::Status();
    }
    out_.flush();
    if (!out_) {
        out_.clear();
        return registry::RegistryError::ioError(registry::ErrorCode::IO_WRITE_ERROR, "flush", path_);
    }
    return registry::Status();
}

void AppendLog::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

bool AppendLog::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.is_open();
}

} // namespace persist
} // namespace schemata
