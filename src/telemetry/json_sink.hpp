/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace verified_compute {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The live file is `<prefix>.ndjson`. When it reaches the size limit it
 * becomes `<prefix>.1.ndjson`, older files shift up by one and anything
 * beyond `max_files` in total is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    /// Byte limit override for callers that need sub-megabyte files.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout, for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace verified_compute
