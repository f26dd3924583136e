#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only CSV writer on the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace chime {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for append, buffers writes, and flushes on demand.
 *
 *  * Intended for the alarm event log (a few kB per day).
 *  * Buffers up to 4 kB before an implicit `std::fwrite`.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kFlushThreshold = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; } ///< empty until open()

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> buffer_; ///< rows not yet handed to stdio
    };

  } // namespace io
} // namespace chime
