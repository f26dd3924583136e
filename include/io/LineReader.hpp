#pragma once
/** @file  LineReader.hpp
 *  @brief Non-blocking line input over a POSIX fd (stdin, pipe or pty).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace chime {
  namespace io {

    /**
 * @class LineReader
 * @brief Reads `\n`-terminated lines from an fd it does not own.
 *
 *  * `readLine()` polls with a timeout so the caller can check a stop flag.
 *  * A trailing `\r` is stripped; a final unterminated line is returned at EOF.
 *  * *Non-copyable*, but move-constructible.
 */
    class LineReader {

    public:
      //---ctr / dtr--------------------------------------------
      explicit LineReader(int fd);
      ~LineReader() = default;

      //---public API-------------------------------------------
      /// std::nullopt on timeout, EOF or error; check `eof()` to tell them apart.
      std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      bool eof() const { return eof_; }

      //---non-copyable-----------------------------------------
      LineReader(const LineReader&) = delete;
      LineReader& operator=(const LineReader&) = delete;

      //---mv and mv assign-------------------------------------
      LineReader(LineReader&&) = default;
      LineReader& operator=(LineReader&&) = default;

    private:
      std::optional<std::string> takeLine();

      int fd_{ -1 };            ///< borrowed POSIX fd
      bool eof_{ false };
      std::string rx_buffer_{}; ///< bytes read but not yet returned
    };
  } // namespace io
} // namespace chime
