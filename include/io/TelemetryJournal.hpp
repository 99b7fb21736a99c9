#pragma once
/** @file  TelemetryJournal.hpp
 *  @brief Append-only CSV journal backing the telemetry store.
 *
 *  © 2025 Zeddring — MIT-licensed.
 */

#include <cstdio>
#include <functional>
#include <string>
#include <vector>

namespace zeddring {
  namespace io {

    /**
 * @class TelemetryJournal
 * @brief RAII wrapper that opens a file for append, buffers lines, and
 *        flushes + fsyncs on demand.
 *
 *  * One line per sample: `ringId,metric,epochMillis,value\n`.
 *  * `replay()` hands every complete line of an existing journal to a callback
 *    (a torn last line from a crash is skipped).
 */
    class TelemetryJournal {
    public:
      TelemetryJournal() = default;
      ~TelemetryJournal(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened for append. */
      bool open(const std::string& path);

      bool isOpen() const { return fp_ != nullptr; }

      /** Queues one CSV line (caller omits the trailing '\n'). */
      void write(const std::string& line);

      /** Write the buffer, fflush and fsync; returns true on success. */
      bool flush();

      void close();

      /** Feed each complete line of \p path to \p onLine; false if unreadable. */
      static bool replay(const std::string& path,
                         const std::function<void(const std::string&)>& onLine);

      //---non-copyable, move-enabled---------------------------------------
      TelemetryJournal(const TelemetryJournal&) = delete;
      TelemetryJournal& operator=(const TelemetryJournal&) = delete;
      TelemetryJournal(TelemetryJournal&& other) noexcept;
      TelemetryJournal& operator=(TelemetryJournal&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace zeddring
