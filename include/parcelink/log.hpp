/**
 * @file log.hpp
 * @brief parcelink Logger: one `key=value` status line per protocol event.
 *
 * @details
 * Every diagnostic the queue emits is a single line in the same shape the CLI
 * status output uses:
 *
 * @code
 *   parcelink level=warn event=receipt_timeout msg=QHZKTA dev=peer-1
 * @endcode
 *
 * Lines are cheap to grep in a field log and trivial to parse in a test.
 *
 * The logger is an ordinary object owned by `ParcelQueue`; there is no global
 * logger. By default it writes to `std::cerr`. Hosts that route logs elsewhere
 * (syslog, a ring buffer, a test capture) install a sink with `set_sink()`.
 *
 * @par Usage
 * @code
 *   parcelink::Logger log;
 *   log.set_level(parcelink::LogLevel::Debug);
 *   log.record(parcelink::LogLevel::Info, "enqueued").kv("msg", id).kv("bytes", 1000);
 *   // line is emitted when the temporary Record goes out of scope
 * @endcode
 */
#ifndef PARCELINK_LOG_HPP
#define PARCELINK_LOG_HPP

#include <stdint.h>
#include <functional>
#include <sstream>
#include <string>

namespace parcelink {

/// Severity threshold. `Off` silences the logger entirely.
enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Lowercase level name as it appears in `level=<name>`.
const char* level_name(LogLevel lvl);

class Logger {
public:
  /// Receives the severity and the fully formatted line (no trailing newline).
  using Sink = std::function<void(LogLevel, const std::string&)>;

  /**
   * @brief Builder for a single line; emits from its destructor.
   *
   * A Record created below the logger threshold is inert: `kv()` calls are
   * accepted and discarded.
   */
  class Record {
  public:
    Record(const Logger& owner, LogLevel lvl, const char* event);
    Record(Record&& other) noexcept;
    Record(const Record&) = delete;
    Record& operator=(const Record&) = delete;
    Record& operator=(Record&&) = delete;
    ~Record();

    Record& kv(const char* key, const std::string& value);
    Record& kv(const char* key, const char* value);
    Record& kv(const char* key, uint64_t value);
    Record& kv(const char* key, int64_t value);
    Record& kv(const char* key, uint32_t value) { return kv(key, static_cast<uint64_t>(value)); }
    Record& kv(const char* key, int value)      { return kv(key, static_cast<int64_t>(value)); }
    Record& kv(const char* key, bool value)     { return kv(key, value ? "1" : "0"); }

  private:
    const Logger* owner_;
    LogLevel level_;
    bool active_;
    std::ostringstream line_;
  };

  Logger();

  void set_sink(Sink sink);
  void set_level(LogLevel lvl) { level_ = lvl; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel lvl) const;

  /// Start a line for `event` at severity `lvl`.
  Record record(LogLevel lvl, const char* event) const;

  Record debug(const char* event) const { return record(LogLevel::Debug, event); }
  Record info(const char* event)  const { return record(LogLevel::Info, event); }
  Record warn(const char* event)  const { return record(LogLevel::Warn, event); }
  Record error(const char* event) const { return record(LogLevel::Error, event); }

private:
  void emit(LogLevel lvl, const std::string& line) const;

  Sink sink_;
  LogLevel level_{LogLevel::Info};
};

} // namespace parcelink

#endif // PARCELINK_LOG_HPP
