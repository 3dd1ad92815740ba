// -----------------------------------------------------------------------------
// log.cpp: key=value line logger used by ParcelQueue.
//
// Line shape: "parcelink level=<lvl> event=<event> k1=v1 k2=v2 ..."
// Values containing spaces or '=' are wrapped in double quotes so a simple
// split on ' ' and '=' still works when reading logs back.
// -----------------------------------------------------------------------------
#include "parcelink/log.hpp"

#include <iostream>
#include <utility>

namespace parcelink {

namespace {

bool needs_quotes(const std::string& v) {
  if (v.empty()) return true;
  for (char c : v) {
    if (c == ' ' || c == '=' || c == '\t' || c == '"') return true;
  }
  return false;
}

} // namespace

const char* level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "unknown";
}

// ---------- Logger ----------

Logger::Logger() = default;

void Logger::set_sink(Sink sink) {
  sink_ = std::move(sink);              // empty sink falls back to std::cerr
}

bool Logger::enabled(LogLevel lvl) const {
  return level_ != LogLevel::Off && lvl >= level_;
}

Logger::Record Logger::record(LogLevel lvl, const char* event) const {
  return Record(*this, lvl, event);
}

void Logger::emit(LogLevel lvl, const std::string& line) const {
  if (sink_) {
    sink_(lvl, line);
    return;
  }
  std::cerr << line << "\n";
}

// ---------- Record ----------

Logger::Record::Record(const Logger& owner, LogLevel lvl, const char* event)
: owner_(&owner), level_(lvl), active_(owner.enabled(lvl)) {
  if (!active_) return;
  line_ << "parcelink level=" << level_name(lvl) << " event=" << (event ? event : "?");
}

Logger::Record::Record(Record&& other) noexcept
: owner_(other.owner_), level_(other.level_), active_(other.active_),
  line_(std::move(other.line_)) {
  other.active_ = false;                // moved-from record must not emit
}

Logger::Record::~Record() {
  if (!active_ || !owner_) return;
  owner_->emit(level_, line_.str());
}

Logger::Record& Logger::Record::kv(const char* key, const std::string& value) {
  if (!active_) return *this;
  line_ << ' ' << key << '=';
  if (needs_quotes(value)) {
    line_ << '"' << value << '"';
  } else {
    line_ << value;
  }
  return *this;
}

Logger::Record& Logger::Record::kv(const char* key, const char* value) {
  return kv(key, std::string(value ? value : ""));
}

Logger::Record& Logger::Record::kv(const char* key, uint64_t value) {
  if (active_) line_ << ' ' << key << '=' << value;
  return *this;
}

Logger::Record& Logger::Record::kv(const char* key, int64_t value) {
  if (active_) line_ << ' ' << key << '=' << value;
  return *this;
}

} // namespace parcelink
