/**
 * @file main.cpp
 * @brief parcelsim: two parcelink endpoints talking over a simulated lossy BLE link.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): link impairments, workload, and every Config tunable.
 *  - Wire two ParcelQueue instances ("alpha" and "bravo") to one LoopbackLink.
 *  - Drive simulated time in fixed steps: link.poll() → alpha.tick() → bravo.tick().
 *  - Check every completed payload against what was sent, byte for byte.
 *  - Print a summary as key=value (default) or JSON (--format json).
 *
 * Exit codes:
 *  - 0  every message delivered and verified
 *  - 1  at least one message failed, was corrupted, or the run hit --max-sim-ms
 *  - 2  bad options
 *
 * Examples:
 *   parcelsim --messages 5 --payload-size 4000 --drop-rate 0.1
 *   parcelsim --payload-kind text --compress --format json
 *   parcelsim --drop-rate 0.3 --max-retries 5 --verbose
 */

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "parcelink/config.hpp"
#include "parcelink/log.hpp"
#include "parcelink/message.hpp"
#include "parcelink/queue.hpp"
#include "parcelink/transport/loopback.hpp"

using json = nlohmann::json;
using namespace parcelink;

// ---------- small utilities ----------

static bool is_tty_stderr() { return ::isatty(fileno(stderr)); }

struct Ansi {
  bool enabled{true};
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string yel (const std::string& s) const { return enabled ? "\033[33m"+s+"\033[0m" : s; }
};

// Deterministic payloads: "random" does not compress, "text" does.
static Bytes make_payload(const std::string& kind, size_t size, uint32_t seed) {
  static const char* WORDS[] = {"parcel ", "receipt ", "header ", "listen ", "window ",
                                "retry ", "missing ", "complete ", "link ", "burst "};
  Bytes out;
  out.reserve(size);
  uint32_t s = seed ? seed : 1;
  auto rnd = [&s]() {
    s = s * 1103515245u + 12345u;
    return s >> 16;
  };
  if (kind == "text") {
    while (out.size() < size) {
      const char* w = WORDS[rnd() % 10];
      for (const char* p = w; *p && out.size() < size; ++p) out.push_back(static_cast<uint8_t>(*p));
    }
  } else {
    while (out.size() < size) out.push_back(static_cast<uint8_t>(rnd() & 0xFF));
  }
  return out;
}

struct Expected {
  std::string from;
  std::string to;
  Bytes payload;
};

struct Tally {
  uint32_t delivered{0};
  uint32_t failed{0};
  uint32_t verified{0};
  uint32_t corrupted{0};
  uint32_t unexpected{0};
  std::map<std::string, uint32_t> failure_reasons;
};

// ---------- main ----------

int main(int argc, char** argv) {
  Config cfg;

  // workload / link
  uint32_t opt_messages = 3;
  size_t opt_payload_size = 1000;
  std::string opt_payload_kind = "random";
  bool opt_duplex = false;
  bool opt_compress = false;
  double opt_drop_rate = 0.0;
  uint32_t opt_latency_ms = 20;
  size_t opt_mtu = 0;
  uint32_t opt_seed = 1;

  // simulation / output
  uint32_t opt_step_ms = 10;
  uint32_t opt_max_sim_ms = 30u * 60u * 1000u;
  bool opt_verbose = false;
  bool opt_quiet = false;
  bool opt_no_color = false;
  std::string opt_format = "kv";

  CLI::App app{"parcelsim: simulate parcelink over a lossy BLE-like link"};

  app.add_option("--messages", opt_messages, "Messages sent alpha->bravo")->capture_default_str();
  app.add_option("--payload-size", opt_payload_size, "Bytes per message")->capture_default_str();
  app.add_option("--payload-kind", opt_payload_kind, "random|text")
      ->check(CLI::IsMember({"random", "text"}))->capture_default_str();
  app.add_flag("--duplex", opt_duplex, "Also send the same workload bravo->alpha");
  app.add_flag("--compress", opt_compress, "Peers advertise compression support");
  app.add_option("--drop-rate", opt_drop_rate, "Probability a frame is lost")
      ->check(CLI::Range(0.0, 1.0))->capture_default_str();
  app.add_option("--latency-ms", opt_latency_ms, "One-way link latency")->capture_default_str();
  app.add_option("--mtu", opt_mtu, "Refuse writes longer than this (0 = unlimited)")->capture_default_str();
  app.add_option("--seed", opt_seed, "Seed for loss and payload generation")->capture_default_str();

  app.add_option("--step-ms", opt_step_ms, "Simulated time per loop iteration")
      ->check(CLI::Range(uint32_t{1}, uint32_t{60000}))->capture_default_str();
  app.add_option("--max-sim-ms", opt_max_sim_ms, "Give up after this much simulated time")
      ->capture_default_str();
  app.add_flag("-v,--verbose", opt_verbose, "Protocol logs at debug level");
  app.add_flag("-q,--quiet", opt_quiet, "Errors only");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors in logs");
  app.add_option("--format", opt_format, "Summary format: kv|json")
      ->check(CLI::IsMember({"kv", "json"}))->capture_default_str();

  // Config tunables
  app.add_option("--max-parcel-size", cfg.max_parcel_size, "Payload bytes per data parcel")->capture_default_str();
  app.add_option("--max-retries", cfg.max_retries, "Message-level attempts")->capture_default_str();
  app.add_option("--max-resend-cycles", cfg.max_resend_cycles, "Bursts per attempt (0 = unbounded)")->capture_default_str();
  app.add_option("--inter-parcel-delay-ms", cfg.inter_parcel_delay_ms, "Gap after each write")->capture_default_str();
  app.add_option("--parcels-before-pause", cfg.parcels_before_pause, "Writes between listen windows")->capture_default_str();
  app.add_option("--listen-window-ms", cfg.listen_window_ms, "Listen window length")->capture_default_str();
  app.add_option("--receipt-timeout-ms", cfg.receipt_timeout_ms, "Receipt wait per burst")->capture_default_str();
  app.add_option("--retry-backoff-ms", cfg.retry_backoff_ms, "Pause between attempts")->capture_default_str();
  app.add_option("--retention-ms", cfg.sent_message_retention_ms, "Sent-record retention")->capture_default_str();
  app.add_option("--missing-request-delay-ms", cfg.missing_parcel_request_delay_ms, "Silence before a missing nudge")->capture_default_str();
  app.add_option("--incomplete-timeout-ms", cfg.incomplete_message_timeout_ms, "Silence before abandoning reassembly")->capture_default_str();
  app.add_option("--housekeeping-interval-ms", cfg.housekeeping_interval_ms, "Housekeeping period")->capture_default_str();
  app.add_option("--compression-threshold", cfg.compression_threshold, "Smallest payload worth compressing")->capture_default_str();

  CLI11_PARSE(app, argc, argv);

  if (!cfg.is_valid()) {
    std::cerr << "status=error reason=invalid_config\n";
    return 2;
  }
  if (OutgoingMessage::parcel_count_for(opt_payload_size, cfg.max_parcel_size) > MAX_DATA_PARCELS) {
    std::cerr << "status=error reason=payload_too_large\n";
    return 2;
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stderr();

  // ---------- wiring ----------

  transport::LoopbackLink link(opt_seed);
  link.set_drop_rate(opt_drop_rate);
  link.set_latency_ms(opt_latency_ms);
  link.set_mtu(opt_mtu);

  const std::string ALPHA = "alpha";
  const std::string BRAVO = "bravo";

  ParcelQueue alpha(link.sender(ALPHA), cfg);
  ParcelQueue bravo(link.sender(BRAVO), cfg);

  const LogLevel lvl = opt_verbose ? LogLevel::Debug : (opt_quiet ? LogLevel::Error : LogLevel::Warn);
  uint32_t sim_now = 0;
  auto make_sink = [&](const std::string& who) {
    return [&, who](LogLevel l, const std::string& line) {
      std::string tag = "[" + std::to_string(sim_now) + "ms " + who + "] ";
      std::string text = line;
      if (l >= LogLevel::Error)     text = ansi.red(text);
      else if (l == LogLevel::Warn) text = ansi.yel(text);
      std::cerr << ansi.dim(tag) << text << "\n";
    };
  };
  alpha.logger().set_level(lvl);
  bravo.logger().set_level(lvl);
  alpha.logger().set_sink(make_sink(ALPHA));
  bravo.logger().set_sink(make_sink(BRAVO));

  std::map<ParcelQueue*, std::string> names = {{&alpha, ALPHA}, {&bravo, BRAVO}};
  std::map<std::string, ParcelQueue*> by_name = {{ALPHA, &alpha}, {BRAVO, &bravo}};

  // ---------- workload ----------

  std::map<std::string, Expected> expected;   // msg id -> what should arrive
  uint32_t enqueued = 0;
  MsgIdGenerator ids(opt_seed);               // one generator: ids unique across both ends

  auto enqueue_batch = [&](ParcelQueue& from, const std::string& from_name, const std::string& to_name,
                           uint32_t seed_base) {
    for (uint32_t i = 0; i < opt_messages; ++i) {
      OutgoingMessage m;
      m.target_device_id = to_name;
      m.msg_id = ids.next();
      m.payload = make_payload(opt_payload_kind, opt_payload_size, seed_base + i);
      m.peer_supports_compression = opt_compress;

      Expected e{from_name, to_name, m.payload};
      const std::string id = m.msg_id.c_str();
      if (!from.enqueue(std::move(m))) {
        std::cerr << "status=error reason=enqueue_failed from=" << from_name << " index=" << i << "\n";
        continue;
      }
      expected[id] = std::move(e);
      ++enqueued;
    }
  };

  enqueue_batch(alpha, ALPHA, BRAVO, opt_seed * 1000u);
  if (opt_duplex) enqueue_batch(bravo, BRAVO, ALPHA, opt_seed * 1000u + 500u);

  // ---------- run ----------

  Tally tally;
  uint32_t outcomes = 0;

  auto drain = [&](ParcelQueue& q) {
    SendOutcome o;
    while (q.get_outcome(o)) {
      ++outcomes;
      if (o.delivered) {
        ++tally.delivered;
      } else {
        ++tally.failed;
        ++tally.failure_reasons[outcome_reason_name(o.reason)];
      }
    }
    CompletedMessage c;
    while (q.get_completed(c)) {
      auto it = expected.find(c.msg_id.c_str());
      if (it == expected.end() || it->second.to != names[&q] || it->second.from != c.source_device_id) {
        ++tally.unexpected;
        continue;
      }
      if (c.payload == it->second.payload) ++tally.verified;
      else                                 ++tally.corrupted;
    }
  };

  bool timed_out = true;
  for (sim_now = 0; sim_now <= opt_max_sim_ms; sim_now += opt_step_ms) {
    link.poll(sim_now, [&](const std::string& to, const std::string& from, const Bytes& data) {
      auto it = by_name.find(to);
      if (it != by_name.end()) it->second->on_data_received(from, data, sim_now);
    });
    alpha.tick(sim_now);
    bravo.tick(sim_now);
    drain(alpha);
    drain(bravo);

    if (outcomes >= enqueued && link.in_flight() == 0 &&
        !alpha.is_sending(BRAVO) && !bravo.is_sending(ALPHA)) {
      timed_out = false;
      break;
    }
  }

  const bool ok = !timed_out && tally.failed == 0 && tally.corrupted == 0 &&
                  tally.unexpected == 0 && tally.verified == enqueued;

  // ---------- summary ----------

  if (opt_format == "json") {
    json j;
    j["status"] = ok ? "ok" : "fail";
    j["enqueued"] = enqueued;
    j["delivered"] = tally.delivered;
    j["failed"] = tally.failed;
    j["verified"] = tally.verified;
    j["corrupted"] = tally.corrupted;
    j["unexpected"] = tally.unexpected;
    j["timed_out"] = timed_out;
    j["sim_ms"] = sim_now;
    j["frames_sent"] = link.sent();
    j["frames_dropped"] = link.dropped();
    j["frames_refused"] = link.refused();
    j["failure_reasons"] = tally.failure_reasons;
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << "status=" << (ok ? "ok" : "fail")
              << " enqueued=" << enqueued
              << " delivered=" << tally.delivered
              << " failed=" << tally.failed
              << " verified=" << tally.verified
              << " corrupted=" << tally.corrupted
              << " unexpected=" << tally.unexpected
              << " timed_out=" << (timed_out ? 1 : 0)
              << " sim_ms=" << sim_now
              << " frames_sent=" << link.sent()
              << " frames_dropped=" << link.dropped()
              << " frames_refused=" << link.refused();
    for (const auto& kv : tally.failure_reasons) {
      std::cout << " fail_" << kv.first << "=" << kv.second;
    }
    std::cout << "\n";
  }

  return ok ? 0 : 1;
}
