// Shared helpers for the parcelink doctest suites.
#pragma once

#include "parcelink/config.hpp"
#include "parcelink/log.hpp"
#include "parcelink/message.hpp"
#include "parcelink/parcel.hpp"
#include "parcelink/queue.hpp"
#include "parcelink/receipt.hpp"
#include "parcelink/transport/link.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <vector>

namespace harness {

using namespace parcelink;

/// Records every frame a queue writes; answers with `result`.
struct CaptureLink {
    struct Sent {
        std::string device;
        Bytes data;
    };

    std::vector<Sent> frames;
    TxResult result{TxResult::Ok};

    SendFn fn() {
        return [this](const std::string& dev, const uint8_t* p, size_t n) {
            frames.push_back(Sent{dev, Bytes(p, p + n)});
            return result;
        };
    }

    std::vector<Parcel> data_parcels(size_t from = 0) const {
        std::vector<Parcel> out;
        for (size_t i = from; i < frames.size(); ++i) {
            auto p = decode_as_data(frames[i].data);
            if (p) out.push_back(*p);
        }
        return out;
    }

    size_t header_count(size_t from = 0) const {
        size_t n = 0;
        for (size_t i = from; i < frames.size(); ++i) {
            if (frame_type(frames[i].data) == FrameType::Header) ++n;
        }
        return n;
    }

    std::vector<Receipt> receipts(size_t from = 0) const {
        std::vector<Receipt> out;
        for (size_t i = from; i < frames.size(); ++i) {
            auto r = decode_receipt(frames[i].data);
            if (r) out.push_back(*r);
        }
        return out;
    }
};

/// Collects log lines from a Logger.
struct LogCapture {
    std::vector<std::string> lines;

    void attach(Logger& log, LogLevel lvl = LogLevel::Debug) {
        log.set_level(lvl);
        log.set_sink([this](LogLevel, const std::string& line) { lines.push_back(line); });
    }

    size_t count(const std::string& needle) const {
        return static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
            [&](const std::string& l) { return l.find(needle) != std::string::npos; }));
    }

    bool contains(const std::string& needle) const { return count(needle) > 0; }

    /// True if a single line holds every needle.
    bool line_with(std::initializer_list<std::string> needles) const {
        for (const auto& l : lines) {
            bool all = true;
            for (const auto& n : needles) {
                if (l.find(n) == std::string::npos) { all = false; break; }
            }
            if (all) return true;
        }
        return false;
    }
};

/// Deterministic, incompressible bytes.
inline Bytes make_bytes(size_t n, uint32_t seed = 1) {
    Bytes out(n);
    uint32_t s = seed;
    for (auto& b : out) {
        s = s * 1664525u + 1013904223u;
        b = static_cast<uint8_t>(s >> 24);
    }
    return out;
}

/// Repetitive ASCII that deflates well.
inline Bytes make_text(size_t n) {
    static const char kText[] = "the quick brown fox jumps over the lazy dog. ";
    Bytes out;
    out.reserve(n);
    while (out.size() < n) out.push_back(static_cast<uint8_t>(kText[out.size() % (sizeof(kText) - 1)]));
    return out;
}

/// Short delays so a whole exchange fits in a few hundred simulated ms.
inline Config fast_config() {
    Config c;
    c.max_parcel_size = 100;
    c.inter_parcel_delay_ms = 10;
    c.parcels_before_pause = 5;
    c.listen_window_ms = 5;
    c.receipt_timeout_ms = 100;
    c.retry_backoff_ms = 50;
    return c;
}

/// Encoded frames (header first) for a message, as a sender would produce them.
inline std::vector<Bytes> frames_for(const char* id, const Bytes& payload, size_t max_parcel = 100,
                                     bool compress = false) {
    OutgoingMessage m;
    m.msg_id = id;
    m.payload = payload;
    m.peer_supports_compression = compress;
    const ParcelSet set = m.to_parcels(max_parcel);

    std::vector<Bytes> out;
    out.push_back(encode(set.header));
    for (const auto& p : set.data) out.push_back(encode(p));
    return out;
}

inline OutgoingMessage outgoing(const char* target, const char* id, Bytes payload) {
    OutgoingMessage m;
    m.target_device_id = target;
    m.msg_id = id;
    m.payload = std::move(payload);
    return m;
}

/// Tick `q` once per ms over [from, to].
inline void run(ParcelQueue& q, uint32_t from, uint32_t to) {
    for (uint32_t t = from;; ++t) {                // `to` may lie past the 2^32 wrap
        q.tick(t);
        if (t == to) break;
    }
}

} // namespace harness
