#include <doctest/doctest.h>
#include "harness.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace parcelink;
using harness::CaptureLink;
using harness::LogCapture;
using harness::frames_for;
using harness::make_bytes;
using harness::make_text;

namespace {

struct Receiver {
    CaptureLink link;
    LogCapture logs;
    ParcelQueue q;

    Receiver() : q(link.fn(), harness::fast_config()) { logs.attach(q.logger()); }

    void feed(const Bytes& frame, uint32_t now = 0, const char* from = "peer") {
        q.on_data_received(from, frame, now);
    }

    void feed_all(const std::vector<Bytes>& frames, uint32_t now = 0, const char* from = "peer") {
        for (const auto& f : frames) feed(f, now, from);
    }
};

} // namespace

TEST_CASE("A full message is reassembled and acknowledged") {
    Receiver r;
    const Bytes payload = make_bytes(1000);
    r.feed_all(frames_for("M1", payload), 42);

    const auto receipts = r.link.receipts();
    REQUIRE(receipts.size() == 1);
    CHECK(receipts[0].msg_id == MsgIdStr("M1"));
    CHECK(receipts[0].status == ReceiptStatus::Complete);
    CHECK(r.link.frames[0].device == "peer");

    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK(c.msg_id == MsgIdStr("M1"));
    CHECK(c.source_device_id == "peer");
    CHECK(c.payload == payload);
    CHECK(c.received_at == 42);
    CHECK_FALSE(r.q.get_completed(c));
    CHECK(r.q.incoming_count("peer") == 0);
    CHECK(r.logs.line_with({"event=incoming_complete", "msg=M1", "parcels=10", "bytes=1000"}));
}

TEST_CASE("Parcels may arrive in any order") {
    Receiver r;
    const Bytes payload = make_bytes(700);
    std::vector<Bytes> frames = frames_for("M1", payload);

    r.feed(frames[0]);
    for (size_t i = frames.size() - 1; i >= 1; --i) r.feed(frames[i]);

    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == payload);
}

TEST_CASE("Data before its header is held, then merged") {
    Receiver r;
    const Bytes payload = make_bytes(1000);
    const std::vector<Bytes> frames = frames_for("M1", payload);

    for (size_t i = 1; i < frames.size(); ++i) r.feed(frames[i]);
    CHECK(r.q.orphan_count("peer") == 1);
    CHECK(r.q.incoming_count("peer") == 0);
    CHECK(r.link.frames.empty());

    r.feed(frames[0]);
    CHECK(r.q.orphan_count("peer") == 0);
    CHECK(r.logs.line_with({"event=incoming_start", "merged=10"}));

    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == payload);
}

TEST_CASE("Orphans are capped per device and per message") {
    Receiver r;
    const char* ids[] = {"O1", "O2", "O3", "O4"};
    for (const char* id : ids) r.feed(encode(Parcel::data_parcel(MsgIdStr(id), 0, Bytes{1})));
    CHECK(r.q.orphan_count("peer") == 4);

    r.feed(encode(Parcel::data_parcel(MsgIdStr("O5"), 0, Bytes{1})));
    CHECK(r.q.orphan_count("peer") == 4);
    CHECK(r.logs.line_with({"event=parcel_dropped", "msg=O5", "reason=unknown_message"}));

    for (uint16_t n = 1; n <= 64; ++n) r.feed(encode(Parcel::data_parcel(MsgIdStr("O1"), n, Bytes{1})));
    CHECK(r.logs.line_with({"event=parcel_dropped", "msg=O1", "parcel=64", "reason=orphan_buffer_full"}));
    CHECK(r.logs.count("reason=orphan_buffer_full") == 1);
}

TEST_CASE("Repeated header and data parcels are ignored") {
    Receiver r;
    const std::vector<Bytes> frames = frames_for("M1", make_bytes(300));

    r.feed(frames[0]);
    r.feed(frames[0]);
    CHECK(r.q.incoming_count("peer") == 1);
    CHECK(r.logs.line_with({"event=header_duplicate", "msg=M1"}));

    r.feed(frames[1]);
    r.feed(frames[1]);
    CHECK(r.logs.line_with({"event=parcel_duplicate", "msg=M1", "parcel=0"}));

    r.feed(frames[2]);
    r.feed(frames[3]);
    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK_FALSE(r.q.get_completed(c));
}

TEST_CASE("A corrupted parcel fails the checksum; a clean resend completes") {
    Receiver r;
    const Bytes payload = make_bytes(1000);
    std::vector<Bytes> frames = frames_for("M1", payload);
    std::vector<Bytes> bad = frames;
    bad[7].back() ^= 0x01;

    r.feed_all(bad);
    auto receipts = r.link.receipts();
    REQUIRE(receipts.size() == 1);
    CHECK(receipts[0].status == ReceiptStatus::ChecksumFailed);
    CHECK(r.q.incoming_count("peer") == 0);
    CHECK(r.logs.line_with({"event=incoming_rejected", "reason=checksum_mismatch"}));

    CompletedMessage c;
    CHECK_FALSE(r.q.get_completed(c));

    r.feed_all(frames, 10);
    receipts = r.link.receipts();
    REQUIRE(receipts.size() == 2);
    CHECK(receipts[1].status == ReceiptStatus::Complete);
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == payload);
}

TEST_CASE("A zero-length payload completes on its header") {
    Receiver r;
    const std::vector<Bytes> frames = frames_for("E", Bytes{});
    REQUIRE(frames.size() == 1);

    r.feed(frames[0]);
    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload.empty());
    REQUIRE(r.link.receipts().size() == 1);
    CHECK(r.link.receipts()[0].status == ReceiptStatus::Complete);
}

TEST_CASE("A completed message is delivered at most once") {
    Receiver r;
    const std::vector<Bytes> frames = frames_for("M1", make_bytes(500));
    r.feed_all(frames);

    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));

    // sender missed our receipt and starts over
    r.feed_all(frames, 100);
    CHECK_FALSE(r.q.get_completed(c));

    const auto receipts = r.link.receipts();
    REQUIRE(receipts.size() == 2);
    CHECK(receipts[1].status == ReceiptStatus::Complete);
    CHECK(r.logs.line_with({"event=header_for_completed", "msg=M1"}));
    CHECK(r.logs.count("event=data_for_completed") == 5);
    CHECK(r.q.incoming_count("peer") == 0);
    CHECK(r.q.orphan_count("peer") == 0);
}

TEST_CASE("A completed id is forgotten after the retention window") {
    Receiver r;
    const std::vector<Bytes> first = frames_for("M1", make_bytes(500, 1));
    const Bytes second_payload = make_bytes(400, 2);
    const std::vector<Bytes> second = frames_for("M1", second_payload);

    r.q.tick(0);
    r.feed_all(first, 0);
    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));

    // still remembered on the boundary: a late resend is answered, not delivered
    r.q.housekeep(120000);
    r.feed_all(first, 120000);
    CHECK_FALSE(r.q.get_completed(c));

    // a restarted sender reusing the id after that is a new message
    r.q.housekeep(120001);
    CHECK(r.logs.line_with({"event=completed_id_expired", "msg=M1", "dev=peer"}));
    r.feed_all(second, 120001);
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == second_payload);

    const auto receipts = r.link.receipts();
    REQUIRE(receipts.size() == 3);
    for (const auto& rc : receipts) CHECK(rc.status == ReceiptStatus::Complete);
}

TEST_CASE("The same id from two devices is two messages") {
    Receiver r;
    const Bytes a = make_bytes(300, 1);
    const Bytes b = make_bytes(300, 2);
    r.feed_all(frames_for("M1", a), 0, "left");
    r.feed_all(frames_for("M1", b), 0, "right");

    CompletedMessage c1, c2;
    REQUIRE(r.q.get_completed(c1));
    REQUIRE(r.q.get_completed(c2));
    CHECK(c1.source_device_id == "left");
    CHECK(c1.payload == a);
    CHECK(c2.source_device_id == "right");
    CHECK(c2.payload == b);
    CHECK(r.link.frames[0].device == "left");
    CHECK(r.link.frames[1].device == "right");
}

TEST_CASE("Interleaved messages from one device both complete") {
    Receiver r;
    const Bytes a = make_bytes(400, 11);
    const Bytes b = make_bytes(400, 12);
    const std::vector<Bytes> fa = frames_for("A", a);
    const std::vector<Bytes> fb = frames_for("B", b);
    for (size_t i = 0; i < fa.size(); ++i) {
        r.feed(fa[i]);
        r.feed(fb[i]);
    }
    CHECK(r.link.receipts().size() == 2);

    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == a);
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == b);
}

TEST_CASE("Compressed messages are inflated on completion") {
    Receiver r;
    const Bytes text = make_text(4000);
    const std::vector<Bytes> frames = frames_for("Z", text, 100, true);
    CHECK(frames.size() < 41);

    r.feed_all(frames);
    CompletedMessage c;
    REQUIRE(r.q.get_completed(c));
    CHECK(c.payload == text);
    CHECK(r.logs.line_with({"event=incoming_start", "compressed=1"}));
}

TEST_CASE("A parcel index beyond the header's count is logged and dropped") {
    Receiver r;
    const std::vector<Bytes> frames = frames_for("M1", make_bytes(200));
    r.feed(frames[0]);
    r.feed(encode(Parcel::data_parcel(MsgIdStr("M1"), 5, Bytes{1, 2, 3})));

    CHECK(r.logs.line_with({"event=parcel_out_of_range", "parcel=5", "total=2"}));
    CHECK(r.q.incoming_count("peer") == 1);
    CHECK(r.link.frames.empty());
}

TEST_CASE("Malformed frames are logged and never answered") {
    Receiver r;
    r.feed(Bytes{0x01, 0x05});
    r.feed(Bytes{0x02, 0x01});
    r.feed(Bytes{0x03, 'n', 'o', 't', ' ', 'j', 's', 'o', 'n'});
    r.feed(Bytes{0x7F, 0x00});
    r.q.on_data_received("peer", nullptr, 0, 0);

    CHECK(r.logs.line_with({"event=frame_dropped", "reason=malformed_header"}));
    CHECK(r.logs.line_with({"event=frame_dropped", "reason=malformed_data"}));
    CHECK(r.logs.line_with({"event=frame_dropped", "reason=malformed_receipt"}));
    CHECK(r.logs.line_with({"event=frame_dropped", "reason=unknown_frame_type", "type=127"}));
    CHECK(r.logs.line_with({"event=frame_dropped", "reason=empty"}));
    CHECK(r.link.frames.empty());
    CHECK(r.q.incoming_count("peer") == 0);
}

TEST_CASE("Unsolicited complete and checksumFailed receipts are only logged") {
    Receiver r;
    r.feed(encode_receipt(Receipt::complete(MsgIdStr("NOPE"))));
    r.feed(encode_receipt(Receipt::checksum_failed(MsgIdStr("NOPE"))));
    CHECK(r.logs.count("event=receipt_unsolicited") == 2);

    SendOutcome o;
    CHECK_FALSE(r.q.get_outcome(o));
    CHECK(r.link.frames.empty());
}

TEST_CASE("A receipt that cannot be written is logged; the message still completes") {
    Receiver r;
    r.link.result = TxResult::Busy;
    r.feed_all(frames_for("M1", make_bytes(100)));

    CHECK(r.logs.line_with({"event=receipt_send_failed", "status=complete", "result=busy"}));
    CompletedMessage c;
    CHECK(r.q.get_completed(c));
}

// ---------- completed delivery ----------

TEST_CASE("A completed handler replaces the outbox") {
    Receiver r;
    std::vector<CompletedMessage> got;
    r.q.set_completed_handler([&](const CompletedMessage& m) { got.push_back(m); });

    r.feed_all(frames_for("A", make_bytes(150)));
    r.feed_all(frames_for("B", make_bytes(150)));
    REQUIRE(got.size() == 2);
    CHECK(got[0].msg_id == MsgIdStr("A"));
    CHECK(got[1].msg_id == MsgIdStr("B"));

    CompletedMessage c;
    CHECK_FALSE(r.q.get_completed(c));
}

TEST_CASE("The handler runs after the receipt and may cancel the device") {
    Receiver r;
    REQUIRE(r.q.enqueue(harness::outgoing("peer", "OUT", make_bytes(10))));

    size_t frames_seen = 0;
    r.q.set_completed_handler([&](const CompletedMessage& m) {
        frames_seen = r.link.frames.size();
        CHECK(r.q.cancel_device(m.source_device_id));
    });

    r.feed_all(frames_for("M1", make_bytes(300)));
    CHECK(frames_seen == 1);                   // our complete receipt went first
    CHECK(r.q.queue_length("peer") == 0);

    SendOutcome o;
    REQUIRE(r.q.get_outcome(o));
    CHECK(o.msg_id == MsgIdStr("OUT"));
    CHECK(o.reason == OutcomeReason::Cancelled);

    // the device is gone, so the next message starts from scratch
    r.feed_all(frames_for("M2", make_bytes(100)));
    CHECK(r.link.receipts().size() == 2);
}

TEST_CASE("The handler may enqueue a reply") {
    Receiver r;
    r.q.set_completed_handler([&](const CompletedMessage& m) {
        CHECK(r.q.enqueue(harness::outgoing(m.source_device_id.c_str(), "ACK", Bytes{'o', 'k'})));
    });
    r.feed_all(frames_for("M1", make_bytes(100)));
    CHECK(r.q.queue_length("peer") == 1);

    r.q.tick(0);
    CHECK(r.link.header_count() == 1);
}

TEST_CASE("A throwing handler is contained") {
    Receiver r;
    r.q.set_completed_handler([](const CompletedMessage&) { throw std::runtime_error("boom"); });
    CHECK_NOTHROW(r.feed_all(frames_for("M1", make_bytes(100))));
    CHECK(r.logs.line_with({"event=completed_handler_threw", "what=boom"}));
    CHECK(r.link.receipts().size() == 1);
}

TEST_CASE("The completed outbox holds 16; the next one is dropped and logged") {
    Receiver r;
    for (int i = 0; i < 17; ++i) {
        const std::string id = "E" + std::to_string(i);
        r.feed_all(frames_for(id.c_str(), Bytes{}));
    }
    CHECK(r.logs.line_with({"event=completed_dropped", "msg=E16", "reason=outbox_full"}));

    size_t n = 0;
    CompletedMessage c;
    while (r.q.get_completed(c)) ++n;
    CHECK(n == 16);
    CHECK(c.msg_id == MsgIdStr("E15"));
}
