#include <doctest/doctest.h>
#include "harness.hpp"

using namespace parcelink;
using harness::CaptureLink;
using harness::LogCapture;
using harness::frames_for;
using harness::make_bytes;

namespace {

Config sweep_config() {
    Config c;                                  // 5 s nudge delay, 60 s abandonment
    c.housekeeping_interval_ms = 1000;
    return c;
}

// Tick every 100 ms over [from, to].
void run_coarse(ParcelQueue& q, uint32_t from, uint32_t to) {
    for (uint32_t t = from; t <= to; t += 100) q.tick(t);
}

} // namespace

TEST_CASE("A stalled reassembly is nudged, rate limited, then abandoned") {
    CaptureLink link;
    LogCapture logs;
    ParcelQueue q(link.fn(), sweep_config());
    logs.attach(q.logger());

    const std::vector<Bytes> frames = frames_for("S1", make_bytes(300));
    q.tick(0);
    q.on_data_received("peer", frames[0], 1000);
    q.on_data_received("peer", frames[1], 1000);
    CHECK(q.incoming_count("peer") == 1);

    run_coarse(q, 100, 6900);
    CHECK(link.frames.empty());                // exactly 5 s of silence is not a stall

    q.tick(7000);
    auto receipts = link.receipts();
    REQUIRE(receipts.size() == 1);
    CHECK(receipts[0].msg_id == MsgIdStr("S1"));
    CHECK(receipts[0].status == ReceiptStatus::Missing);
    CHECK(receipts[0].missing_parcels == std::vector<uint16_t>{1, 2});
    CHECK(link.frames[0].device == "peer");
    CHECK(logs.line_with({"event=missing_requested", "msg=S1", "count=2"}));

    run_coarse(q, 7100, 12900);
    CHECK(link.receipts().size() == 1);
    q.tick(13000);
    CHECK(link.receipts().size() == 2);

    run_coarse(q, 13100, 61900);
    CHECK(q.incoming_count("peer") == 1);
    CHECK(link.receipts().size() == 10);       // 7 s, then every 6 s up to 61 s

    q.tick(62000);
    CHECK(q.incoming_count("peer") == 0);
    CHECK(link.receipts().size() == 10);       // abandoned without a receipt
    CHECK(logs.line_with({"event=incoming_abandoned", "msg=S1", "received=1", "total=3"}));
}

TEST_CASE("Fresh parcels push the nudge back") {
    CaptureLink link;
    ParcelQueue q(link.fn(), sweep_config());
    q.logger().set_level(LogLevel::Off);

    const std::vector<Bytes> frames = frames_for("S2", make_bytes(400));
    q.tick(0);
    q.on_data_received("peer", frames[0], 1000);
    run_coarse(q, 100, 6400);
    q.on_data_received("peer", frames[1], 6500);

    run_coarse(q, 6500, 11900);
    CHECK(link.frames.empty());
    q.tick(12000);
    REQUIRE(link.receipts().size() == 1);
    CHECK(link.receipts()[0].missing_parcels == std::vector<uint16_t>{1, 2, 3});

    // a duplicate is still link activity
    q.on_data_received("peer", frames[1], 12500);
    run_coarse(q, 12100, 17900);
    CHECK(link.receipts().size() == 1);
    q.tick(18000);
    CHECK(link.receipts().size() == 2);
}

TEST_CASE("Headerless parcels are abandoned after the incomplete timeout") {
    CaptureLink link;
    LogCapture logs;
    ParcelQueue q(link.fn(), sweep_config());
    logs.attach(q.logger());

    q.tick(0);
    q.on_data_received("peer", encode(Parcel::data_parcel(MsgIdStr("LOST"), 4, Bytes{1, 2})), 1000);
    CHECK(q.orphan_count("peer") == 1);

    run_coarse(q, 100, 61900);
    CHECK(q.orphan_count("peer") == 1);
    q.tick(62000);
    CHECK(q.orphan_count("peer") == 0);
    CHECK(logs.line_with({"event=orphans_abandoned", "count=1"}));
    CHECK(link.frames.empty());                // orphans are never nudged
}

TEST_CASE("Sent records expire after the retention window") {
    Config c = harness::fast_config();
    c.sent_message_retention_ms = 1000;
    c.housekeeping_interval_ms = 500;
    CaptureLink link;
    LogCapture logs;
    ParcelQueue q(link.fn(), c);
    logs.attach(q.logger());

    REQUIRE(q.enqueue(harness::outgoing("peer", "R1", make_bytes(100))));
    q.tick(0);
    q.on_data_received("peer", encode_receipt(Receipt::complete(MsgIdStr("R1"))), 20);
    REQUIRE(q.has_sent_record(MsgIdStr("R1")));

    harness::run(q, 1, 1499);
    CHECK(q.has_sent_record(MsgIdStr("R1")));
    q.tick(1500);
    CHECK_FALSE(q.has_sent_record(MsgIdStr("R1")));
    CHECK(logs.line_with({"event=sent_record_expired", "msg=R1"}));
}

TEST_CASE("The first tick starts the housekeeping clock") {
    Config c = harness::fast_config();
    c.sent_message_retention_ms = 100;
    c.housekeeping_interval_ms = 1000;
    CaptureLink link;
    ParcelQueue q(link.fn(), c);
    q.logger().set_level(LogLevel::Off);

    REQUIRE(q.enqueue(harness::outgoing("peer", "R2", make_bytes(50))));
    q.tick(5000);
    q.on_data_received("peer", encode_receipt(Receipt::complete(MsgIdStr("R2"))), 5001);

    harness::run(q, 5001, 5999);
    CHECK(q.has_sent_record(MsgIdStr("R2")));
    q.tick(6000);
    CHECK_FALSE(q.has_sent_record(MsgIdStr("R2")));
}

TEST_CASE("housekeep() can be driven directly") {
    CaptureLink link;
    ParcelQueue q(link.fn(), sweep_config());
    q.logger().set_level(LogLevel::Off);

    const std::vector<Bytes> frames = frames_for("S3", make_bytes(200));
    q.on_data_received("peer", frames[0], 0);

    q.housekeep(5000);
    CHECK(link.frames.empty());
    q.housekeep(5001);
    REQUIRE(link.receipts().size() == 1);
    CHECK(link.receipts()[0].missing_parcels == std::vector<uint16_t>{0, 1});

    q.housekeep(60001);
    CHECK(q.incoming_count("peer") == 0);
}

TEST_CASE("A sent record refreshed by a resend outlives the original send time") {
    Config c = harness::fast_config();
    c.sent_message_retention_ms = 1000;
    c.housekeeping_interval_ms = 100;
    c.receipt_timeout_ms = 5000;
    CaptureLink link;
    ParcelQueue q(link.fn(), c);
    q.logger().set_level(LogLevel::Off);

    REQUIRE(q.enqueue(harness::outgoing("peer", "R3", make_bytes(300))));
    harness::run(q, 0, 800);
    q.on_data_received("peer", encode_receipt(Receipt::missing(MsgIdStr("R3"), {1})), 800);
    harness::run(q, 801, 1500);
    CHECK(q.has_sent_record(MsgIdStr("R3")));
    harness::run(q, 1501, 1900);
    CHECK_FALSE(q.has_sent_record(MsgIdStr("R3")));
}

TEST_CASE("request_missing nudges one message on demand") {
    CaptureLink link;
    LogCapture logs;
    ParcelQueue q(link.fn(), sweep_config());
    logs.attach(q.logger());

    const std::vector<Bytes> frames = frames_for("S4", make_bytes(300));
    q.tick(1000);
    q.on_data_received("peer", frames[0], 1000);
    q.on_data_received("peer", frames[2], 1000);

    CHECK_FALSE(q.request_missing("peer", MsgIdStr("NOPE")));
    CHECK_FALSE(q.request_missing("other", MsgIdStr("S4")));
    CHECK(link.frames.empty());

    q.tick(2000);
    REQUIRE(q.request_missing("peer", MsgIdStr("S4")));
    const auto receipts = link.receipts();
    REQUIRE(receipts.size() == 1);
    CHECK(receipts[0].status == ReceiptStatus::Missing);
    CHECK(receipts[0].missing_parcels == std::vector<uint16_t>{0, 2});
    CHECK(link.frames[0].device == "peer");
    CHECK(logs.line_with({"event=missing_requested", "msg=S4", "count=2", "on_demand=1"}));

    // the sweep waits a full delay from the on-demand request
    run_coarse(q, 2100, 7000);
    CHECK(link.receipts().size() == 1);
    q.tick(8000);
    CHECK(link.receipts().size() == 2);

    // nothing left to ask for once the message completes
    q.on_data_received("peer", frames[1], 8100);
    q.on_data_received("peer", frames[3], 8100);
    CHECK(q.incoming_count("peer") == 0);
    CHECK_FALSE(q.request_missing("peer", MsgIdStr("S4")));
}
