#include <doctest/doctest.h>
#include "parcelink/receipt.hpp"

#include <string>

using namespace parcelink;

TEST_CASE("Receipt JSON matches the wire shape") {
    CHECK(to_json(Receipt::complete(MsgIdStr("AB"))) == R"({"msg_id":"AB","status":"complete"})");
    CHECK(to_json(Receipt::checksum_failed(MsgIdStr("AB"))) == R"({"msg_id":"AB","status":"checksumFailed"})");
    CHECK(to_json(Receipt::missing(MsgIdStr("AB"), {2, 5})) ==
          R"({"msg_id":"AB","parcels":[2,5],"status":"missing"})");
}

TEST_CASE("Receipt frames carry the receipt type byte and decode back") {
    Bytes wire = encode_receipt(Receipt::missing(MsgIdStr("QHZKTA"), {0, 7, 65535}));
    REQUIRE(!wire.empty());
    CHECK(wire[0] == static_cast<uint8_t>(FrameType::Receipt));

    auto r = decode_receipt(wire);
    REQUIRE(r.has_value());
    CHECK(r->msg_id == MsgIdStr("QHZKTA"));
    CHECK(r->status == ReceiptStatus::Missing);
    CHECK(r->missing_parcels == std::vector<uint16_t>{0, 7, 65535});
}

TEST_CASE("Status names round trip") {
    for (auto s : {ReceiptStatus::Complete, ReceiptStatus::Missing, ReceiptStatus::ChecksumFailed}) {
        auto back = status_from_name(status_name(s));
        REQUIRE(back.has_value());
        CHECK(*back == s);
    }
    CHECK_FALSE(status_from_name("Complete").has_value());
    CHECK_FALSE(status_from_name("").has_value());
}

TEST_CASE("from_json accepts extra keys and a missing list without parcels") {
    auto r = from_json(R"({"status":"missing","msg_id":"X1","extra":true})");
    REQUIRE(r.has_value());
    CHECK(r->status == ReceiptStatus::Missing);
    CHECK(r->missing_parcels.empty());

    // parcels on a complete receipt are ignored
    auto c = from_json(R"({"msg_id":"X1","status":"complete","parcels":[1]})");
    REQUIRE(c.has_value());
    CHECK(c->missing_parcels.empty());
}

TEST_CASE("from_json rejects anything that is not a well-formed receipt") {
    CHECK_FALSE(from_json("").has_value());
    CHECK_FALSE(from_json("not json").has_value());
    CHECK_FALSE(from_json("[1,2,3]").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB"})").has_value());
    CHECK_FALSE(from_json(R"({"status":"complete"})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB","status":"done"})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":12,"status":"complete"})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"","status":"complete"})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"a b","status":"complete"})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB","status":"missing","parcels":"3"})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB","status":"missing","parcels":[-1]})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB","status":"missing","parcels":[65536]})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB","status":"missing","parcels":[1.5]})").has_value());
    CHECK_FALSE(from_json(R"({"msg_id":"AB","status":"missing","parcels":["1"]})").has_value());
}

TEST_CASE("decode_receipt rejects non-receipt frames and empty bodies") {
    CHECK_FALSE(decode_receipt(Bytes{0x03}).has_value());
    CHECK_FALSE(decode_receipt(Bytes{0x01, '{', '}'}).has_value());

    const std::string body = R"({"msg_id":"AB","status":"complete"})";
    Bytes raw(body.begin(), body.end());           // JSON without the type byte
    CHECK_FALSE(decode_receipt(raw).has_value());
}
