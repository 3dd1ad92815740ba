/**
 * @file receipt.cpp
 * @brief JSON (de)serialization for receipts, with the nlohmann / ArduinoJson split.
 *
 * @details
 *   - Desktop/Linux builds (no @c ARDUINO) use nlohmann::json. Parse errors and
 *     type errors surface as exceptions inside the library; they are caught here
 *     and turned into std::nullopt so callers never see them.
 *   - Embedded builds use ArduinoJson with a StaticJsonDocument sized for a
 *     receipt with a few dozen missing indices.
 *
 *   Validation is strict on the fields that matter: `msg_id` must be a valid
 *   message id, `status` must be one of the three names, and every entry of
 *   `parcels` must be an integer in 0..65535. Anything else is "not a receipt".
 */
#include "parcelink/receipt.hpp"

#include <utility>

#ifdef ARDUINO

#include <ArduinoJson.hpp>
using ArduinoJson::StaticJsonDocument;
using ArduinoJson::deserializeJson;
using ArduinoJson::serializeJson;
using ArduinoJson::JsonArray;
using ArduinoJson::JsonObject;
using ArduinoJson::JsonVariant;

#else

#include <nlohmann/json.hpp>
using nlohmann::json;

#endif

namespace parcelink {

namespace {

#ifdef ARDUINO
// Room for the id, the status and roughly 48 missing indices.
constexpr size_t RECEIPT_DOC_CAP = 768;
#endif

bool to_msg_id(const std::string& s, MsgIdStr& out) {
  if (!is_valid_msg_id(s.c_str(), s.size())) return false;
  out.assign(s.c_str(), s.size());
  return true;
}

} // namespace

// ---------- status names ----------

const char* status_name(ReceiptStatus status) {
  switch (status) {
    case ReceiptStatus::Complete:       return "complete";
    case ReceiptStatus::Missing:        return "missing";
    case ReceiptStatus::ChecksumFailed: return "checksumFailed";
  }
  return "unknown";
}

std::optional<ReceiptStatus> status_from_name(const std::string& name) {
  if (name == "complete")       return ReceiptStatus::Complete;
  if (name == "missing")        return ReceiptStatus::Missing;
  if (name == "checksumFailed") return ReceiptStatus::ChecksumFailed;
  return std::nullopt;
}

// ---------- factories ----------

Receipt Receipt::complete(const MsgIdStr& id) {
  Receipt r;
  r.msg_id = id;
  r.status = ReceiptStatus::Complete;
  return r;
}

Receipt Receipt::missing(const MsgIdStr& id, std::vector<uint16_t> parcels) {
  Receipt r;
  r.msg_id = id;
  r.status = ReceiptStatus::Missing;
  r.missing_parcels = std::move(parcels);
  return r;
}

Receipt Receipt::checksum_failed(const MsgIdStr& id) {
  Receipt r;
  r.msg_id = id;
  r.status = ReceiptStatus::ChecksumFailed;
  return r;
}

// ---------- JSON ----------

/**
 * @brief Serialize a receipt body.
 *
 * @details
 *   `parcels` is only written for Missing receipts. On desktop, dump() runs with
 *   the replace error handler so an unexpected byte in the id can never throw.
 */
std::string to_json(const Receipt& receipt) {
#ifdef ARDUINO
  StaticJsonDocument<RECEIPT_DOC_CAP> doc;
  JsonObject obj = doc.to<JsonObject>();

  obj["msg_id"] = receipt.msg_id.c_str();
  obj["status"] = status_name(receipt.status);
  if (receipt.status == ReceiptStatus::Missing) {
    JsonArray arr = obj.createNestedArray("parcels");
    for (uint16_t idx : receipt.missing_parcels) {
      if (!arr.add(idx)) break;                 // document full: send what fits
    }
  }

  std::string out;
  out.reserve(doc.capacity());
  serializeJson(obj, out);
  return out;
#else
  json j;
  j["msg_id"] = std::string(receipt.msg_id.c_str());
  j["status"] = status_name(receipt.status);
  if (receipt.status == ReceiptStatus::Missing) {
    j["parcels"] = receipt.missing_parcels;
  }
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
#endif
}

/**
 * @brief Parse a receipt body.
 * @return The receipt, or std::nullopt if anything about the body is off.
 */
std::optional<Receipt> from_json(const std::string& json_str) {
#ifdef ARDUINO
  StaticJsonDocument<RECEIPT_DOC_CAP> doc;
  auto error = deserializeJson(doc, json_str);
  if (error) return std::nullopt;
  if (!doc.is<JsonObject>()) return std::nullopt;

  JsonObject obj = doc.as<JsonObject>();
  if (!obj["msg_id"].is<const char*>() || !obj["status"].is<const char*>()) {
    return std::nullopt;
  }

  Receipt r;
  if (!to_msg_id(obj["msg_id"].as<std::string>(), r.msg_id)) return std::nullopt;

  auto status = status_from_name(obj["status"].as<std::string>());
  if (!status) return std::nullopt;
  r.status = *status;

  if (r.status == ReceiptStatus::Missing && !obj["parcels"].isNull()) {
    if (!obj["parcels"].is<JsonArray>()) return std::nullopt;
    for (JsonVariant v : obj["parcels"].as<JsonArray>()) {
      if (!v.is<long>()) return std::nullopt;
      const long idx = v.as<long>();
      if (idx < 0 || idx > 0xFFFF) return std::nullopt;
      r.missing_parcels.push_back(static_cast<uint16_t>(idx));
    }
  }
  return r;
#else
  try {
    auto j = json::parse(json_str);
    if (!j.is_object()) return std::nullopt;

    auto id_it = j.find("msg_id");
    auto st_it = j.find("status");
    if (id_it == j.end() || st_it == j.end()) return std::nullopt;
    if (!id_it->is_string() || !st_it->is_string()) return std::nullopt;

    Receipt r;
    if (!to_msg_id(id_it->get<std::string>(), r.msg_id)) return std::nullopt;

    auto status = status_from_name(st_it->get<std::string>());
    if (!status) return std::nullopt;
    r.status = *status;

    auto p_it = j.find("parcels");
    if (r.status == ReceiptStatus::Missing && p_it != j.end() && !p_it->is_null()) {
      if (!p_it->is_array()) return std::nullopt;
      for (const auto& v : *p_it) {
        if (!v.is_number_integer()) return std::nullopt;
        const int64_t idx = v.get<int64_t>();
        if (idx < 0 || idx > 0xFFFF) return std::nullopt;
        r.missing_parcels.push_back(static_cast<uint16_t>(idx));
      }
    }
    return r;
  }
  catch (const json::exception&) {
    // malformed JSON or a type mismatch inside the library
    return std::nullopt;
  }
#endif
}

// ---------- frames ----------

Bytes encode_receipt(const Receipt& receipt) {
  const std::string body = to_json(receipt);
  Bytes out;
  out.reserve(body.size() + 1);
  out.push_back(static_cast<uint8_t>(FrameType::Receipt));
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

std::optional<Receipt> decode_receipt(const uint8_t* data, size_t len) {
  if (frame_type(data, len) != FrameType::Receipt) return std::nullopt;
  if (len < 2) return std::nullopt;
  const std::string body(reinterpret_cast<const char*>(data + 1), len - 1);
  return from_json(body);
}

} // namespace parcelink
