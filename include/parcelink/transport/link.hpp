#pragma once
/**
 * @file link.hpp
 * @brief The one outbound contract between ParcelQueue and a BLE stack.
 *
 * ParcelQueue never owns a radio. It hands each encoded frame to a send
 * function supplied by the host and reads back a TxResult. Inbound bytes come
 * the other way through ParcelQueue::on_data_received().
 *
 * Contract for a SendFn:
 *  - `device_id` names the remote peer the frame is for.
 *  - One call is one link write; the frame fits the negotiated MTU.
 *  - Return quickly. Busy and Error are both "this frame did not leave"; the
 *    protocol recovers it through a `missing` receipt.
 *  - Do not throw. A std::exception that escapes is caught and counted as Error.
 *  - Do not deliver the peer's reply synchronously from inside the call if you
 *    can avoid it; if you do, the queue defers it to the next tick().
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace parcelink::transport {

// Return codes kept simple for embedded sanity.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

inline const char* tx_result_name(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "unknown";
}

using SendFn = std::function<TxResult(const std::string& device_id,
                                      const uint8_t* data, std::size_t len)>;

} // namespace parcelink::transport
