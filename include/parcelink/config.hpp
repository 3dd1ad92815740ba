/**
 * @file config.hpp
 * @brief parcelink tunables: pacing, retry budgets, retention and housekeeping windows.
 *
 * @details
 * All durations are milliseconds on the host's monotonic clock (the same clock
 * passed to `ParcelQueue::tick()`). Defaults were chosen on real BLE links with
 * ~280 byte writes and are slow. On a clean link you can drop
 * `inter_parcel_delay_ms` a lot; on a congested one, raise `listen_window_ms`
 * before anything else.
 *
 * @par Retry budgets
 * Two independent budgets bound the work spent on one message:
 * - `max_retries`      : message-level attempts. An attempt fails on receipt
 *                         timeout or when it runs out of resend cycles.
 * - `max_resend_cycles`: bursts within one attempt. The first burst counts; each
 *                         `missing` or `checksumFailed` receipt that triggers
 *                         another burst consumes one more. 0 means unbounded
 *                         (the receipt timeout still ends a silent attempt).
 */
#ifndef PARCELINK_CONFIG_HPP
#define PARCELINK_CONFIG_HPP

#include <stdint.h>
#include <stddef.h>

namespace parcelink {

struct Config {
  size_t   max_parcel_size{276};                    ///< payload bytes carried per data parcel
  uint8_t  max_retries{3};                          ///< message-level attempts before drop
  uint8_t  max_resend_cycles{3};                    ///< bursts per attempt (0 = unbounded)
  uint32_t inter_parcel_delay_ms{500};              ///< gap after each parcel write
  uint16_t parcels_before_pause{5};                 ///< listen window after every N parcels
  uint32_t listen_window_ms{200};                   ///< channel time yielded to the peer
  uint32_t receipt_timeout_ms{10000};               ///< bounded wait for a receipt
  uint32_t retry_backoff_ms{1000};                  ///< pause before the next attempt
  uint32_t sent_message_retention_ms{120000};       ///< how long sent parcels stay replayable
  uint32_t missing_parcel_request_delay_ms{5000};   ///< silence before nudging a stalled sender
  uint32_t incomplete_message_timeout_ms{60000};    ///< silence before abandoning a reassembly
  uint32_t housekeeping_interval_ms{10000};         ///< period of the retention/stall sweep
  size_t   compression_threshold{300};              ///< payloads below this are never compressed
  uint32_t msg_id_seed{0};                          ///< id seed read at construction (0 = from the clock)

  /// Rejects settings the pipeline cannot run with.
  bool is_valid() const {
    return max_parcel_size > 0 && max_retries > 0 && parcels_before_pause > 0;
  }
};

/**
 * @brief Elapsed milliseconds between two readings of a 32-bit monotonic clock.
 *
 * Unsigned subtraction keeps this correct across the 2^32 wrap as long as the
 * two readings are less than ~49 days apart.
 */
inline uint32_t elapsed_ms(uint32_t now_ms, uint32_t then_ms) {
  return static_cast<uint32_t>(now_ms - then_ms);
}

/// True once `now_ms` has reached `deadline_ms` (wrap-safe).
inline bool deadline_reached(uint32_t now_ms, uint32_t deadline_ms) {
  return static_cast<int32_t>(now_ms - deadline_ms) >= 0;
}

} // namespace parcelink

#endif // PARCELINK_CONFIG_HPP
