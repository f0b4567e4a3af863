#pragma once
/**
 * @file config.hpp
 * @brief Link settings: device paths, serial timing and handshake policy.
 *
 * @details
 * Settings come from three places, later ones win:
 *   1. the defaults below,
 *   2. an optional JSON file (--config),
 *   3. CLI flags.
 *
 * JSON FORMAT
 * -----------
 * @code
 *   {
 *     "device": "/dev/serial/by-id/usb-VEX_Robotics__Inc_VEX_Robotics_V5_Brain-if00",
 *     "user_device": "/dev/ttyACM1",
 *     "baud": 115200,
 *     "boot_delay_ms": 400,
 *     "timeout_ms": 1000,
 *     "retries": 5,
 *     "log_level": "warn"
 *   }
 * @endcode
 *
 * Unknown keys are ignored. Every key is optional. A present key with the
 * wrong JSON type fails the whole load with err = "bad_type:<key>", and an
 * out-of-range value with err = "bad_value:<key>".
 */

#include <string>

namespace v5link {

struct LinkConfig {
  std::string device{"/dev/ttyACM0"};  // system channel
  std::string user_device;             // user channel, empty if not used
  int         baud{115200};
  int         boot_delay_ms{400};
  int         timeout_ms{1000};        // per handshake attempt
  int         retries{5};              // handshake attempts
  std::string log_level{"warn"};
};

/// Parse JSON text over @p cfg. On failure @p cfg is unchanged and @p err is set.
bool parse_config(const std::string& text, LinkConfig& cfg, std::string& err);

/// Read @p path and parse_config() it. Missing file gives err = "open_failed".
bool load_config(const std::string& path, LinkConfig& cfg, std::string& err);

} // namespace v5link
