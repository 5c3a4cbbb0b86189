#pragma once

#include "network/device_record.hpp"
#include "network/device_registry.hpp"

#include <QString>

#include <vector>

namespace scout::cli {

// One "address, field, field, ..." line per device, in the order given.
[[nodiscard]] QString format_device_lines(const std::vector<network::DeviceRecord>& devices);

// JSON output:
// [
//   { "address": "10.0.0.5", "fields": { "hostname": ..., ... }, "lastSeen": "<iso8601>" }
// ]
[[nodiscard]] QString format_devices_json(const std::vector<network::DeviceRecord>& devices);

// Listen mode: "+ address, fields..." for a new device, "~ ..." for a repeat.
[[nodiscard]] QString format_device_event(const network::DeviceRecord& device, network::MergeOutcome outcome);

// Listen mode with --json: one compact object per line with an "event" key.
[[nodiscard]] QString format_device_event_json(const network::DeviceRecord& device, network::MergeOutcome outcome);

} // namespace scout::cli
