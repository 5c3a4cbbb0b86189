#pragma once

#include "core/result.hpp"
#include "network/wire_codec.hpp"

#include <QHostAddress>

#include <chrono>
#include <optional>

namespace scout::network {

inline constexpr std::chrono::milliseconds kDefaultScanTimeout{10000};
// Probes per scan window when no interval is configured.
inline constexpr int kProbesPerTimeout = 3;
inline constexpr std::chrono::milliseconds kContinuousProbeInterval{3000};

/**
 * ScanConfig - immutable settings for one scan session.
 */
struct ScanConfig {
    std::chrono::milliseconds timeout{kDefaultScanTimeout};
    // Unset: timeout / kProbesPerTimeout, or kContinuousProbeInterval when continuous.
    std::optional<std::chrono::milliseconds> probe_interval;

    quint16 port = kDiscoveryPort;        // devices listen here
    quint16 local_port = kDiscoveryPort;  // devices answer here; 0 = ephemeral
    QHostAddress bind_address{QHostAddress::AnyIPv4};
    QHostAddress broadcast_address{QHostAddress::Broadcast};

    // Probe this host only. A bounded scan stops as soon as it answers.
    std::optional<QHostAddress> target_address;

    // No deadline; probe on the interval until cancelled.
    bool continuous = false;

    WireSchema schema;

    [[nodiscard]] std::chrono::milliseconds effective_probe_interval() const;
    [[nodiscard]] QHostAddress destination() const;
};

[[nodiscard]] Result<void> validate(const ScanConfig& config);

// Overlays SCOUT_* environment variables onto `config`.
[[nodiscard]] Result<ScanConfig> apply_environment(ScanConfig config);

} // namespace scout::network
