#pragma once

#include "core/types.hpp"
#include "network/device_registry.hpp"

#include <QElapsedTimer>

#include <algorithm>
#include <chrono>
#include <optional>

namespace scout::network {

/**
 * ScanSession - state of one scan run, from bind to release.
 *
 * Owned by the engine for the life of the scan; the registry is never shared
 * with another session.
 */
struct ScanSession {
    QElapsedTimer clock;
    // Relative to `clock`; unset for a continuous session.
    std::optional<std::chrono::milliseconds> deadline;
    int probes_sent = 0;
    DeviceRegistry registry;

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return clock.isValid() ? std::chrono::milliseconds{clock.elapsed()} : std::chrono::milliseconds{0};
    }

    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline) return std::nullopt;
        return std::max(std::chrono::milliseconds{0}, *deadline - elapsed());
    }
};

} // namespace scout::network
