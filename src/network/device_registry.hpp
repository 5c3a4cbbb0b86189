#pragma once

#include "network/device_record.hpp"

#include <QHash>
#include <QHostAddress>
#include <QRecursiveMutex>

#include <functional>
#include <optional>
#include <vector>

namespace scout::network {

enum class MergeOutcome {
    Inserted,
    Updated,
};

[[nodiscard]] const char* to_string(MergeOutcome outcome);

/**
 * DeviceRegistry - address-keyed store of discovered devices for one scan.
 *
 * merge() is last-write-wins in call order: the later response replaces
 * the fields and `last_seen` of the earlier one, whatever their wall-clock
 * stamps say. snapshot() returns records in first-seen order.
 *
 * Listeners are invoked synchronously from merge() while the registry lock
 * is held, so merges stay serialized and listeners see them in merge order.
 * They must not block. The lock is recursive: a listener may read the
 * registry (or stop the scan that feeds it) from the merging thread. A
 * listener added during a merge is first called on the next one.
 */
class DeviceRegistry {
public:
    using Listener = std::function<void(const DeviceRecord&, MergeOutcome)>;

    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    MergeOutcome merge(DeviceRecord record);

    [[nodiscard]] std::vector<DeviceRecord> snapshot() const;
    [[nodiscard]] std::optional<DeviceRecord> find(const QHostAddress& address) const;
    [[nodiscard]] bool contains(const QHostAddress& address) const;
    [[nodiscard]] size_t size() const;

    void add_listener(Listener listener);

private:
    mutable QRecursiveMutex mu_;
    std::vector<DeviceRecord> records_;
    QHash<QHostAddress, size_t> index_;
    std::vector<Listener> listeners_;
};

} // namespace scout::network
