#pragma once

#include "core/result.hpp"
#include "network/datagram_transport.hpp"
#include "network/device_registry.hpp"
#include "network/discovery_engine.hpp"
#include "network/scan_cancellation.hpp"
#include "network/scan_config.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace scout::network {

using DeviceCallback = std::function<void(const DeviceRecord&, MergeOutcome)>;
using TransportFactory = std::function<std::unique_ptr<DatagramTransport>()>;

/**
 * ListenerHandle - owns a running continuous scan.
 *
 * Destroying or cancelling the handle stops the engine and releases the
 * socket before returning. The device callback may call cancel(), but must
 * not destroy or reassign the handle: the engine is still inside its merge.
 */
class ListenerHandle {
public:
    ListenerHandle() = default;
    explicit ListenerHandle(std::unique_ptr<DiscoveryEngine> engine);
    ~ListenerHandle();

    ListenerHandle(ListenerHandle&&) noexcept = default;
    ListenerHandle& operator=(ListenerHandle&& other) noexcept;
    ListenerHandle(const ListenerHandle&) = delete;
    ListenerHandle& operator=(const ListenerHandle&) = delete;

    void cancel();

    [[nodiscard]] bool is_active() const;
    [[nodiscard]] quint16 local_port() const;
    [[nodiscard]] int probes_sent() const;
    [[nodiscard]] std::vector<DeviceRecord> snapshot() const;
    [[nodiscard]] DiscoveryEngine* engine() const { return engine_.get(); }

private:
    std::unique_ptr<DiscoveryEngine> engine_;
};

/**
 * ScanOrchestrator - entry point for running scans.
 *
 * Both operations need a Qt event loop on the calling thread's
 * QCoreApplication: discover_once() spins a local loop until the scan
 * completes, start_continuous_listener() relies on the caller's loop.
 *
 * Device callbacks run synchronously inside the registry merge; they must
 * not block.
 */
class ScanOrchestrator {
public:
    explicit ScanOrchestrator(TransportFactory transport_factory = {});

    /**
     * Run one bounded scan and return every device that answered, in
     * first-seen order. `on_device` fires once per newly found device.
     * Only socket failures are reported as errors; finding nothing is success.
     *
     * Cancelling through `cancellation` ends the scan early and returns the
     * devices found so far. A token cancelled before the call skips the scan.
     */
    [[nodiscard]] Result<std::vector<DeviceRecord>, TransportError>
    discover_once(const ScanConfig& config,
                  DeviceCallback on_device = {},
                  ScanCancellation* cancellation = nullptr) const;

    /**
     * Start an unbounded scan; `on_device` fires on every insert and update.
     */
    [[nodiscard]] Result<ListenerHandle, TransportError>
    start_continuous_listener(ScanConfig config, DeviceCallback on_device) const;

private:
    [[nodiscard]] std::unique_ptr<DatagramTransport> make_transport() const;

    TransportFactory transport_factory_;
};

} // namespace scout::network
