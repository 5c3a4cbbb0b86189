#pragma once

#include "core/result.hpp"
#include "network/datagram_transport.hpp"
#include "network/device_registry.hpp"
#include "network/scan_config.hpp"
#include "network/scan_session.hpp"

#include <QObject>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

class QTimer;

namespace scout::network {

/**
 * DiscoveryEngine - runs one scan session over a DatagramTransport.
 *
 *   Idle -> SendingInitial -> Listening -> (SendingRetry -> Listening)* -> Complete
 *
 * The probe goes out at t = 0, I, 2I, ... for every multiple of the probe
 * interval I that is strictly before the timeout T, i.e. ceil(T / I) probes.
 * Complete is reached when T has elapsed (never earlier), on cancel(), when a
 * targeted host answers, or when the socket dies. Every path closes the
 * transport before the state changes to Complete.
 *
 * Datagrams are accepted from the moment the socket is bound until Complete,
 * including while a probe send is still in progress. Undecodable datagrams are
 * logged and dropped.
 *
 * Single-threaded: lives on the thread whose event loop drives its timers and
 * socket, and must be started, cancelled and destroyed on that thread.
 */
class DiscoveryEngine final : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        SendingInitial,
        Listening,
        SendingRetry,
        Complete,
    };
    Q_ENUM(State)

    enum class CompletionReason {
        None,
        Timeout,
        Cancelled,
        TargetFound,
        TransportFailure,
    };
    Q_ENUM(CompletionReason)

    DiscoveryEngine(ScanConfig config,
                    std::unique_ptr<DatagramTransport> transport,
                    QObject* parent = nullptr);
    ~DiscoveryEngine() override;

    // Listeners added before start() are attached to the session registry.
    void add_listener(DeviceRegistry::Listener listener);

    /**
     * Bind the socket and send the first probe. Fails, without starting the
     * scan, if the configuration is unusable or the socket cannot be bound or
     * cannot send.
     */
    Result<void, TransportError> start();

    /**
     * Stop the scan. The socket is released and all timers are stopped before
     * this returns. Safe to call from a listener and more than once.
     */
    void cancel();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] CompletionReason completion_reason() const { return reason_; }
    [[nodiscard]] bool is_running() const { return state_ != State::Idle && state_ != State::Complete; }
    [[nodiscard]] const ScanConfig& config() const { return config_; }
    [[nodiscard]] const std::optional<TransportError>& transport_error() const { return transport_error_; }

    [[nodiscard]] int probes_sent() const;
    [[nodiscard]] std::chrono::milliseconds elapsed() const;
    [[nodiscard]] quint16 local_port() const;
    [[nodiscard]] std::vector<DeviceRecord> snapshot() const;

signals:
    void stateChanged(scout::network::DiscoveryEngine::State state);
    void finished();

private:
    Result<void, TransportError> sendProbe();
    void scheduleNextProbe();
    void onProbeTimer();
    void onDeadline();
    void onDatagram(const QByteArray& datagram, const QHostAddress& sender, quint16 sender_port);
    void onTransportError(const TransportError& error);
    void setState(State state);
    void finish(CompletionReason reason);
    void teardown();

    ScanConfig config_;
    QByteArray probe_;
    std::unique_ptr<DatagramTransport> transport_;
    std::unique_ptr<ScanSession> session_;
    std::vector<DeviceRegistry::Listener> pending_listeners_;

    std::unique_ptr<QTimer> probe_timer_;
    std::unique_ptr<QTimer> deadline_timer_;

    State state_ = State::Idle;
    CompletionReason reason_ = CompletionReason::None;
    std::optional<TransportError> transport_error_;
    // Index of the next probe slot; slot k is due at k * probe interval.
    int next_probe_slot_ = 0;
};

[[nodiscard]] const char* to_string(DiscoveryEngine::State state);
[[nodiscard]] const char* to_string(DiscoveryEngine::CompletionReason reason);

} // namespace scout::network
