#include "network/discovery_engine.hpp"

#include "core/logging.hpp"
#include "network/wire_codec.hpp"

#include <QTimer>

#include <algorithm>
#include <limits>

namespace scout::network {
namespace {

using std::chrono::milliseconds;

int to_timer_ms(milliseconds ms) {
    return static_cast<int>(std::clamp<milliseconds::rep>(ms.count(), 0, std::numeric_limits<int>::max()));
}

} // namespace

const char* to_string(DiscoveryEngine::State state) {
    switch (state) {
        case DiscoveryEngine::State::Idle: return "idle";
        case DiscoveryEngine::State::SendingInitial: return "sending-initial";
        case DiscoveryEngine::State::Listening: return "listening";
        case DiscoveryEngine::State::SendingRetry: return "sending-retry";
        case DiscoveryEngine::State::Complete: return "complete";
    }
    return "unknown";
}

const char* to_string(DiscoveryEngine::CompletionReason reason) {
    switch (reason) {
        case DiscoveryEngine::CompletionReason::None: return "none";
        case DiscoveryEngine::CompletionReason::Timeout: return "timeout";
        case DiscoveryEngine::CompletionReason::Cancelled: return "cancelled";
        case DiscoveryEngine::CompletionReason::TargetFound: return "target-found";
        case DiscoveryEngine::CompletionReason::TransportFailure: return "transport-failure";
    }
    return "unknown";
}

DiscoveryEngine::DiscoveryEngine(ScanConfig config,
                                 std::unique_ptr<DatagramTransport> transport,
                                 QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , transport_(std::move(transport))
    , probe_timer_(std::make_unique<QTimer>(this))
    , deadline_timer_(std::make_unique<QTimer>(this))
{
    probe_timer_->setSingleShot(true);
    probe_timer_->setTimerType(Qt::PreciseTimer);
    deadline_timer_->setSingleShot(true);
    deadline_timer_->setTimerType(Qt::PreciseTimer);

    connect(probe_timer_.get(), &QTimer::timeout, this, &DiscoveryEngine::onProbeTimer);
    connect(deadline_timer_.get(), &QTimer::timeout, this, &DiscoveryEngine::onDeadline);
}

DiscoveryEngine::~DiscoveryEngine() {
    if (is_running()) {
        teardown();
    }
    if (transport_) {
        transport_->on_datagram = nullptr;
        transport_->on_error = nullptr;
    }
}

void DiscoveryEngine::add_listener(DeviceRegistry::Listener listener) {
    if (session_) {
        session_->registry.add_listener(std::move(listener));
    } else {
        pending_listeners_.push_back(std::move(listener));
    }
}

Result<void, TransportError> DiscoveryEngine::start() {
    using R = Result<void, TransportError>;

    if (state_ != State::Idle) {
        return R::err(TransportError{"scan already started"});
    }
    if (!transport_) {
        return R::err(TransportError{"no transport"});
    }
    if (auto valid = validate(config_); valid.is_err()) {
        return R::err(TransportError{"invalid scan configuration: " + valid.unwrap_err().message});
    }

    probe_ = encode_probe(config_.schema);
    session_ = std::make_unique<ScanSession>();
    for (auto& listener : pending_listeners_) {
        session_->registry.add_listener(std::move(listener));
    }
    pending_listeners_.clear();

    transport_->on_datagram = [this](const QByteArray& datagram, const QHostAddress& sender, quint16 port) {
        onDatagram(datagram, sender, port);
    };
    transport_->on_error = [this](const TransportError& error) {
        onTransportError(error);
    };

    auto opened = transport_->open(config_.bind_address, config_.local_port);
    if (opened.is_err()) {
        transport_error_ = opened.unwrap_err();
        reason_ = CompletionReason::TransportFailure;
        setState(State::Complete);
        return opened;
    }

    session_->clock.start();
    if (!config_.continuous) {
        session_->deadline = config_.timeout;
    }

    qCDebug(scoutDiscoveryLog).noquote()
        << "scan start dest=" << config_.destination().toString() << config_.port
        << "local port=" << transport_->local_port()
        << "interval ms=" << config_.effective_probe_interval().count()
        << (config_.continuous ? QStringLiteral("continuous")
                               : QStringLiteral("timeout ms=%1").arg(config_.timeout.count()));

    setState(State::SendingInitial);
    if (state_ == State::Complete) {
        return R::ok();
    }

    auto sent = sendProbe();
    if (state_ == State::Complete) {
        // Cancelled, or the target answered, while the send was in flight.
        return R::ok();
    }
    if (sent.is_err()) {
        qCWarning(scoutDiscoveryLog).noquote()
            << "initial probe failed:" << QString::fromStdString(sent.unwrap_err().message);
        transport_error_ = sent.unwrap_err();
        teardown();
        reason_ = CompletionReason::TransportFailure;
        setState(State::Complete);
        return sent;
    }

    if (session_->deadline) {
        deadline_timer_->start(to_timer_ms(*session_->deadline));
    }
    setState(State::Listening);
    scheduleNextProbe();
    return R::ok();
}

void DiscoveryEngine::cancel() {
    if (state_ == State::Idle) {
        reason_ = CompletionReason::Cancelled;
        state_ = State::Complete;
        return;
    }
    finish(CompletionReason::Cancelled);
}

int DiscoveryEngine::probes_sent() const {
    return session_ ? session_->probes_sent : 0;
}

milliseconds DiscoveryEngine::elapsed() const {
    return session_ ? session_->elapsed() : milliseconds{0};
}

quint16 DiscoveryEngine::local_port() const {
    return transport_ ? transport_->local_port() : 0;
}

std::vector<DeviceRecord> DiscoveryEngine::snapshot() const {
    return session_ ? session_->registry.snapshot() : std::vector<DeviceRecord>{};
}

Result<void, TransportError> DiscoveryEngine::sendProbe() {
    const auto destination = config_.destination();
    ++next_probe_slot_;

    auto sent = transport_->send(probe_, destination, config_.port);
    if (sent.is_ok()) {
        ++session_->probes_sent;
        qCDebug(scoutDiscoveryLog).noquote()
            << "probe" << session_->probes_sent << "->" << destination.toString() << config_.port
            << "at ms=" << session_->elapsed().count();
    }
    return sent;
}

void DiscoveryEngine::scheduleNextProbe() {
    if (state_ != State::Listening) return;

    const auto interval = config_.effective_probe_interval();
    const auto now = session_->elapsed();
    auto due = interval * next_probe_slot_;

    if (session_->deadline) {
        if (due >= *session_->deadline) return;
    } else if (due + interval <= now) {
        // Continuous sessions realign after a stall instead of bursting.
        next_probe_slot_ = static_cast<int>(now / interval) + 1;
        due = interval * next_probe_slot_;
    }

    probe_timer_->start(to_timer_ms(due - now));
}

void DiscoveryEngine::onProbeTimer() {
    if (state_ != State::Listening) return;

    if (const auto remaining = session_->remaining(); remaining && remaining->count() == 0) {
        finish(CompletionReason::Timeout);
        return;
    }

    setState(State::SendingRetry);
    if (state_ != State::SendingRetry) return;

    auto sent = sendProbe();
    if (state_ == State::Complete) return;

    if (sent.is_err()) {
        qCWarning(scoutDiscoveryLog).noquote()
            << "retry probe failed:" << QString::fromStdString(sent.unwrap_err().message);
        if (!transport_->is_open()) {
            transport_error_ = sent.unwrap_err();
            finish(CompletionReason::TransportFailure);
            return;
        }
    }

    setState(State::Listening);
    scheduleNextProbe();
}

void DiscoveryEngine::onDeadline() {
    if (!is_running()) return;

    // QTimer may fire a hair early; the scan never completes before its timeout.
    if (const auto remaining = session_->remaining(); remaining && remaining->count() > 0) {
        deadline_timer_->start(to_timer_ms(*remaining));
        return;
    }
    finish(CompletionReason::Timeout);
}

void DiscoveryEngine::onDatagram(const QByteArray& datagram, const QHostAddress& sender, quint16 sender_port) {
    if (!is_running()) return;

    auto decoded = decode_response(datagram, sender, config_.schema);
    if (decoded.is_err()) {
        const auto& err = decoded.unwrap_err();
        qCDebug(scoutWireLog).noquote()
            << "dropped datagram from" << sender.toString() << sender_port
            << "size=" << datagram.size() << to_string(err.kind) << QString::fromStdString(err.message);
        return;
    }

    auto record = std::move(decoded).unwrap();
    const auto address = record.address;
    const auto outcome = session_->registry.merge(std::move(record));
    qCDebug(scoutDiscoveryLog).noquote() << to_string(outcome) << address.toString();

    if (config_.target_address && !config_.continuous && is_running() &&
        normalize_address(*config_.target_address) == address) {
        finish(CompletionReason::TargetFound);
    }
}

void DiscoveryEngine::onTransportError(const TransportError& error) {
    if (!is_running()) return;

    if (transport_->is_open()) {
        // ICMP errors and the like; the socket is still usable.
        qCDebug(scoutDiscoveryLog).noquote() << "transient socket error:" << QString::fromStdString(error.message);
        return;
    }
    transport_error_ = error;
    finish(CompletionReason::TransportFailure);
}

void DiscoveryEngine::setState(State state) {
    if (state_ == state) return;
    state_ = state;
    emit stateChanged(state_);
}

void DiscoveryEngine::finish(CompletionReason reason) {
    if (!is_running()) return;

    teardown();
    reason_ = reason;
    qCDebug(scoutDiscoveryLog).noquote()
        << "scan complete reason=" << to_string(reason)
        << "probes=" << session_->probes_sent
        << "devices=" << session_->registry.size()
        << "elapsed ms=" << session_->elapsed().count();
    setState(State::Complete);
    emit finished();
}

void DiscoveryEngine::teardown() {
    probe_timer_->stop();
    deadline_timer_->stop();
    if (transport_) {
        transport_->close();
    }
}

} // namespace scout::network
