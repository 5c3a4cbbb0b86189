#include "network/scan_orchestrator.hpp"

#include "core/logging.hpp"
#include "network/udp_transport.hpp"

#include <QEventLoop>

namespace scout::network {

ListenerHandle::ListenerHandle(std::unique_ptr<DiscoveryEngine> engine)
    : engine_(std::move(engine))
{
}

ListenerHandle::~ListenerHandle() {
    cancel();
}

ListenerHandle& ListenerHandle::operator=(ListenerHandle&& other) noexcept {
    if (this != &other) {
        cancel();
        engine_ = std::move(other.engine_);
    }
    return *this;
}

void ListenerHandle::cancel() {
    if (engine_) {
        engine_->cancel();
    }
}

bool ListenerHandle::is_active() const {
    return engine_ && engine_->is_running();
}

quint16 ListenerHandle::local_port() const {
    return engine_ ? engine_->local_port() : 0;
}

int ListenerHandle::probes_sent() const {
    return engine_ ? engine_->probes_sent() : 0;
}

std::vector<DeviceRecord> ListenerHandle::snapshot() const {
    return engine_ ? engine_->snapshot() : std::vector<DeviceRecord>{};
}

ScanOrchestrator::ScanOrchestrator(TransportFactory transport_factory)
    : transport_factory_(std::move(transport_factory))
{
}

std::unique_ptr<DatagramTransport> ScanOrchestrator::make_transport() const {
    if (transport_factory_) {
        return transport_factory_();
    }
    return std::make_unique<UdpTransport>();
}

Result<std::vector<DeviceRecord>, TransportError>
ScanOrchestrator::discover_once(const ScanConfig& config,
                                DeviceCallback on_device,
                                ScanCancellation* cancellation) const {
    using R = Result<std::vector<DeviceRecord>, TransportError>;

    if (cancellation && cancellation->is_cancelled()) {
        qCInfo(scoutDiscoveryLog) << "scan cancelled before start";
        return R::ok({});
    }

    auto bounded = config;
    bounded.continuous = false;

    DiscoveryEngine engine(std::move(bounded), make_transport());
    if (on_device) {
        engine.add_listener([cb = std::move(on_device)](const DeviceRecord& record, MergeOutcome outcome) {
            if (outcome == MergeOutcome::Inserted) {
                cb(record, outcome);
            }
        });
    }

    QEventLoop loop;
    QObject::connect(&engine, &DiscoveryEngine::finished, &loop, &QEventLoop::quit);
    if (cancellation) {
        QObject::connect(cancellation, &ScanCancellation::requested, &engine, &DiscoveryEngine::cancel);
    }

    auto started = engine.start();
    if (started.is_err()) {
        return R::err(started.unwrap_err());
    }
    if (engine.is_running()) {
        loop.exec();
    }

    if (engine.completion_reason() == DiscoveryEngine::CompletionReason::TransportFailure) {
        return R::err(engine.transport_error().value_or(TransportError{"transport failed"}));
    }

    qCInfo(scoutDiscoveryLog).noquote()
        << "scan finished:" << to_string(engine.completion_reason())
        << "probes=" << engine.probes_sent()
        << "devices=" << engine.snapshot().size();
    return R::ok(engine.snapshot());
}

Result<ListenerHandle, TransportError>
ScanOrchestrator::start_continuous_listener(ScanConfig config, DeviceCallback on_device) const {
    using R = Result<ListenerHandle, TransportError>;

    config.continuous = true;

    auto engine = std::make_unique<DiscoveryEngine>(std::move(config), make_transport());
    if (on_device) {
        engine->add_listener(std::move(on_device));
    }

    auto started = engine->start();
    if (started.is_err()) {
        return R::err(started.unwrap_err());
    }
    return R::ok(ListenerHandle(std::move(engine)));
}

} // namespace scout::network
