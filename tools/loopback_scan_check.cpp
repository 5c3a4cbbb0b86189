#include <QCoreApplication>
#include <QDebug>
#include <QHostAddress>
#include <QUdpSocket>

#include "core/logging.hpp"
#include "network/scan_orchestrator.hpp"
#include "network/wire_codec.hpp"

// Simulates a port-30303 device on 127.0.0.1 and checks that a targeted scan
// finds exactly that device.

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    if (scout::debug_logging_requested()) {
        scout::enable_debug_logging();
    }

    QUdpSocket device;
    if (!device.bind(QHostAddress::LocalHost, 0)) {
        qCritical().noquote() << "device bind failed:" << device.errorString();
        return 1;
    }

    int probes_seen = 0;
    QObject::connect(&device, &QUdpSocket::readyRead, &app, [&]() {
        while (device.hasPendingDatagrams()) {
            QByteArray datagram;
            datagram.resize(static_cast<qsizetype>(device.pendingDatagramSize()));
            QHostAddress sender;
            quint16 sender_port = 0;
            device.readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
            if (datagram != scout::network::encode_probe()) {
                continue;
            }
            ++probes_seen;
            device.writeDatagram(QByteArrayLiteral("MY450-6340     \r\n0-1E-C0-38-63-40\r\nMaster Bath\0   \0"),
                                 sender, sender_port);
        }
    });

    scout::network::ScanConfig config;
    config.timeout = std::chrono::milliseconds{3000};
    config.probe_interval = std::chrono::milliseconds{500};
    config.port = device.localPort();
    config.local_port = 0;
    config.bind_address = QHostAddress::LocalHost;
    config.target_address = QHostAddress(QHostAddress::LocalHost);

    const scout::network::ScanOrchestrator orchestrator;
    auto result = orchestrator.discover_once(config);
    if (result.is_err()) {
        qCritical().noquote() << "scan failed:" << QString::fromStdString(result.unwrap_err().message);
        return 1;
    }

    const auto& devices = result.unwrap();
    if (devices.size() != 1 || probes_seen < 1) {
        qCritical() << "expected one device, got" << devices.size() << "after" << probes_seen << "probes";
        return 2;
    }

    const auto& found = devices.front();
    if (found.field(QStringLiteral("hostname")) != QStringLiteral("MY450-6340") ||
        found.field(QStringLiteral("mac")) != QStringLiteral("00:1E:C0:38:63:40") ||
        found.field(QStringLiteral("model")) != QStringLiteral("Master Bath")) {
        qCritical().noquote() << "unexpected fields:" << found.values().join(QStringLiteral(" | "));
        return 3;
    }
    return 0;
}
