#include "network/udp_transport.hpp"

#include "core/logging.hpp"

#include <QByteArray>
#include <QUdpSocket>

#include <algorithm>

namespace scout::network {
namespace {

TransportError error_from(const QUdpSocket& socket, const char* what) {
    return TransportError{std::string(what) + ": " + socket.errorString().toStdString(),
                          static_cast<int>(socket.error())};
}

} // namespace

UdpTransport::UdpTransport(QObject* parent)
    : QObject(parent)
{
}

UdpTransport::~UdpTransport() {
    close();
}

Result<void, TransportError> UdpTransport::open(const QHostAddress& bind_address, quint16 port) {
    if (socket_) {
        return Result<void, TransportError>::err(TransportError{"socket already open"});
    }

    socket_ = std::make_unique<QUdpSocket>(this);

    if (!socket_->bind(bind_address, port,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto err = error_from(*socket_, "bind failed");
        qCWarning(scoutTransportLog).noquote()
            << "bind" << bind_address.toString() << port << "failed:" << socket_->errorString();
        socket_.reset();
        return Result<void, TransportError>::err(std::move(err));
    }

    connect(socket_.get(), &QUdpSocket::readyRead, this, &UdpTransport::onReadyRead);
    connect(socket_.get(), &QAbstractSocket::errorOccurred, this, &UdpTransport::onSocketError);

    qCDebug(scoutTransportLog) << "bound" << socket_->localAddress().toString() << socket_->localPort();
    return Result<void, TransportError>::ok();
}

Result<void, TransportError> UdpTransport::send(const QByteArray& payload,
                                                const QHostAddress& destination,
                                                quint16 port) {
    if (!socket_) {
        return Result<void, TransportError>::err(TransportError{"socket not open"});
    }

    const auto written = socket_->writeDatagram(payload, destination, port);
    if (written != payload.size()) {
        return Result<void, TransportError>::err(error_from(*socket_, "send failed"));
    }
    return Result<void, TransportError>::ok();
}

void UdpTransport::close() {
    if (!socket_) return;

    // close() may run from inside onReadyRead(); the descriptor is released
    // now and the QObject itself once control is back in the event loop.
    disconnect(socket_.get(), nullptr, this, nullptr);
    socket_->close();
    socket_.release()->deleteLater();

    qCDebug(scoutTransportLog) << "closed";
}

bool UdpTransport::is_open() const {
    return socket_ && socket_->state() == QAbstractSocket::BoundState;
}

quint16 UdpTransport::local_port() const {
    return socket_ ? socket_->localPort() : 0;
}

void UdpTransport::onReadyRead() {
    while (socket_ && socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(std::max<qint64>(socket_->pendingDatagramSize(), 0)));

        QHostAddress sender;
        quint16 sender_port = 0;
        const auto read = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        if (read < 0) {
            qCDebug(scoutTransportLog) << "readDatagram failed:" << socket_->errorString();
            break;
        }
        datagram.truncate(static_cast<qsizetype>(read));

        if (on_datagram) {
            on_datagram(datagram, sender, sender_port);
        }
    }
}

void UdpTransport::onSocketError(QAbstractSocket::SocketError error) {
    if (!socket_) return;

    qCWarning(scoutTransportLog).noquote() << "socket error" << static_cast<int>(error)
                                           << socket_->errorString();
    if (on_error) {
        on_error(TransportError{socket_->errorString().toStdString(), static_cast<int>(error)});
    }
}

} // namespace scout::network
