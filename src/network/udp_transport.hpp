#pragma once

#include "network/datagram_transport.hpp"

#include <QAbstractSocket>
#include <QObject>

#include <memory>

class QUdpSocket;

namespace scout::network {

/**
 * UDP broadcast transport backed by QUdpSocket.
 *
 * Binds with address sharing so several scanners (and the devices' own
 * tooling) can listen on 30303 at once.
 */
class UdpTransport final : public QObject, public DatagramTransport {
    Q_OBJECT

public:
    explicit UdpTransport(QObject* parent = nullptr);
    ~UdpTransport() override;

    Result<void, TransportError> open(const QHostAddress& bind_address, quint16 port) override;
    Result<void, TransportError> send(const QByteArray& payload,
                                      const QHostAddress& destination,
                                      quint16 port) override;
    void close() override;

    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] quint16 local_port() const override;

private slots:
    void onReadyRead();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    std::unique_ptr<QUdpSocket> socket_;
};

} // namespace scout::network
