#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>

#include <functional>
#include <string>

namespace scout::network {

/**
 * TransportError - socket-level failure (bind, permission, broadcast send).
 * `socket_error` holds a QAbstractSocket::SocketError value, or -1.
 */
struct TransportError {
    std::string message;
    int socket_error{-1};
};

/**
 * DatagramTransport - the socket a scan session owns exclusively.
 *
 * open() binds, close() releases the port before it returns; no callback
 * fires after close(). Implementations deliver datagrams on the thread that
 * opened them.
 */
class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    virtual Result<void, TransportError> open(const QHostAddress& bind_address, quint16 port) = 0;
    virtual Result<void, TransportError> send(const QByteArray& payload,
                                              const QHostAddress& destination,
                                              quint16 port) = 0;
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
    [[nodiscard]] virtual quint16 local_port() const = 0;

    // Callbacks
    std::function<void(const QByteArray&, const QHostAddress&, quint16)> on_datagram;
    std::function<void(const TransportError&)> on_error;
};

} // namespace scout::network
