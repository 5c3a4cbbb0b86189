#pragma once

#include "core/result.hpp"
#include "network/device_record.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <QStringList>

#include <string>

namespace scout::network {

// Probe/response codec for the port 30303 discovery handshake.
// Kept free of sockets so it can be tested on raw bytes.

inline constexpr quint16 kDiscoveryPort = 30303;
inline constexpr char kDiscoverMessage[] = "Discovery: Who is out there?";

/**
 * WireSchema - the protocol constants a device variant may differ in.
 *
 * The standard schema answers with three CRLF-separated fields:
 * hostname, MAC address, model.
 */
struct WireSchema {
    QByteArray probe = QByteArray(kDiscoverMessage);
    QByteArray delimiter = QByteArrayLiteral("\r\n");
    QStringList field_names = {QStringLiteral("hostname"), QStringLiteral("mac"), QStringLiteral("model")};
    // Field whose value is normalized as a MAC address; empty for none.
    QString mac_field = QStringLiteral("mac");

    [[nodiscard]] static WireSchema standard() { return WireSchema{}; }
};

enum class DecodeErrorKind {
    Empty,      // zero-length, or nothing but NUL/whitespace
    Malformed,  // wrong field count or not valid UTF-8
    ProbeEcho,  // our own probe looped back on the shared port
};

struct DecodeError {
    DecodeErrorKind kind{DecodeErrorKind::Malformed};
    std::string message;
};

[[nodiscard]] const char* to_string(DecodeErrorKind kind);

[[nodiscard]] QByteArray encode_probe(const WireSchema& schema = WireSchema::standard());

// Never throws: anything that is not a well-formed response comes back as a
// DecodeError so the caller can keep listening.
[[nodiscard]] Result<DeviceRecord, DecodeError> decode_response(const QByteArray& raw,
                                                                const QHostAddress& source,
                                                                const WireSchema& schema = WireSchema::standard());

// "0-1E-C0-38-63-40" -> "00:1E:C0:38:63:40"
[[nodiscard]] QString normalize_mac(const QString& mac);

} // namespace scout::network
