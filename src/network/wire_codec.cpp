#include "network/wire_codec.hpp"

#include <QStringDecoder>

#include <algorithm>

namespace scout::network {
namespace {

bool is_padding(char c) {
    return c == '\0' || c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

// Devices pad fixed-size string slots with NUL bytes; everything from the
// first NUL on is filler.
QString clean_field(const QString& raw) {
    const auto nul = raw.indexOf(QChar(u'\0'));
    const auto value = nul >= 0 ? raw.left(nul) : raw;
    return value.trimmed();
}

Result<DeviceRecord, DecodeError> fail(DecodeErrorKind kind, std::string message) {
    return Result<DeviceRecord, DecodeError>::err(DecodeError{kind, std::move(message)});
}

} // namespace

const char* to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::Empty: return "empty";
        case DecodeErrorKind::Malformed: return "malformed";
        case DecodeErrorKind::ProbeEcho: return "probe-echo";
    }
    return "unknown";
}

QByteArray encode_probe(const WireSchema& schema) {
    return schema.probe;
}

Result<DeviceRecord, DecodeError> decode_response(const QByteArray& raw,
                                                  const QHostAddress& source,
                                                  const WireSchema& schema) {
    if (raw.isEmpty()) {
        return fail(DecodeErrorKind::Empty, "empty datagram");
    }
    if (raw == schema.probe) {
        return fail(DecodeErrorKind::ProbeEcho, "own probe echoed back");
    }
    if (std::all_of(raw.cbegin(), raw.cend(), is_padding)) {
        return fail(DecodeErrorKind::Empty, "datagram holds only padding");
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder.decode(raw);
    if (decoder.hasError()) {
        return fail(DecodeErrorKind::Malformed, "payload is not valid UTF-8");
    }

    const auto parts = text.split(QString::fromUtf8(schema.delimiter));
    if (parts.size() != schema.field_names.size()) {
        return fail(DecodeErrorKind::Malformed,
                    "expected " + std::to_string(schema.field_names.size()) +
                    " fields, got " + std::to_string(parts.size()));
    }

    DeviceRecord record;
    record.address = normalize_address(source);
    record.last_seen = Timestamp::now();
    record.fields.reserve(static_cast<size_t>(parts.size()));

    for (qsizetype i = 0; i < parts.size(); ++i) {
        const auto& name = schema.field_names.at(i);
        auto value = clean_field(parts.at(i));
        if (!schema.mac_field.isEmpty() && name == schema.mac_field) {
            value = normalize_mac(value);
        }
        record.fields.emplace_back(name, std::move(value));
    }

    return Result<DeviceRecord, DecodeError>::ok(std::move(record));
}

QString normalize_mac(const QString& mac) {
    auto octets = QString(mac).replace(QLatin1Char('-'), QLatin1Char(':')).split(QLatin1Char(':'));
    for (auto& octet : octets) {
        octet = octet.rightJustified(2, QLatin1Char('0'));
    }
    return octets.join(QLatin1Char(':'));
}

} // namespace scout::network
