#pragma once

#include "core/types.hpp"

#include <QHostAddress>
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>
#include <vector>

namespace scout::network {

// (name, value), in wire order.
using DeviceField = std::pair<QString, QString>;

/**
 * DeviceRecord - one device that answered a probe.
 *
 * `address` is the identity key: a registry holds at most one record per
 * address, and a later response from the same address replaces `fields` and
 * `last_seen`.
 */
struct DeviceRecord {
    QHostAddress address;
    std::vector<DeviceField> fields;
    Timestamp last_seen;

    [[nodiscard]] std::optional<QString> field(const QString& name) const {
        for (const auto& [key, value] : fields) {
            if (key == name) return value;
        }
        return std::nullopt;
    }

    [[nodiscard]] QStringList values() const {
        QStringList out;
        out.reserve(static_cast<qsizetype>(fields.size()));
        for (const auto& entry : fields) {
            out.append(entry.second);
        }
        return out;
    }

    bool operator==(const DeviceRecord& other) const {
        return address == other.address && fields == other.fields && last_seen == other.last_seen;
    }
};

// IPv4-mapped IPv6 senders (::ffff:a.b.c.d) are folded to plain IPv4 so the
// same device never shows up under two keys.
[[nodiscard]] inline QHostAddress normalize_address(const QHostAddress& address) {
    if (address.protocol() == QAbstractSocket::IPv6Protocol) {
        bool is_v4 = false;
        const auto v4 = address.toIPv4Address(&is_v4);
        if (is_v4) {
            return QHostAddress(v4);
        }
    }
    return address;
}

} // namespace scout::network
