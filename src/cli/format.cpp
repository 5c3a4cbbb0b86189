#include "cli/format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace scout::cli {

namespace {

[[nodiscard]] QString render_line(const network::DeviceRecord& device) {
    QStringList columns;
    columns.reserve(static_cast<qsizetype>(device.fields.size()) + 1);
    columns.append(device.address.toString());
    columns.append(device.values());
    return columns.join(QStringLiteral(", "));
}

[[nodiscard]] QJsonObject to_json(const network::DeviceRecord& device) {
    QJsonObject fields;
    for (const auto& [name, value] : device.fields) {
        fields.insert(name, value);
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("address"), device.address.toString());
    obj.insert(QStringLiteral("fields"), fields);
    obj.insert(QStringLiteral("lastSeen"), QString::fromStdString(device.last_seen.to_iso_string()));
    return obj;
}

} // namespace

QString format_device_lines(const std::vector<network::DeviceRecord>& devices) {
    QString out;
    for (const auto& device : devices) {
        out += render_line(device);
        out += QLatin1Char('\n');
    }
    return out;
}

QString format_devices_json(const std::vector<network::DeviceRecord>& devices) {
    QJsonArray array;
    for (const auto& device : devices) {
        array.append(to_json(device));
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Indented));
}

QString format_device_event(const network::DeviceRecord& device, network::MergeOutcome outcome) {
    const auto marker = outcome == network::MergeOutcome::Inserted ? QStringLiteral("+ ") : QStringLiteral("~ ");
    return marker + render_line(device) + QLatin1Char('\n');
}

QString format_device_event_json(const network::DeviceRecord& device, network::MergeOutcome outcome) {
    auto obj = to_json(device);
    obj.insert(QStringLiteral("event"), QString::fromLatin1(network::to_string(outcome)));
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)) + QLatin1Char('\n');
}

} // namespace scout::cli
