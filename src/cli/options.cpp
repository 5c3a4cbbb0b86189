#include "cli/options.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QHostAddress>
#include <QStringList>

#include <cmath>

namespace scout::cli {
namespace {

const QString kTimeout = QStringLiteral("timeout");
const QString kInterval = QStringLiteral("interval");
const QString kPort = QStringLiteral("port");
const QString kLocalPort = QStringLiteral("local-port");
const QString kBind = QStringLiteral("bind");
const QString kBroadcast = QStringLiteral("broadcast");
const QString kAddress = QStringLiteral("address");
const QString kListen = QStringLiteral("listen");
const QString kFields = QStringLiteral("fields");
const QString kDelimiter = QStringLiteral("delimiter");
const QString kMacField = QStringLiteral("mac-field");
const QString kJson = QStringLiteral("json");
const QString kDebug = QStringLiteral("debug");
const QString kLogFile = QStringLiteral("log-file");

// One millisecond up to one day.
constexpr double kMinSeconds = 0.001;
constexpr double kMaxSeconds = 86400.0;

Result<std::chrono::milliseconds> parse_seconds(const QString& option, const QString& value) {
    bool ok = false;
    const double seconds = value.toDouble(&ok);
    if (!ok || !std::isfinite(seconds) || seconds <= 0.0) {
        return Result<std::chrono::milliseconds>::err(
            Error{"--" + option.toStdString() + " expects a positive number of seconds, got '" +
                  value.toStdString() + "'"});
    }
    if (seconds < kMinSeconds || seconds > kMaxSeconds) {
        return Result<std::chrono::milliseconds>::err(
            Error{"--" + option.toStdString() + " expects between 0.001 and 86400 seconds, got '" +
                  value.toStdString() + "'"});
    }
    return Result<std::chrono::milliseconds>::ok(
        std::chrono::milliseconds{std::llround(seconds * 1000.0)});
}

Result<quint16> parse_port(const QString& option, const QString& value, bool allow_zero) {
    bool ok = false;
    const auto port = value.toUShort(&ok);
    if (!ok || (!allow_zero && port == 0)) {
        return Result<quint16>::err(
            Error{"--" + option.toStdString() + " expects a port number, got '" + value.toStdString() + "'"});
    }
    return Result<quint16>::ok(port);
}

Result<QHostAddress> parse_address(const QString& option, const QString& value) {
    QHostAddress address;
    if (!address.setAddress(value)) {
        return Result<QHostAddress>::err(
            Error{"--" + option.toStdString() + " expects an IP address, got '" + value.toStdString() + "'"});
    }
    return Result<QHostAddress>::ok(address);
}

} // namespace

void add_scan_options(QCommandLineParser& parser) {
    const QList<QCommandLineOption> options{
        QCommandLineOption(kTimeout,
                           QStringLiteral("Scan duration in seconds (default 10)."),
                           QStringLiteral("seconds")),
        QCommandLineOption(kInterval,
                           QStringLiteral("Seconds between probes (default: a third of the timeout, 3 with --listen)."),
                           QStringLiteral("seconds")),
        QCommandLineOption(kPort,
                           QStringLiteral("Port the devices listen on (default 30303)."),
                           QStringLiteral("port")),
        QCommandLineOption(kLocalPort,
                           QStringLiteral("Local port to bind, 0 for any (default 30303)."),
                           QStringLiteral("port")),
        QCommandLineOption(kBind,
                           QStringLiteral("Local address to bind (default 0.0.0.0)."),
                           QStringLiteral("ip")),
        QCommandLineOption(kBroadcast,
                           QStringLiteral("Broadcast address (default 255.255.255.255)."),
                           QStringLiteral("ip")),
        QCommandLineOption(kAddress,
                           QStringLiteral("Probe one host only and stop when it answers."),
                           QStringLiteral("ip")),
        QCommandLineOption(kListen,
                           QStringLiteral("Keep scanning until interrupted, printing every answer.")),
        QCommandLineOption(kFields,
                           QStringLiteral("Comma-separated response field names (default hostname,mac,model)."),
                           QStringLiteral("names")),
        QCommandLineOption(kDelimiter,
                           QStringLiteral("Response field delimiter, escapes allowed (default \\r\\n)."),
                           QStringLiteral("text")),
        QCommandLineOption(kMacField,
                           QStringLiteral("Field normalized as a MAC address, empty for none (default mac)."),
                           QStringLiteral("name")),
        QCommandLineOption(kJson,
                           QStringLiteral("Print JSON instead of text.")),
        QCommandLineOption(kDebug,
                           QStringLiteral("Enable discovery debug logging (same as SCOUT_DEBUG_DISCOVERY=1).")),
        QCommandLineOption(kLogFile,
                           QStringLiteral("Also append log output to this file."),
                           QStringLiteral("path")),
    };
    parser.addOptions(options);
}

Result<CliOptions> read_cli_options(const QCommandLineParser& parser, network::ScanConfig base) {
    using R = Result<CliOptions>;

    CliOptions out;
    out.scan = std::move(base);
    out.listen = parser.isSet(kListen);
    out.json = parser.isSet(kJson);
    out.debug = parser.isSet(kDebug);
    out.log_file = parser.value(kLogFile);
    out.scan.continuous = out.listen;

    if (parser.isSet(kTimeout)) {
        auto v = parse_seconds(kTimeout, parser.value(kTimeout));
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.timeout = v.unwrap();
    }
    if (parser.isSet(kInterval)) {
        auto v = parse_seconds(kInterval, parser.value(kInterval));
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.probe_interval = v.unwrap();
    }
    if (parser.isSet(kPort)) {
        auto v = parse_port(kPort, parser.value(kPort), false);
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.port = v.unwrap();
    }
    if (parser.isSet(kLocalPort)) {
        auto v = parse_port(kLocalPort, parser.value(kLocalPort), true);
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.local_port = v.unwrap();
    }
    if (parser.isSet(kBind)) {
        auto v = parse_address(kBind, parser.value(kBind));
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.bind_address = v.unwrap();
    }
    if (parser.isSet(kBroadcast)) {
        auto v = parse_address(kBroadcast, parser.value(kBroadcast));
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.broadcast_address = v.unwrap();
    }
    if (parser.isSet(kAddress)) {
        auto v = parse_address(kAddress, parser.value(kAddress));
        if (v.is_err()) return R::err(v.unwrap_err());
        out.scan.target_address = v.unwrap();
    }
    if (parser.isSet(kFields)) {
        QStringList names;
        for (const auto& name : parser.value(kFields).split(QLatin1Char(','))) {
            const auto trimmed = name.trimmed();
            if (trimmed.isEmpty()) {
                return R::err(Error{"--fields contains an empty field name"});
            }
            names.append(trimmed);
        }
        out.scan.schema.field_names = names;
        if (!parser.isSet(kMacField) && !names.contains(out.scan.schema.mac_field)) {
            out.scan.schema.mac_field.clear();
        }
    }
    if (parser.isSet(kDelimiter)) {
        out.scan.schema.delimiter = unescape_delimiter(parser.value(kDelimiter));
    }
    if (parser.isSet(kMacField)) {
        out.scan.schema.mac_field = parser.value(kMacField).trimmed();
    }

    if (auto valid = network::validate(out.scan); valid.is_err()) {
        return R::err(valid.unwrap_err());
    }
    return R::ok(std::move(out));
}

QByteArray unescape_delimiter(const QString& text) {
    QByteArray out;
    const auto raw = text.toUtf8();
    for (qsizetype i = 0; i < raw.size(); ++i) {
        const char c = raw.at(i);
        if (c != '\\' || i + 1 == raw.size()) {
            out.append(c);
            continue;
        }
        const char next = raw.at(++i);
        switch (next) {
            case 'r': out.append('\r'); break;
            case 'n': out.append('\n'); break;
            case 't': out.append('\t'); break;
            case '\\': out.append('\\'); break;
            default:
                out.append('\\');
                out.append(next);
                break;
        }
    }
    return out;
}

} // namespace scout::cli
