#include "network/scan_config.hpp"

#include <QString>
#include <QtGlobal>

#include <algorithm>

namespace scout::network {
namespace {

Result<ScanConfig> bad_env(const char* name, const QString& value) {
    return Result<ScanConfig>::err(
        Error{std::string("invalid value for ") + name + ": '" + value.toStdString() + "'"});
}

std::optional<QString> env(const char* name) {
    if (!qEnvironmentVariableIsSet(name)) return std::nullopt;
    const auto value = qEnvironmentVariable(name).trimmed();
    if (value.isEmpty()) return std::nullopt;
    return value;
}

} // namespace

std::chrono::milliseconds ScanConfig::effective_probe_interval() const {
    if (probe_interval) return *probe_interval;
    if (continuous) return kContinuousProbeInterval;
    return std::max(std::chrono::milliseconds{1}, timeout / kProbesPerTimeout);
}

QHostAddress ScanConfig::destination() const {
    return target_address ? *target_address : broadcast_address;
}

Result<void> validate(const ScanConfig& config) {
    if (!config.continuous && config.timeout.count() <= 0) {
        return Result<void>::err(Error{"timeout must be positive"});
    }
    if (config.effective_probe_interval().count() <= 0) {
        return Result<void>::err(Error{"probe interval must be positive"});
    }
    if (config.port == 0) {
        return Result<void>::err(Error{"target port must be non-zero"});
    }
    if (config.bind_address.isNull()) {
        return Result<void>::err(Error{"bind address is not set"});
    }
    if (config.destination().isNull()) {
        return Result<void>::err(Error{"destination address is not set"});
    }
    if (config.schema.probe.isEmpty()) {
        return Result<void>::err(Error{"probe payload is empty"});
    }
    if (config.schema.delimiter.isEmpty()) {
        return Result<void>::err(Error{"field delimiter is empty"});
    }
    if (config.schema.field_names.isEmpty()) {
        return Result<void>::err(Error{"field schema is empty"});
    }
    if (!config.schema.mac_field.isEmpty() &&
        !config.schema.field_names.contains(config.schema.mac_field)) {
        return Result<void>::err(
            Error{"mac field '" + config.schema.mac_field.toStdString() + "' is not in the field schema"});
    }
    return Result<void>::ok();
}

Result<ScanConfig> apply_environment(ScanConfig config) {
    if (const auto v = env("SCOUT_DISCOVERY_PORT")) {
        bool ok = false;
        const auto port = v->toUShort(&ok);
        if (!ok || port == 0) return bad_env("SCOUT_DISCOVERY_PORT", *v);
        config.port = port;
    }
    if (const auto v = env("SCOUT_LOCAL_PORT")) {
        bool ok = false;
        const auto port = v->toUShort(&ok);
        if (!ok) return bad_env("SCOUT_LOCAL_PORT", *v);
        config.local_port = port;
    }
    if (const auto v = env("SCOUT_BIND_ADDRESS")) {
        QHostAddress address;
        if (!address.setAddress(*v)) return bad_env("SCOUT_BIND_ADDRESS", *v);
        config.bind_address = address;
    }
    if (const auto v = env("SCOUT_BROADCAST_ADDRESS")) {
        QHostAddress address;
        if (!address.setAddress(*v)) return bad_env("SCOUT_BROADCAST_ADDRESS", *v);
        config.broadcast_address = address;
    }
    if (const auto v = env("SCOUT_TIMEOUT_MS")) {
        bool ok = false;
        const auto ms = v->toLongLong(&ok);
        if (!ok || ms <= 0) return bad_env("SCOUT_TIMEOUT_MS", *v);
        config.timeout = std::chrono::milliseconds{ms};
    }
    if (const auto v = env("SCOUT_PROBE_INTERVAL_MS")) {
        bool ok = false;
        const auto ms = v->toLongLong(&ok);
        if (!ok || ms <= 0) return bad_env("SCOUT_PROBE_INTERVAL_MS", *v);
        config.probe_interval = std::chrono::milliseconds{ms};
    }
    return Result<ScanConfig>::ok(std::move(config));
}

} // namespace scout::network
