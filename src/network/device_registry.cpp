#include "network/device_registry.hpp"

namespace scout::network {

const char* to_string(MergeOutcome outcome) {
    switch (outcome) {
        case MergeOutcome::Inserted: return "inserted";
        case MergeOutcome::Updated: return "updated";
    }
    return "unknown";
}

MergeOutcome DeviceRegistry::merge(DeviceRecord record) {
    QMutexLocker lock(&mu_);

    record.address = normalize_address(record.address);

    MergeOutcome outcome;
    size_t slot;
    const auto it = index_.constFind(record.address);
    if (it == index_.cend()) {
        slot = records_.size();
        index_.insert(record.address, slot);
        records_.push_back(std::move(record));
        outcome = MergeOutcome::Inserted;
    } else {
        slot = it.value();
        // Merges arrive in receipt order; the wall-clock stamp can step back.
        auto& existing = records_[slot];
        existing.fields = std::move(record.fields);
        existing.last_seen = record.last_seen;
        outcome = MergeOutcome::Updated;
    }

    // A listener may add another; it is not called for this merge.
    const size_t count = listeners_.size();
    for (size_t i = 0; i < count; ++i) {
        listeners_[i](records_[slot], outcome);
    }
    return outcome;
}

std::vector<DeviceRecord> DeviceRegistry::snapshot() const {
    QMutexLocker lock(&mu_);
    return records_;
}

std::optional<DeviceRecord> DeviceRegistry::find(const QHostAddress& address) const {
    QMutexLocker lock(&mu_);
    const auto it = index_.constFind(normalize_address(address));
    if (it == index_.cend()) {
        return std::nullopt;
    }
    return records_[it.value()];
}

bool DeviceRegistry::contains(const QHostAddress& address) const {
    QMutexLocker lock(&mu_);
    return index_.contains(normalize_address(address));
}

size_t DeviceRegistry::size() const {
    QMutexLocker lock(&mu_);
    return records_.size();
}

void DeviceRegistry::add_listener(Listener listener) {
    QMutexLocker lock(&mu_);
    listeners_.push_back(std::move(listener));
}

} // namespace scout::network
