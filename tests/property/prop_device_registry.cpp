#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "network/device_registry.hpp"

#include <QHash>

#include <algorithm>
#include <cstdint>
#include <random>
#include <tuple>
#include <vector>

using namespace scout;
using namespace scout::network;

namespace {

// One response: (device index, last_seen ms, payload tag).
using Response = std::tuple<int, int, int>;

QHostAddress device_address(int index) {
    return QHostAddress(QStringLiteral("192.168.7.%1").arg(10 + index));
}

DeviceRecord make_record(const Response& response) {
    const auto& [device, seen, tag] = response;
    DeviceRecord record;
    record.address = device_address(device);
    record.fields = {{QStringLiteral("name"), QString::number(tag)}};
    record.last_seen = Timestamp(seen);
    return record;
}

rc::Gen<std::vector<Response>> responses() {
    return rc::gen::container<std::vector<Response>>(
        rc::gen::tuple(rc::gen::inRange(0, 12), rc::gen::inRange(0, 1000), rc::gen::inRange(0, 100000)));
}

} // namespace

TEST_CASE("Property: registry holds one record per responding address", "[property][registry]") {
    REQUIRE(rc::check("size == number of distinct senders", []() {
        const auto input = *responses();

        DeviceRegistry registry;
        QHash<int, bool> distinct;
        for (const auto& response : input) {
            registry.merge(make_record(response));
            distinct.insert(std::get<0>(response), true);
        }

        RC_ASSERT(registry.size() == static_cast<size_t>(distinct.size()));
        for (auto it = distinct.cbegin(); it != distinct.cend(); ++it) {
            RC_ASSERT(registry.contains(device_address(it.key())));
        }
    }));
}

TEST_CASE("Property: registry keeps the latest response per address", "[property][registry]") {
    REQUIRE(rc::check("record == last merged response, whatever its last_seen", []() {
        const auto input = *responses();

        DeviceRegistry registry;
        QHash<int, Response> expected;
        for (const auto& response : input) {
            registry.merge(make_record(response));
            expected.insert(std::get<0>(response), response);
        }

        for (auto it = expected.cbegin(); it != expected.cend(); ++it) {
            const auto stored = registry.find(device_address(it.key()));
            RC_ASSERT(stored.has_value());
            RC_ASSERT(stored->last_seen.millis() == std::get<1>(it.value()));
            RC_ASSERT(stored->field(QStringLiteral("name")) == QString::number(std::get<2>(it.value())));
        }
    }));
}

TEST_CASE("Property: arrival order across devices does not change the final contents", "[property][registry]") {
    REQUIRE(rc::check("one response per device, any permutation, same records", []() {
        const auto all = *responses();
        std::vector<Response> input;
        QHash<int, bool> answered;
        for (const auto& response : all) {
            if (!answered.contains(std::get<0>(response))) {
                answered.insert(std::get<0>(response), true);
                input.push_back(response);
            }
        }

        auto shuffled = input;
        std::mt19937 rng(*rc::gen::arbitrary<std::uint32_t>());
        std::shuffle(shuffled.begin(), shuffled.end(), rng);

        DeviceRegistry in_order;
        DeviceRegistry out_of_order;
        for (const auto& response : input) in_order.merge(make_record(response));
        for (const auto& response : shuffled) out_of_order.merge(make_record(response));

        RC_ASSERT(in_order.size() == out_of_order.size());
        for (const auto& record : in_order.snapshot()) {
            const auto other = out_of_order.find(record.address);
            RC_ASSERT(other.has_value());
            RC_ASSERT(*other == record);
        }
    }));
}

TEST_CASE("Property: snapshot lists devices in first-seen order", "[property][registry]") {
    REQUIRE(rc::check("snapshot order == order of first appearance", []() {
        const auto input = *responses();

        DeviceRegistry registry;
        std::vector<int> first_seen;
        for (const auto& response : input) {
            registry.merge(make_record(response));
            const auto device = std::get<0>(response);
            if (std::find(first_seen.begin(), first_seen.end(), device) == first_seen.end()) {
                first_seen.push_back(device);
            }
        }

        const auto snapshot = registry.snapshot();
        RC_ASSERT(snapshot.size() == first_seen.size());
        for (size_t i = 0; i < snapshot.size(); ++i) {
            RC_ASSERT(snapshot[i].address == device_address(first_seen[i]));
        }
    }));
}
