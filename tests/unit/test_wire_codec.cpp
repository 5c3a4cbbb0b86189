#include <catch2/catch_test_macros.hpp>

#include "network/wire_codec.hpp"

#include <QHostAddress>

using namespace scout;
using namespace scout::network;

namespace {

const QHostAddress kSender(QStringLiteral("192.168.213.252"));

WireSchema two_field_schema() {
    WireSchema schema;
    schema.delimiter = QByteArrayLiteral(",");
    schema.field_names = {QStringLiteral("mac"), QStringLiteral("name")};
    schema.mac_field.clear();
    return schema;
}

} // namespace

TEST_CASE("Wire codec: probe is the fixed discover message", "[unit][wire]") {
    REQUIRE(encode_probe() == QByteArray("Discovery: Who is out there?"));
    REQUIRE(encode_probe() == encode_probe());
}

TEST_CASE("Wire codec: decodes a padded device response", "[unit][wire]") {
    const auto raw = QByteArrayLiteral("MY450-6340     \r\n00-1E-C0-38-63-40\r\nMaster Bath\0   \0");

    const auto decoded = decode_response(raw, kSender);
    REQUIRE(decoded.is_ok());

    const auto& record = decoded.unwrap();
    REQUIRE(record.address == kSender);
    REQUIRE(record.fields.size() == 3);
    REQUIRE(record.fields[0] == DeviceField{QStringLiteral("hostname"), QStringLiteral("MY450-6340")});
    REQUIRE(record.fields[1] == DeviceField{QStringLiteral("mac"), QStringLiteral("00:1E:C0:38:63:40")});
    REQUIRE(record.fields[2] == DeviceField{QStringLiteral("model"), QStringLiteral("Master Bath")});
}

TEST_CASE("Wire codec: normalizes short MAC octets", "[unit][wire]") {
    REQUIRE(normalize_mac(QStringLiteral("0-1E-C0-38-63-40")) == QStringLiteral("00:1E:C0:38:63:40"));
    REQUIRE(normalize_mac(QStringLiteral("a:b:c:d:e:f")) == QStringLiteral("0a:0b:0c:0d:0e:0f"));
    REQUIRE(normalize_mac(QStringLiteral("AABBCCDDEEFF")) == QStringLiteral("AABBCCDDEEFF"));
}

TEST_CASE("Wire codec: trims whitespace around every field", "[unit][wire]") {
    const auto decoded = decode_response(QByteArrayLiteral("  AABBCCDDEEFF ,\tDeviceX  "), kSender, two_field_schema());
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().values() == QStringList{QStringLiteral("AABBCCDDEEFF"), QStringLiteral("DeviceX")});
}

TEST_CASE("Wire codec: rejects empty payloads", "[unit][wire]") {
    const auto empty = decode_response(QByteArray(), kSender);
    REQUIRE(empty.is_err());
    REQUIRE(empty.unwrap_err().kind == DecodeErrorKind::Empty);

    const auto padding = decode_response(QByteArray("\0\0  \r\n", 6), kSender);
    REQUIRE(padding.is_err());
    REQUIRE(padding.unwrap_err().kind == DecodeErrorKind::Empty);
}

TEST_CASE("Wire codec: rejects wrong field count", "[unit][wire]") {
    const auto too_few = decode_response(QByteArrayLiteral("host\r\n00:11:22:33:44:55"), kSender);
    REQUIRE(too_few.is_err());
    REQUIRE(too_few.unwrap_err().kind == DecodeErrorKind::Malformed);

    const auto too_many = decode_response(QByteArrayLiteral("a\r\nb\r\nc\r\nd"), kSender);
    REQUIRE(too_many.is_err());
    REQUIRE(too_many.unwrap_err().kind == DecodeErrorKind::Malformed);
}

TEST_CASE("Wire codec: rejects our own probe looped back", "[unit][wire]") {
    const auto decoded = decode_response(encode_probe(), kSender);
    REQUIRE(decoded.is_err());
    REQUIRE(decoded.unwrap_err().kind == DecodeErrorKind::ProbeEcho);
}

TEST_CASE("Wire codec: rejects invalid UTF-8 without throwing", "[unit][wire]") {
    const QByteArray raw("host\r\n\xff\xfe\r\nmodel");
    const auto decoded = decode_response(raw, kSender);
    REQUIRE(decoded.is_err());
    REQUIRE(decoded.unwrap_err().kind == DecodeErrorKind::Malformed);
}

TEST_CASE("Wire codec: IPv4-mapped senders key as plain IPv4", "[unit][wire]") {
    const QHostAddress mapped(QStringLiteral("::ffff:10.0.0.5"));
    const auto decoded = decode_response(QByteArrayLiteral("AABBCCDDEEFF,DeviceX"), mapped, two_field_schema());
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().address == QHostAddress(QStringLiteral("10.0.0.5")));
    REQUIRE(decoded.unwrap().address.protocol() == QAbstractSocket::IPv4Protocol);
}

TEST_CASE("Wire codec: field lookup by name", "[unit][wire]") {
    const auto decoded = decode_response(QByteArrayLiteral("AABBCCDDEEFF,DeviceX"), kSender, two_field_schema());
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().field(QStringLiteral("name")) == QStringLiteral("DeviceX"));
    REQUIRE_FALSE(decoded.unwrap().field(QStringLiteral("model")).has_value());
}
