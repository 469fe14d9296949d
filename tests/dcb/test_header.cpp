/**
 * @file test_header.cpp
 * @brief Unit tests for container header validation.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "dcb/dcb_header.h"
#include "dcb/dcb_text.h"
#include "helpers/container_builder.hpp"

#include <vector>

using namespace darkcfg::dcb;
using test_helpers::ByteBuilder;

namespace {

ContainerHeader parse(const ByteBuilder& b, Endian* endian_after = nullptr) {
    ByteReader reader(b.bytes());
    const auto hdr = read_header(reader);
    if (endian_after) {
        *endian_after = reader.endian();
    }
    REQUIRE(reader.position() == 7);
    return hdr;
}

std::vector<std::uint8_t> preamble(
    std::uint32_t magic,
    std::uint8_t version,
    std::uint8_t comp,
    std::uint8_t enc
) {
    ByteBuilder b;
    b.u32(magic).u8(version).u8(comp).u8(enc);
    return b.bytes();
}

} // namespace

// =============================================================================
// Magic and byte order
// =============================================================================

TEST_CASE("Signature constant", "[dcb][header]") {
    REQUIRE(kSignature == 0x334D4DE3u);
    REQUIRE(byte_swap32(kSignature) == 0xE34D4D33u);
    REQUIRE(byte_swap32(byte_swap32(0x01020304u)) == 0x01020304u);
}

TEST_CASE("Little-endian magic", "[dcb][header]") {
    ByteBuilder b;
    test_helpers::write_header(b);
    Endian endian = Endian::Big;
    const auto hdr = parse(b, &endian);
    REQUIRE(hdr.endian == Endian::Little);
    REQUIRE(endian == Endian::Little);
    REQUIRE(hdr.magic == kSignature);
    REQUIRE(hdr.version == 1);
}

TEST_CASE("Byte-swapped magic selects big-endian", "[dcb][header]") {
    ByteBuilder b(Endian::Big);
    test_helpers::write_header(b);
    REQUIRE(b.bytes()[0] == 0x33);

    Endian endian = Endian::Little;
    const auto hdr = parse(b, &endian);
    REQUIRE(hdr.endian == Endian::Big);
    REQUIRE(endian == Endian::Big);
    REQUIRE(hdr.magic == 0xE34D4D33u);
}

TEST_CASE("Unknown magic is a format error", "[dcb][header]") {
    const auto r1_bytes = preamble(0x12345678u, 1, 0, 0);
    ByteReader r1(r1_bytes);
    REQUIRE_THROWS_AS(read_header(r1), FormatError);

    const auto r2_bytes = preamble(0x334D4DE4u, 1, 0, 0);
    ByteReader r2(r2_bytes);
    REQUIRE_THROWS_AS(read_header(r2), FormatError);
}

TEST_CASE("Bad magic is named in hex", "[dcb][header]") {
    REQUIRE(to_hex_u32(0x0000ABCDu) == "0x0000ABCD");
    REQUIRE(to_hex_u32(kSignature) == "0x334D4DE3");

    const auto bytes = preamble(0x12345678u, 1, 0, 0);
    ByteReader reader(bytes);
    REQUIRE_THROWS_WITH(
        read_header(reader), Catch::Matchers::ContainsSubstring("bad magic 0x12345678")
    );
}

TEST_CASE("Truncated header is a format error", "[dcb][header]") {
    ByteBuilder b;
    b.u32(kSignature).u8(1);
    ByteReader reader(b.bytes());
    REQUIRE_THROWS_AS(read_header(reader), FormatError);
}

// =============================================================================
// Version and method bytes
// =============================================================================

TEST_CASE("Version other than 1 is a format error", "[dcb][header]") {
    const auto r0_bytes = preamble(kSignature, 0, 0, 0);
    ByteReader r0(r0_bytes);
    REQUIRE_THROWS_AS(read_header(r0), FormatError);
    const auto r2_bytes = preamble(kSignature, 2, 0, 0);
    ByteReader r2(r2_bytes);
    REQUIRE_THROWS_AS(read_header(r2), FormatError);
}

TEST_CASE("Non-zero compression methods are unsupported, not corrupt", "[dcb][header]") {
    for (std::uint8_t method = 1; method <= kMaxCompressionMethod; method++) {
        const auto reader_bytes = preamble(kSignature, 1, method, 0);
        ByteReader reader(reader_bytes);
        CHECK_THROWS_AS(read_header(reader), UnsupportedFeatureError);
    }
}

TEST_CASE("Encryption method 1 is unsupported, not corrupt", "[dcb][header]") {
    const auto reader_bytes = preamble(kSignature, 1, 0, 1);
    ByteReader reader(reader_bytes);
    REQUIRE_THROWS_AS(read_header(reader), UnsupportedFeatureError);

    ByteBuilder big(Endian::Big);
    test_helpers::write_header(big, 0, 1);
    ByteReader big_reader(big.bytes());
    REQUIRE_THROWS_AS(read_header(big_reader), UnsupportedFeatureError);
}

TEST_CASE("Out-of-range method codes are format errors", "[dcb][header]") {
    const auto comp_bytes = preamble(kSignature, 1, 4, 0);
    ByteReader comp(comp_bytes);
    REQUIRE_THROWS_AS(read_header(comp), FormatError);

    const auto enc_bytes = preamble(kSignature, 1, 0, 2);
    ByteReader enc(enc_bytes);
    REQUIRE_THROWS_AS(read_header(enc), FormatError);

    // Range checks run before the unsupported-method checks.
    const auto both_bytes = preamble(kSignature, 1, 1, 9);
    ByteReader both(both_bytes);
    REQUIRE_THROWS_AS(read_header(both), FormatError);
}

TEST_CASE("UnsupportedFeatureError is distinct from FormatError", "[dcb][header]") {
    const auto reader_bytes = preamble(kSignature, 1, 2, 0);
    ByteReader reader(reader_bytes);
    bool caught_format = false;
    bool caught_unsupported = false;
    try {
        read_header(reader);
    } catch (const FormatError&) {
        caught_format = true;
    } catch (const UnsupportedFeatureError&) {
        caught_unsupported = true;
    }
    REQUIRE_FALSE(caught_format);
    REQUIRE(caught_unsupported);
}
