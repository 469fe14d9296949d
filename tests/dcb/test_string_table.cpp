/**
 * @file test_string_table.cpp
 * @brief Unit tests for the per-container string table.
 */

#include <catch2/catch_test_macros.hpp>

#include "dcb/dcb_string_table.h"
#include "dcb/dcb_tree_decoder.h"
#include "helpers/container_builder.hpp"

using namespace darkcfg::dcb;
using test_helpers::ByteBuilder;

namespace {

StringTable alpha_beta() {
    ByteBuilder b;
    b.s32(2);
    b.packed(0).str("alpha");
    b.packed(5).str("beta");
    ByteReader reader(b.bytes());
    auto table = read_string_table(reader);
    REQUIRE(reader.at_end());
    return table;
}

} // namespace

TEST_CASE("String table resolves declared ids", "[dcb][strings]") {
    const auto table = alpha_beta();
    REQUIRE(table.size() == 2);
    REQUIRE(table.lookup(0) == "alpha");
    REQUIRE(table.lookup(5) == "beta");
    REQUIRE(table.contains(5));
    REQUIRE_FALSE(table.contains(2));
}

TEST_CASE("String table id scalar resolves through the table", "[dcb][strings]") {
    const auto table = alpha_beta();

    ByteBuilder ok;
    ok.id_scalar(5);
    ByteReader r1(ok.bytes());
    REQUIRE(read_scalar(r1, table) == "beta");

    ByteBuilder missing;
    missing.id_scalar(2);
    ByteReader r2(missing.bytes());
    REQUIRE_THROWS_AS(read_scalar(r2, table), FormatError);
}

TEST_CASE("String table unknown id is a decode error", "[dcb][strings]") {
    const auto table = alpha_beta();
    REQUIRE_THROWS_AS(table.lookup(2), DecodeError);
    REQUIRE_THROWS_AS(table.lookup(-1), DecodeError);
}

TEST_CASE("String table keeps file order for non-contiguous ids", "[dcb][strings]") {
    ByteBuilder b;
    b.s32(3);
    b.packed(40).str("forty");
    b.packed(2).str("two");
    b.packed(1000).str("thousand");
    ByteReader reader(b.bytes());
    const auto table = read_string_table(reader);

    REQUIRE(table.entries().size() == 3);
    REQUIRE(table.entries()[0].first == 40);
    REQUIRE(table.entries()[1].second == "two");
    REQUIRE(table.lookup(1000) == "thousand");
}

TEST_CASE("String table count uses the container byte order", "[dcb][strings]") {
    ByteBuilder b(Endian::Big);
    b.s32(1);
    b.packed(7).str("seven");
    ByteReader reader(b.bytes(), Endian::Big);
    const auto table = read_string_table(reader);
    REQUIRE(table.lookup(7) == "seven");
}

TEST_CASE("String table rejects duplicate ids", "[dcb][strings]") {
    ByteBuilder b;
    b.s32(2);
    b.packed(3).str("first");
    b.packed(3).str("second");
    ByteReader reader(b.bytes());
    REQUIRE_THROWS_AS(read_string_table(reader), FormatError);

    StringTable table;
    table.insert(1, "one");
    REQUIRE_THROWS_AS(table.insert(1, "uno"), FormatError);
    REQUIRE(table.lookup(1) == "one");
}

TEST_CASE("String table rejects negative counts and truncation", "[dcb][strings]") {
    ByteBuilder negative;
    negative.s32(-1);
    ByteReader r1(negative.bytes());
    REQUIRE_THROWS_AS(read_string_table(r1), FormatError);

    ByteBuilder truncated;
    truncated.s32(2).packed(0).str("only");
    ByteReader r2(truncated.bytes());
    REQUIRE_THROWS_AS(read_string_table(r2), FormatError);
}

TEST_CASE("Empty string table", "[dcb][strings]") {
    ByteBuilder b;
    b.s32(0);
    ByteReader reader(b.bytes());
    const auto table = read_string_table(reader);
    REQUIRE(table.empty());
    REQUIRE(reader.at_end());
}
