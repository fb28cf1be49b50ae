#include "prefixid/core/hashing.h"
#include "prefixid/core/uuid_source.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using namespace prefixid::core;
using Catch::Matchers::Matches;

// ── SystemUuidSource ────────────────────────────────────────────────────────

TEST_CASE("SystemUuidSource: 32 lowercase hex characters, version 4", "[uuid_source]") {
  SystemUuidSource source;
  const auto hex = source.next_uuid_hex();
  CHECK(hex.size() == kUuidHexLength);
  CHECK_THAT(hex, Matches("[0-9a-f]{12}4[0-9a-f]{3}[89ab][0-9a-f]{15}"));
}

TEST_CASE("SystemUuidSource: consecutive values differ", "[uuid_source]") {
  auto& source = system_uuid_source();
  CHECK(source.next_uuid_hex() != source.next_uuid_hex());
}

TEST_CASE("system_uuid_source: returns the same instance", "[uuid_source]") {
  CHECK(&system_uuid_source() == &system_uuid_source());
}

// ── DeterministicUuidSource ─────────────────────────────────────────────────

TEST_CASE("DeterministicUuidSource: same seed yields the same sequence", "[uuid_source]") {
  DeterministicUuidSource a("seed-1");
  DeterministicUuidSource b("seed-1");
  for (int i = 0; i < 5; ++i) {
    CHECK(a.next_uuid_hex() == b.next_uuid_hex());
  }
}

TEST_CASE("DeterministicUuidSource: different seeds diverge", "[uuid_source]") {
  DeterministicUuidSource a("seed-1");
  DeterministicUuidSource b("seed-2");
  CHECK(a.next_uuid_hex() != b.next_uuid_hex());
}

TEST_CASE("DeterministicUuidSource: values are 32 hex and change every call",
          "[uuid_source]") {
  DeterministicUuidSource source;
  const auto first = source.next_uuid_hex();
  const auto second = source.next_uuid_hex();
  CHECK_THAT(first, Matches("[0-9a-f]{32}"));
  CHECK_THAT(second, Matches("[0-9a-f]{32}"));
  CHECK(first != second);
  // Leading characters differ too, so truncated identifiers stay distinct.
  CHECK(first.substr(0, 8) != second.substr(0, 8));
}

TEST_CASE("DeterministicUuidSource: n-th value is the hash pair of seed and counter",
          "[uuid_source]") {
  DeterministicUuidSource source("s");
  CHECK(source.next_uuid_hex() ==
        to_hex64(fnv1a_64("s:0:hi")) + to_hex64(fnv1a_64("s:0:lo")));
  CHECK(source.next_uuid_hex() ==
        to_hex64(fnv1a_64("s:1:hi")) + to_hex64(fnv1a_64("s:1:lo")));
}

// ── fnv1a_64 / to_hex64 ─────────────────────────────────────────────────────

TEST_CASE("fnv1a_64: reference values", "[hashing]") {
  CHECK(fnv1a_64("") == 14695981039346656037ull);
  CHECK(fnv1a_64("a") == 0xaf63dc4c8601ec8cull);
}

TEST_CASE("to_hex64: 16 zero-padded lowercase digits", "[hashing]") {
  CHECK(to_hex64(0) == "0000000000000000");
  CHECK(to_hex64(0xabcull) == "0000000000000abc");
  CHECK(to_hex64(14695981039346656037ull) == "cbf29ce484222325");
  CHECK(to_hex64(~0ull) == "ffffffffffffffff");
}
