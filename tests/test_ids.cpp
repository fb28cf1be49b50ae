#include "prefixid/core/ids.h"
#include "prefixid/core/uuid_source.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace prefixid::core;
using Catch::Matchers::Matches;
using Catch::Matchers::StartsWith;

TEST_CASE("Fixed wrappers produce the documented format", "[ids]") {
  SECTION("character: char_ + 12 hex, 17 total") {
    const auto id = new_character_id();
    CHECK_THAT(id.value, Matches("char_[0-9a-f]{12}"));
    CHECK(id.value.size() == 17);
  }

  SECTION("user: user_ + 16 hex, 21 total") {
    const auto id = new_user_id();
    CHECK_THAT(id.value, Matches("user_[0-9a-f]{16}"));
    CHECK(id.value.size() == 21);
  }

  SECTION("story: story_ + 12 hex, 18 total") {
    const auto id = new_story_id();
    CHECK_THAT(id.value, Matches("story_[0-9a-f]{12}"));
    CHECK(id.value.size() == 18);
  }

  SECTION("segment: seg_ + 10 hex, 14 total") {
    const auto id = new_segment_id();
    CHECK_THAT(id.value, Matches("seg_[0-9a-f]{10}"));
    CHECK(id.value.size() == 14);
  }

  SECTION("session: sess_ + 16 hex, 21 total") {
    const auto id = new_session_id();
    CHECK_THAT(id.value, Matches("sess_[0-9a-f]{16}"));
    CHECK(id.value.size() == 21);
  }
}

TEST_CASE("Fixed wrappers return fresh values on each call", "[ids]") {
  CHECK(new_character_id() != new_character_id());
  CHECK(new_user_id() != new_user_id());
  CHECK(new_story_id() != new_story_id());
  CHECK(new_segment_id() != new_segment_id());
  CHECK(new_session_id() != new_session_id());
}

TEST_CASE("Fixed wrappers draw from an injected source", "[ids]") {
  DeterministicUuidSource a("ids");
  DeterministicUuidSource b("ids");

  const auto from_a = new_character_id(a);
  const auto from_b = new_character_id(b);
  CHECK(from_a == from_b);
  CHECK_THAT(from_a.value, StartsWith("char_"));

  CHECK(new_user_id(a) == new_user_id(b));
  CHECK(new_story_id(a) == new_story_id(b));
  CHECK(new_segment_id(a) == new_segment_id(b));
  CHECK(new_session_id(a) == new_session_id(b));
}

TEST_CASE("id_kind_from_string resolves every fixed kind", "[ids]") {
  for (const auto& kind : kAllKinds) {
    const auto found = id_kind_from_string(kind.name);
    REQUIRE(found.has_value());
    CHECK(found->prefix == kind.prefix);
    CHECK(found->hex_length == kind.hex_length);
  }

  const auto segment = id_kind_from_string("segment");
  REQUIRE(segment.has_value());
  CHECK(segment->prefix == "seg");
  CHECK(segment->hex_length == 10);
}

TEST_CASE("id_kind_from_string rejects unknown names", "[ids]") {
  CHECK_FALSE(id_kind_from_string("").has_value());
  CHECK_FALSE(id_kind_from_string("char").has_value());
  CHECK_FALSE(id_kind_from_string("Character").has_value());
  CHECK_FALSE(id_kind_from_string("custom").has_value());
}

TEST_CASE("generate_id(kind) uses the kind's prefix and length", "[ids]") {
  DeterministicUuidSource source;
  CHECK_THAT(generate_id(source, kStoryKind), Matches("story_[0-9a-f]{12}"));
  CHECK_THAT(generate_id(kSessionKind), Matches("sess_[0-9a-f]{16}"));
}
