#pragma once

#include "prefixid/core/uuid_source.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace prefixid::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// These are "vocabulary types" that prevent mixing up identifier kinds at API
// boundaries (I.4: make interfaces precisely and strongly typed).
// Using struct (not class) per C.2: the wrapped string carries no invariant beyond
// the one established when it was generated.

struct CharacterId {
  std::string value;
  auto operator<=>(const CharacterId&) const = default;
};

struct UserId {
  std::string value;
  auto operator<=>(const UserId&) const = default;
};

struct StoryId {
  std::string value;
  auto operator<=>(const StoryId&) const = default;
};

struct SegmentId {
  std::string value;
  auto operator<=>(const SegmentId&) const = default;
};

struct SessionId {
  std::string value;
  auto operator<=>(const SessionId&) const = default;
};

// IdKind is a named (prefix, hex_length) pair for one entity type.
// Literal type so the kind table is built at compile time (Per.11).
struct IdKind {
  std::string_view name;    // NOLINT(readability-identifier-naming)
  std::string_view prefix;  // NOLINT(readability-identifier-naming)
  int hex_length;           // NOLINT(readability-identifier-naming)
};

// Users and sessions get 16 hex digits (2^64 values); segments are short-lived
// and get 10.
constexpr IdKind kCharacterKind{"character", "char", 12};
constexpr IdKind kUserKind{"user", "user", 16};
constexpr IdKind kStoryKind{"story", "story", 12};
constexpr IdKind kSegmentKind{"segment", "seg", 10};
constexpr IdKind kSessionKind{"session", "sess", 16};

constexpr std::array<IdKind, 5> kAllKinds{kCharacterKind, kUserKind, kStoryKind, kSegmentKind,
                                          kSessionKind};

// id_kind_from_string looks up a kind by name ("character", "user", ...).
// Returns nullopt for unknown names. Matching is exact and case-sensitive.
[[nodiscard]] std::optional<IdKind> id_kind_from_string(std::string_view name);

[[nodiscard]] std::string generate_id(IUuidSource& source, const IdKind& kind);
[[nodiscard]] std::string generate_id(const IdKind& kind);

CharacterId new_character_id(IUuidSource& source);
UserId new_user_id(IUuidSource& source);
StoryId new_story_id(IUuidSource& source);
SegmentId new_segment_id(IUuidSource& source);
SessionId new_session_id(IUuidSource& source);

CharacterId new_character_id();
UserId new_user_id();
StoryId new_story_id();
SegmentId new_segment_id();
SessionId new_session_id();

}  // namespace prefixid::core
