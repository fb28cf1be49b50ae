#include "prefixid/core/ids.h"

#include "prefixid/core/prefixed_id.h"

namespace prefixid::core {

std::optional<IdKind> id_kind_from_string(const std::string_view name) {
  for (const auto& kind : kAllKinds) {
    if (kind.name == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string generate_id(IUuidSource& source, const IdKind& kind) {
  return generate_id(source, kind.prefix, kind.hex_length);
}

std::string generate_id(const IdKind& kind) {
  return generate_id(system_uuid_source(), kind);
}

CharacterId new_character_id(IUuidSource& source) {
  return CharacterId{generate_id(source, kCharacterKind)};
}
UserId new_user_id(IUuidSource& source) { return UserId{generate_id(source, kUserKind)}; }
StoryId new_story_id(IUuidSource& source) { return StoryId{generate_id(source, kStoryKind)}; }
SegmentId new_segment_id(IUuidSource& source) {
  return SegmentId{generate_id(source, kSegmentKind)};
}
SessionId new_session_id(IUuidSource& source) {
  return SessionId{generate_id(source, kSessionKind)};
}

CharacterId new_character_id() { return new_character_id(system_uuid_source()); }
UserId new_user_id() { return new_user_id(system_uuid_source()); }
StoryId new_story_id() { return new_story_id(system_uuid_source()); }
SegmentId new_segment_id() { return new_segment_id(system_uuid_source()); }
SessionId new_session_id() { return new_session_id(system_uuid_source()); }

}  // namespace prefixid::core
