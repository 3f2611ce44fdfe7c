#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace liveviewer::model {

enum class ParticipantKind : std::uint8_t {
  kInternal = 1,
  kExternal = 2,
};

constexpr std::string_view ToString(ParticipantKind kind) {
  switch (kind) {
    case ParticipantKind::kInternal:
      return "internal";
    case ParticipantKind::kExternal:
    default:
      return "external";
  }
}

constexpr int ToStorage(ParticipantKind kind) {
  return static_cast<int>(kind);
}

inline std::optional<ParticipantKind> ParticipantKindFromStorage(int value) {
  switch (value) {
    case 1:
      return ParticipantKind::kInternal;
    case 2:
      return ParticipantKind::kExternal;
    default:
      return std::nullopt;
  }
}

/*
  Composite identity of a viewer row: (session, kind, participant).
*/
struct ViewerKey {
  std::string     session_id;
  ParticipantKind kind = ParticipantKind::kInternal;
  std::string     participant_id;

  std::string ToString() const {
    return session_id + "#" + std::to_string(ToStorage(kind)) + "#" + participant_id;
  }

  bool operator==(const ViewerKey& other) const {
    return kind == other.kind && session_id == other.session_id && participant_id == other.participant_id;
  }
};

} // namespace liveviewer::model
