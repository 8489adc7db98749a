#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace idsync::model {

enum class EntityType : std::uint8_t {
  kMatch  = 1,
  kTeam   = 2,
  kPlayer = 3,
};

constexpr std::string_view ToString(EntityType type) {
  switch (type) {
    case EntityType::kMatch:
      return "match";
    case EntityType::kTeam:
      return "team";
    case EntityType::kPlayer:
    default:
      return "player";
  }
}

// "{provider}_{entity}_id"
inline std::string IdField(std::string_view provider, EntityType type) {
  std::string field(provider);
  field += '_';
  field += ToString(type);
  field += "_id";
  return field;
}

} // namespace idsync::model
