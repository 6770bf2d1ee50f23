#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "internal/model/channel.hpp"
#include "internal/model/site.hpp"
#include "internal/model/source.hpp"

namespace feedstore::model {

enum class EntityKind : std::uint8_t {
  kChannel = 0,
  kSource  = 1,
  kSite    = 2,
};

using Entity = std::variant<Channel, Source, Site>;

constexpr std::string_view ToString(EntityKind kind) {
  switch (kind) {
    case EntityKind::kChannel:
      return "channel";
    case EntityKind::kSource:
      return "source";
    case EntityKind::kSite:
      return "site";
  }
  return "channel";
}

// Accepts singular and plural spellings ("site", "sites").
constexpr std::optional<EntityKind> ParseEntityKind(std::string_view value) {
  if (value == "channel" || value == "channels") return EntityKind::kChannel;
  if (value == "source" || value == "sources") return EntityKind::kSource;
  if (value == "site" || value == "sites") return EntityKind::kSite;
  return std::nullopt;
}

inline EntityKind KindOf(const Entity& entity) {
  return static_cast<EntityKind>(entity.index());
}

inline int64_t EntityId(const Entity& entity) {
  return std::visit([](const auto& e) { return e.id; }, entity);
}

// Parent id for sources and sites, nullopt for channels.
inline std::optional<int64_t> ParentId(const Entity& entity) {
  if (const auto* source = std::get_if<Source>(&entity)) return source->channel_id;
  if (const auto* site = std::get_if<Site>(&entity)) return site->source_id;
  return std::nullopt;
}

} // namespace feedstore::model
