#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "entity_type.hpp"
#include "record.hpp"

namespace idsync::model {

/*
  One provider's record set for one group; the engine's unit of input.

  The engine only reads it. Every record is expected to carry the
  provider's identifier column, IdField().
*/
class SyncableContent {
 public:
  SyncableContent(EntityType entity_type, std::string provider, std::vector<Record> records = {});

  EntityType entity_type() const {
    return entity_type_;
  }
  const std::string& provider() const {
    return provider_;
  }
  const std::vector<Record>& records() const {
    return records_;
  }
  std::vector<Record>& mutable_records() {
    return records_;
  }

  std::string IdField() const;

  bool empty() const {
    return records_.empty();
  }
  std::size_t size() const {
    return records_.size();
  }

  /*
    Appends the records of `other` (same entity type required).
    The provider tag of this content is kept.
  */
  SyncableContent& Append(const SyncableContent& other);
  SyncableContent& Append(const std::vector<Record>& records);

  /*
    Long-format cleanup: when records carry both a `provider` (or
    `data_provider`) column and `provider_{entity}_id`, the latter is renamed
    to IdField() and the provider columns are dropped. Records without both
    are left untouched.
  */
  void TransformProviderFields();

  // Same, with `provider_column` recognized as the provider column too.
  void TransformProviderFields(std::string_view provider_column);

 private:
  EntityType          entity_type_;
  std::string         provider_;
  std::vector<Record> records_;
};

} // namespace idsync::model
