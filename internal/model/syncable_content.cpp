#include "syncable_content.hpp"

#include "internal/util/errors.hpp"

namespace idsync::model {

SyncableContent::SyncableContent(EntityType entity_type, std::string provider, std::vector<Record> records)
    : entity_type_(entity_type), provider_(std::move(provider)), records_(std::move(records)) {
}

std::string SyncableContent::IdField() const {
  return model::IdField(provider_, entity_type_);
}

SyncableContent& SyncableContent::Append(const SyncableContent& other) {
  if (other.entity_type_ != entity_type_) {
    throw util::ConfigurationError("cannot append " + std::string(ToString(other.entity_type_)) + " content to " +
                                   std::string(ToString(entity_type_)) + " content");
  }
  return Append(other.records_);
}

SyncableContent& SyncableContent::Append(const std::vector<Record>& records) {
  records_.insert(records_.end(), records.begin(), records.end());
  return *this;
}

void SyncableContent::TransformProviderFields() {
  TransformProviderFields("provider");
}

void SyncableContent::TransformProviderFields(std::string_view provider_column) {
  const std::string provider_id_field = "provider_" + std::string(ToString(entity_type_)) + "_id";
  const std::string id_field          = IdField();

  for (auto& record : records_) {
    const bool has_provider_column =
        record.Has(provider_column) || record.Has("data_provider") || record.Has("provider");
    if (!has_provider_column || !record.Has(provider_id_field)) continue;

    record.Rename(provider_id_field, id_field);
    record.Erase(provider_column);
    record.Erase("data_provider");
    record.Erase("provider");
  }
}

} // namespace idsync::model
