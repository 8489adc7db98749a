#include "record.hpp"

#include <algorithm>

namespace idsync::model {

namespace {
const Value kNullValue{};
}

Record::Record(std::initializer_list<Field> fields) {
  for (const auto& field : fields) Set(field.first, field.second);
}

std::vector<Record::Field>::iterator Record::Find(std::string_view name) {
  return std::find_if(fields_.begin(), fields_.end(), [&](const Field& field) { return field.first == name; });
}

std::vector<Record::Field>::const_iterator Record::Find(std::string_view name) const {
  return std::find_if(fields_.begin(), fields_.end(), [&](const Field& field) { return field.first == name; });
}

void Record::Set(std::string_view name, Value value) {
  auto it = Find(name);
  if (it != fields_.end()) {
    it->second = std::move(value);
    return;
  }
  fields_.emplace_back(std::string(name), std::move(value));
}

bool Record::Erase(std::string_view name) {
  auto it = Find(name);
  if (it == fields_.end()) return false;
  fields_.erase(it);
  return true;
}

bool Record::Rename(std::string_view from, std::string_view to) {
  auto it = Find(from);
  if (it == fields_.end()) return false;
  if (from == to) return true;

  Erase(to);
  it = Find(from);
  it->first = std::string(to);
  return true;
}

bool Record::Has(std::string_view name) const {
  return Find(name) != fields_.end();
}

const Value& Record::Get(std::string_view name) const {
  auto it = Find(name);
  return it == fields_.end() ? kNullValue : it->second;
}

} // namespace idsync::model
