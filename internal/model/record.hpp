#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace idsync::model {

/*
  One entity instance as reported by one provider.

  Fields keep insertion order. Lookups are linear; records carry a handful
  of columns.
*/
class Record {
 public:
  using Field = std::pair<std::string, Value>;

  Record() = default;
  Record(std::initializer_list<Field> fields);

  // Inserts or overwrites.
  void Set(std::string_view name, Value value);
  bool Erase(std::string_view name);
  bool Rename(std::string_view from, std::string_view to);

  bool Has(std::string_view name) const;

  // Null when the field is absent.
  const Value& Get(std::string_view name) const;

  const std::vector<Field>& fields() const {
    return fields_;
  }

 private:
  std::vector<Field>::iterator       Find(std::string_view name);
  std::vector<Field>::const_iterator Find(std::string_view name) const;

  std::vector<Field> fields_;
};

} // namespace idsync::model
