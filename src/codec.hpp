#pragma once
#include "value.hpp"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quasar
{

  // native column value: INTEGER, REAL, TEXT or BLOB bytes, NULL
  using Cell = std::variant<std::monostate, int64_t, double, std::string>;

  struct PropertyRow
  {
    std::string key;
    ValueType type{ValueType::Null};
    Cell cell{};
  };

  // merge-style update: keys in `set` are written, keys in `remove` deleted
  struct PropertyPatch
  {
    std::vector<PropertyRow> set;
    std::vector<std::string> remove;

    bool empty() const { return set.empty() && remove.empty(); }
  };

  bool isValidUtf8(std::string_view s);

  // Throws TypeError for an empty key, a null value, NaN or non utf-8 text.
  PropertyRow encodeProperty(std::string_view key, const Value &v);
  std::vector<PropertyRow> encodeProperties(const PropertyMap &props);

  // Null values in the patch become removals.
  PropertyPatch encodePatch(const PropertyMap &patch);

  // Throws StorageError when the tag and the stored cell disagree.
  Value decodeProperty(const PropertyRow &row);
  PropertyMap decodeProperties(const std::vector<PropertyRow> &rows);

} // namespace quasar
