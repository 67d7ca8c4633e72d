#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace quasar
{

  using EntityId = uint64_t;

  struct Blob
  {
    std::string bytes;

    bool operator==(const Blob &) const = default;
  };

  // int64, double, bool, utf-8 text, binary blob, null(monostate)
  using Value = std::variant<int64_t, double, bool, std::string, Blob, std::monostate>;

  // ordered so that encoding and change records are deterministic
  using PropertyMap = std::map<std::string, Value>;

  // persisted in properties.value_type / settings.value_type
  enum class ValueType : uint8_t
  {
    Null = 0,
    I64 = 1,
    F64 = 2,
    Bool = 3,
    Text = 4,
    Blob = 5
  };

  inline ValueType valueType(const Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
      return ValueType::I64;
    if (std::holds_alternative<double>(v))
      return ValueType::F64;
    if (std::holds_alternative<bool>(v))
      return ValueType::Bool;
    if (std::holds_alternative<std::string>(v))
      return ValueType::Text;
    if (std::holds_alternative<Blob>(v))
      return ValueType::Blob;
    return ValueType::Null;
  }

  inline bool isNull(const Value &v) { return std::holds_alternative<std::monostate>(v); }

  const char *valueTypeName(ValueType t);

} // namespace quasar
