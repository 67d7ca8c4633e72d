#include "codec.hpp"
#include "errors.hpp"
#include <cmath>

namespace quasar
{

  const char *valueTypeName(ValueType t)
  {
    switch (t)
    {
    case ValueType::Null:
      return "null";
    case ValueType::I64:
      return "integer";
    case ValueType::F64:
      return "real";
    case ValueType::Bool:
      return "bool";
    case ValueType::Text:
      return "text";
    case ValueType::Blob:
      return "blob";
    }
    return "unknown";
  }

  bool isValidUtf8(std::string_view str)
  {
    const unsigned char *s = reinterpret_cast<const unsigned char *>(str.data());
    const unsigned char *e = s + str.size();
    while (s < e)
    {
      unsigned char c = *s++;
      if (c < 0x80)
        continue;
      // well-formed sequences only (RFC 3629 section 4)
      unsigned int extra = 0;
      unsigned char lo = 0x80, hi = 0xBF;
      if (c >= 0xC2 && c <= 0xDF)
        extra = 1;
      else if (c >= 0xE0 && c <= 0xEF)
      {
        extra = 2;
        if (c == 0xE0)
          lo = 0xA0;
        else if (c == 0xED)
          hi = 0x9F;
      }
      else if (c >= 0xF0 && c <= 0xF4)
      {
        extra = 3;
        if (c == 0xF0)
          lo = 0x90;
        else if (c == 0xF4)
          hi = 0x8F;
      }
      else
        return false;
      if (extra > static_cast<unsigned int>(e - s))
        return false;
      if (s[0] < lo || s[0] > hi)
        return false;
      for (unsigned int i = 1; i < extra; ++i)
      {
        if ((s[i] & 0xC0) != 0x80)
          return false;
      }
      s += extra;
    }
    return true;
  }

  PropertyRow encodeProperty(std::string_view key, const Value &v)
  {
    if (key.empty())
      throw TypeError("property key must not be empty");
    if (!isValidUtf8(key))
      throw TypeError("property key is not valid utf-8");

    PropertyRow row{};
    row.key = std::string(key);
    row.type = valueType(v);
    switch (row.type)
    {
    case ValueType::I64:
      row.cell = std::get<int64_t>(v);
      break;
    case ValueType::F64:
    {
      double d = std::get<double>(v);
      // sqlite stores NaN as NULL
      if (std::isnan(d))
        throw TypeError("property '" + row.key + "': NaN cannot be stored");
      row.cell = d;
      break;
    }
    case ValueType::Bool:
      row.cell = int64_t(std::get<bool>(v) ? 1 : 0);
      break;
    case ValueType::Text:
    {
      const auto &s = std::get<std::string>(v);
      if (!isValidUtf8(s))
        throw TypeError("property '" + row.key + "': text is not valid utf-8, store it as a blob");
      row.cell = s;
      break;
    }
    case ValueType::Blob:
      row.cell = std::get<Blob>(v).bytes;
      break;
    case ValueType::Null:
      throw TypeError("property '" + row.key + "': null is not a storable value");
    }
    return row;
  }

  std::vector<PropertyRow> encodeProperties(const PropertyMap &props)
  {
    std::vector<PropertyRow> rows;
    rows.reserve(props.size());
    for (const auto &[key, val] : props)
      rows.push_back(encodeProperty(key, val));
    return rows;
  }

  PropertyPatch encodePatch(const PropertyMap &patch)
  {
    PropertyPatch out{};
    for (const auto &[key, val] : patch)
    {
      if (isNull(val))
      {
        if (key.empty())
          throw TypeError("property key must not be empty");
        out.remove.push_back(key);
      }
      else
      {
        out.set.push_back(encodeProperty(key, val));
      }
    }
    return out;
  }

  Value decodeProperty(const PropertyRow &row)
  {
    auto corrupt = [&](const char *what)
    {
      return StorageError("corrupt property '" + row.key + "' (" + valueTypeName(row.type) + "): " + what);
    };

    switch (row.type)
    {
    case ValueType::I64:
      if (!std::holds_alternative<int64_t>(row.cell))
        throw corrupt("integer tag on non-integer cell");
      return std::get<int64_t>(row.cell);
    case ValueType::F64:
      // integral-valued reals written by other tools come back as INTEGER
      if (std::holds_alternative<int64_t>(row.cell))
        return static_cast<double>(std::get<int64_t>(row.cell));
      if (!std::holds_alternative<double>(row.cell))
        throw corrupt("real tag on non-real cell");
      return std::get<double>(row.cell);
    case ValueType::Bool:
    {
      if (!std::holds_alternative<int64_t>(row.cell))
        throw corrupt("bool tag on non-integer cell");
      int64_t x = std::get<int64_t>(row.cell);
      if (x != 0 && x != 1)
        throw corrupt("bool out of range");
      return x == 1;
    }
    case ValueType::Text:
      if (!std::holds_alternative<std::string>(row.cell))
        throw corrupt("text tag on non-text cell");
      return std::get<std::string>(row.cell);
    case ValueType::Blob:
      if (!std::holds_alternative<std::string>(row.cell))
        throw corrupt("blob tag on non-blob cell");
      return Blob{std::get<std::string>(row.cell)};
    case ValueType::Null:
      break;
    }
    throw corrupt("unknown value tag");
  }

  PropertyMap decodeProperties(const std::vector<PropertyRow> &rows)
  {
    PropertyMap out;
    for (const auto &row : rows)
      out.emplace(row.key, decodeProperty(row));
    return out;
  }

} // namespace quasar
