#include "changelog.hpp"
#include "errors.hpp"
#include "schemas/changes.capnp.h"
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/array.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <cstring>

namespace quasar
{

  namespace
  {

    capnp::Text::Reader asText(const std::string &s)
    {
      return capnp::Text::Reader(s.data(), s.size());
    }

    std::string fromText(capnp::Text::Reader t)
    {
      return std::string(t.begin(), t.size());
    }

    log::EntityKind toLogKind(EntityKind k)
    {
      return k == EntityKind::Node ? log::EntityKind::NODE : log::EntityKind::EDGE;
    }

    EntityKind fromLogKind(log::EntityKind k)
    {
      return k == log::EntityKind::NODE ? EntityKind::Node : EntityKind::Edge;
    }

    void toLogValue(log::Value::Builder b, const Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
      {
        b.setI64(std::get<int64_t>(v));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        b.setF64(std::get<double>(v));
        return;
      }
      if (std::holds_alternative<bool>(v))
      {
        b.setBoolv(std::get<bool>(v));
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        b.setText(asText(std::get<std::string>(v)));
        return;
      }
      if (std::holds_alternative<Blob>(v))
      {
        const auto &s = std::get<Blob>(v).bytes;
        b.setBytes(capnp::Data::Reader(reinterpret_cast<const capnp::byte *>(s.data()), s.size()));
        return;
      }
      b.setNullv();
    }

    Value fromLogValue(log::Value::Reader v)
    {
      switch (v.which())
      {
      case log::Value::I64:
        return static_cast<int64_t>(v.getI64());
      case log::Value::F64:
        return static_cast<double>(v.getF64());
      case log::Value::BOOLV:
        return static_cast<bool>(v.getBoolv());
      case log::Value::TEXT:
        return fromText(v.getText());
      case log::Value::BYTES:
      {
        auto d = v.getBytes();
        return Blob{std::string(reinterpret_cast<const char *>(d.begin()), d.size())};
      }
      case log::Value::NULLV:
      default:
        return std::monostate{};
      }
    }

    void toLogProps(capnp::List<log::Property>::Builder list, const PropertyMap &props)
    {
      unsigned i = 0;
      for (const auto &[key, val] : props)
      {
        auto p = list[i++];
        p.setKey(asText(key));
        toLogValue(p.initVal(), val);
      }
    }

    PropertyMap fromLogProps(capnp::List<log::Property>::Reader list)
    {
      PropertyMap out;
      for (auto p : list)
        out.emplace(fromText(p.getKey()), fromLogValue(p.getVal()));
      return out;
    }

    void toLogEntity(log::Entity::Builder b, const Change &c)
    {
      b.setKind(toLogKind(c.kind));
      b.setId(c.ref.id);
      b.setSrc(c.ref.src);
      b.setDst(c.ref.dst);
      b.setHasLabel(c.ref.label.has_value());
      if (c.ref.label)
        b.setLabel(asText(*c.ref.label));
      toLogProps(b.initProps(static_cast<unsigned>(c.props.size())), c.props);
    }

    void fromLogEntity(log::Entity::Reader r, Change &c)
    {
      c.kind = fromLogKind(r.getKind());
      c.ref.id = r.getId();
      c.ref.src = r.getSrc();
      c.ref.dst = r.getDst();
      if (r.getHasLabel())
        c.ref.label = fromText(r.getLabel());
      c.props = fromLogProps(r.getProps());
    }

  } // namespace

  std::string encodeChangeBatch(const ChangeBatch &batch)
  {
    capnp::MallocMessageBuilder message;
    auto root = message.initRoot<log::ChangeBatch>();
    root.setTimestampMs(batch.timestampMs);
    auto list = root.initChanges(static_cast<unsigned>(batch.changes.size()));
    for (unsigned i = 0; i < list.size(); ++i)
    {
      const Change &c = batch.changes[i];
      auto b = list[i];
      switch (c.op)
      {
      case ChangeOp::Created:
        toLogEntity(b.initCreated(), c);
        break;
      case ChangeOp::Deleted:
        toLogEntity(b.initDeleted(), c);
        break;
      case ChangeOp::Updated:
      {
        auto u = b.initUpdated();
        u.setId(c.ref.id);
        u.setKind(toLogKind(c.kind));
        toLogProps(u.initBefore(static_cast<unsigned>(c.before.size())), c.before);
        toLogProps(u.initAfter(static_cast<unsigned>(c.after.size())), c.after);
        break;
      }
      }
    }

    auto words = capnp::messageToFlatArray(message);
    auto bytes = words.asBytes();
    return std::string(reinterpret_cast<const char *>(bytes.begin()), bytes.size());
  }

  ChangeBatch decodeChangeBatch(std::string_view bytes)
  {
    if (bytes.empty() || bytes.size() % sizeof(capnp::word) != 0)
      throw StorageError("corrupt change batch: bad length");

    // sqlite hands out unaligned memory, copy into words
    auto words = kj::heapArray<capnp::word>(bytes.size() / sizeof(capnp::word));
    std::memcpy(words.begin(), bytes.data(), bytes.size());

    ChangeBatch out{};
    try
    {
      capnp::FlatArrayMessageReader reader(words);
      auto root = reader.getRoot<log::ChangeBatch>();
      out.timestampMs = root.getTimestampMs();
      for (auto r : root.getChanges())
      {
        Change c{};
        switch (r.which())
        {
        case log::Change::CREATED:
          c.op = ChangeOp::Created;
          fromLogEntity(r.getCreated(), c);
          break;
        case log::Change::DELETED:
          c.op = ChangeOp::Deleted;
          fromLogEntity(r.getDeleted(), c);
          break;
        case log::Change::UPDATED:
        {
          auto u = r.getUpdated();
          c.op = ChangeOp::Updated;
          c.ref.id = u.getId();
          c.kind = fromLogKind(u.getKind());
          c.before = fromLogProps(u.getBefore());
          c.after = fromLogProps(u.getAfter());
          break;
        }
        default:
          throw StorageError("corrupt change batch: unknown change kind");
        }
        out.changes.push_back(std::move(c));
      }
    }
    catch (const kj::Exception &e)
    {
      KJ_LOG(ERROR, "change batch failed to decode", e.getDescription());
      throw StorageError(std::string("corrupt change batch: ") + e.getDescription().cStr());
    }
    return out;
  }

} // namespace quasar
