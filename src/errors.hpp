#pragma once
#include <stdexcept>
#include <string>

namespace quasar
{

  struct GraphError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // lookup of an identifier that does not name an entity of the requested kind
  struct NotFoundError : GraphError
  {
    using GraphError::GraphError;
  };

  // edge endpoint does not resolve to an existing node
  struct DanglingReferenceError : GraphError
  {
    using GraphError::GraphError;
  };

  // non-cascading node delete blocked by incident edges
  struct ReferentialIntegrityError : GraphError
  {
    using GraphError::GraphError;
  };

  // property value the codec cannot round-trip
  struct TypeError : GraphError
  {
    using GraphError::GraphError;
  };

  struct StorageError : GraphError
  {
    explicit StorageError(const std::string &what, int code = 0) : GraphError(what), code_(code) {}

    // sqlite3 result code, 0 for corrupt data detected above the engine
    int code() const noexcept { return code_; }

  private:
    int code_{0};
  };

} // namespace quasar
