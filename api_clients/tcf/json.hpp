/*
 * json.hpp  Oct 2nd, 2026
 *
 * Definition of all json related helper functions that aim to simplfy
 * interacting with the boost/json external library
 *
 */

#pragma once

#include <boost/json.hpp>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace tcf::jsc {

namespace json = boost::json;

inline json::value
parse(std::string_view body)
{
  boost::system::error_code err;
  json::value val = json::parse(body, err);
  if ( err ) {
    throw SchemaError("JSON parse error: " + err.message());
  }
  return val;
}

inline const json::object&
as_obj(const json::value& v)
{
  if ( !v.is_object() ) {
    throw SchemaError("expected object");
  } else {
    return v.as_object();
  }
}

template <class T>
std::optional<T> get_or(const json::object& obj, std::string_view key)
{
  if ( auto* p = obj.if_contains(key) ) {
    if ( !p->is_null() ) {
      try {
        return json::value_to<T>(*p);
      } catch (const std::exception&) {
        std::throw_with_nested(SchemaError("unexpected type for " + std::string(key)));
      }
    }
  }
  return std::nullopt;
}

/************ results() ***********************************/
/* Every catalog endpoint wraps its collection as {"results": [...]}.
 * Anything else is a schema mismatch.
 */
inline const json::array&
results(const json::value& root)
{
  const auto* arr = as_obj(root).if_contains("results");
  if ( arr == nullptr || !arr->is_array() ) {
    throw SchemaError("body has no results array");
  }
  return arr->as_array();
}

/************ id_string() *********************************/
/* Identifiers arrive as integers but are carried as strings so node ids are
 * uniform. Accepts int64, uint64 and string, nullopt otherwise.
 */
inline std::optional<std::string>
id_string(const json::object& obj, std::string_view key)
{
  const auto* p = obj.if_contains(key);
  if ( p == nullptr ) {
    return std::nullopt;
  }

  switch ( p->kind() ) {
    case json::kind::int64:  return std::to_string(p->get_int64());
    case json::kind::uint64: return std::to_string(p->get_uint64());
    case json::kind::string: return std::string(p->get_string());
    default:                 return std::nullopt;
  }
}

/************ flat_value() ********************************/
/* Converts one member into the warehouse's flat representation: scalars
 * pass through, booleans become "true"/"false" and containers become json
 * text.
 */
inline json::value
flat_value(const json::value& v)
{
  switch ( v.kind() ) {
    case json::kind::array:
    case json::kind::object:
      return json::value(json::serialize(v));
    case json::kind::bool_:
      return json::value(v.get_bool() ? "true" : "false");
    default:
      return v;
  }
}

} // end namespace tcf::jsc
