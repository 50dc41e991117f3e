/*
 * errors.hpp  Oct 2nd, 2026
 *
 * Exception taxonomy shared by every tcf component. Node level failures are
 * contained by the fetcher, everything else here propagates out of a run.
 */

#ifndef __TCF_ERRORS_HPP
#define __TCF_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace tcf {

/************ tcf::Error **********************************/
/* Base of all tcf exceptions. Callers that only want to know "tcf failed"
 * catch this, callers that care about the class catch the children.
 */
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed or ill-typed configuration (file or flags)
class ConfigError : public Error {
public:
  using Error::Error;
};

// Resolve, connect, TLS, timeout, reset. Anything before a status line
class TransportError : public Error {
public:
  using Error::Error;
};

// Body did not have the expected shape (missing results, bad json)
class SchemaError : public Error {
public:
  using Error::Error;
};

// Checkpoint write/read failed. Fatal for the run
class PersistenceError : public Error {
public:
  using Error::Error;
};

// Illegal NodeState transition or a second claim of an in_progress node
class TransitionError : public Error {
public:
  using Error::Error;
};

// Warehouse flush exhausted its attempts
class SinkError : public Error {
public:
  using Error::Error;
};

/************ describe() **********************************/
/* Flattens a (possibly nested) exception into "outer: inner: inner" for
 * logging. Nested exceptions come from std::throw_with_nested.
 */
inline std::string
describe(const std::exception& e)
{
  std::string out = e.what();
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& inner) {
    out += ": " + describe(inner);
  } catch (...) {
    out += ": unknown nested exception";
  }
  return out;
}

} // end namespace tcf

#endif // !__TCF_ERRORS_HPP
