#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace cadence {

enum class error_kind {
  time_regression,     // clock moved backwards: caller bug, thrown
  unhandled_rejection, // promise rejected with nobody listening at quiescence
  execution_error      // a unit of work threw; logged, loop keeps going
};

// Which unit of work an error came from.
enum class origin_kind { sync_unit, macrotask, microtask, promise };

struct origin {
  origin_kind kind{origin_kind::sync_unit};
  std::uint64_t id{0};
};

struct loop_error {
  error_kind kind{error_kind::execution_error};
  origin from{};
  std::exception_ptr exception{};
};

// Caller bugs. The event loop never catches these.
class fatal_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class time_regression_error : public fatal_error {
public:
  using fatal_error::fatal_error;
};

// Thrown when a unit of work is started while another one is still on the stack.
class reentrant_run_error : public fatal_error {
public:
  using fatal_error::fatal_error;
};

class timeout_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline const char* to_string(error_kind k) noexcept {
  switch (k) {
    case error_kind::time_regression:     return "time_regression";
    case error_kind::unhandled_rejection: return "unhandled_rejection";
    case error_kind::execution_error:     return "execution_error";
  }
  return "unknown";
}

inline const char* to_string(origin_kind k) noexcept {
  switch (k) {
    case origin_kind::sync_unit: return "sync_unit";
    case origin_kind::macrotask: return "macrotask";
    case origin_kind::microtask: return "microtask";
    case origin_kind::promise:   return "promise";
  }
  return "unknown";
}

// Human-readable text of an exception_ptr (what() where available).
inline std::string describe(std::exception_ptr e) {
  if (!e) return "no error";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (const std::string& s) {
    return s;
  } catch (const char* s) {
    return s;
  } catch (...) {
    return "unknown error";
  }
}

} // namespace cadence
