#ifndef WRX_EXCEPTIONS_H
#define WRX_EXCEPTIONS_H

#include "wrx_string.h"
#include <exception>
#include <cstdint>

// ============================================================================
// REPORT EXCEPTION HIERARCHY
// ============================================================================
//
// wrx_exception (base)
// ├── wrx_load_error           document could not be opened by PoDoFo
// ├── wrx_encoding_error       unsupported text encoding name
// └── wrx_parse_error          document is structurally broken
//     ├── wrx_structure_error  sentinel keys out of place
//     ├── wrx_unknown_key_error
//     └── wrx_format_error     fixed grammar or number mismatch
//
// Every parse error aborts the current document only. The pool records the
// message under the report's water right number.
//
// ============================================================================

typedef uint64_t wrx_water_right_no;

class wrx_exception : public std::exception {
protected:
  wrx_string message_;

public:
  explicit wrx_exception(const wrx_string& message)
    : message_(message) {}

  virtual ~wrx_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

// ============================================================================
// DOCUMENT ERRORS
// ============================================================================

class wrx_load_error : public wrx_exception {
public:
  using wrx_exception::wrx_exception;
};

class wrx_encoding_error : public wrx_exception {
public:
  using wrx_exception::wrx_exception;
};

// ============================================================================
// PARSE ERRORS
// ============================================================================

class wrx_parse_error : public wrx_exception {
public:
  using wrx_exception::wrx_exception;
};

class wrx_structure_error : public wrx_parse_error {
public:
  using wrx_parse_error::wrx_parse_error;
};

class wrx_unknown_key_error : public wrx_parse_error {
public:
  wrx_unknown_key_error(const wrx_string& section, const wrx_string& key, const wrx_string& values)
    : wrx_parse_error("invalid entry for the " + section + ", key: \"" + key + "\", values: " + values),
      key_(key) {}

  const wrx_string& get_key() const { return key_; }

private:
  wrx_string key_;
};

class wrx_format_error : public wrx_parse_error {
public:
  using wrx_parse_error::wrx_parse_error;
};

#endif // WRX_EXCEPTIONS_H
