#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace askdoc_core {

// Short name of a primary SQLite result code for log and error text.
inline const char *sqlite_code_name(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
      return "busy";
    case SQLITE_LOCKED:
      return "locked";
    case SQLITE_CONSTRAINT:
      return "constraint";
    case SQLITE_READONLY:
      return "readonly";
    case SQLITE_IOERR:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_NOTADB:
      return "notadb";
    case SQLITE_FULL:
      return "full";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "schema";
    default:
      return "generic";
  }
}

// SQLCipher cannot tell a wrong key from a file that is not a database; both
// surface as SQLITE_NOTADB on the first read.
inline bool is_wrong_key_error(const sqlite::sqlite_exception &e) {
  return (e.get_code() & 0xff) == SQLITE_NOTADB;
}

// "<operation> failed (<code name>): <sqlite message> [xcode=..]"
inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  return operation + " failed (" + sqlite_code_name(e.get_code()) + "): " + e.errstr() +
         " [xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace askdoc_core
