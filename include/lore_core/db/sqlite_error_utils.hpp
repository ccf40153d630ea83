#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace lore_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Corrupt, Generic };

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return DbErrorKind::Corrupt;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked: return "busy_or_locked";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Readonly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::Full: return "full";
    case DbErrorKind::Corrupt: return "corrupt";
    default: return "generic";
  }
}

inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  std::string msg = operation + " failed: (" + kind_to_string(classify_sqlite_code(code)) + ") " +
                    e.what();
  msg += " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) +
         "]";
  return msg;
}

}  // namespace lore_core
