#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace clientiq_core {

// Coarse grouping of SQLite result codes, enough for a caller to tell
// contention from bad data from a broken database file.
enum class DbErrorKind {
  Busy,
  Constraint,
  ReadOnly,
  Io,
  CantOpen,
  // SQLCipher reports a wrong key as "file is not a database"
  WrongKeyOrCorrupt,
  DiskFull,
  Schema,
  Other
};

inline DbErrorKind classify_sqlite_error(const sqlite::sqlite_exception& e) {
  switch (e.get_code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::Busy;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::ReadOnly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
      return DbErrorKind::WrongKeyOrCorrupt;
    case SQLITE_FULL:
      return DbErrorKind::DiskFull;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Other;
  }
}

inline const char* db_error_kind_name(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::Busy: return "busy";
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::ReadOnly: return "readonly";
    case DbErrorKind::Io: return "io";
    case DbErrorKind::CantOpen: return "cantopen";
    case DbErrorKind::WrongKeyOrCorrupt: return "wrong_key_or_corrupt";
    case DbErrorKind::DiskFull: return "disk_full";
    case DbErrorKind::Schema: return "schema";
    default: return "other";
  }
}

// "<operation> failed (<kind>): <sqlite message> [sql='...'] [code=N/xcode=M]"
inline std::string describe_db_error(const std::string& operation,
                                     const sqlite::sqlite_exception& e) {
  std::string description = operation + " failed (" +
                            db_error_kind_name(classify_sqlite_error(e)) + "): " + e.errstr();
  if (!e.get_sql().empty()) {
    description += " [sql='" + e.get_sql() + "']";
  }
  description += " [code=" + std::to_string(e.get_code()) +
                 "/xcode=" + std::to_string(e.get_extended_code()) + "]";
  return description;
}

}  // namespace clientiq_core
