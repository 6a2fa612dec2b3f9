#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kDeviceColumns =
    "id,name,secret_hash,info_json,status_json,settings_json,presence,last_seen_ms,created_at_ms,paired";

constexpr const char* kCommandColumns =
    "id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,error,seq";

constexpr const char* kPairingColumns = "code,claim_id,claim_name,created_at_ms,expires_at_ms,redeemed,device_id";

constexpr const char* kTokenColumns = "jti,subject,role,device_id,issued_at_ms,expires_at_ms,revoked";

std::string Select(const char* columns, const std::string& tail) {
  return std::string("SELECT ") + columns + " " + tail;
}

model::DeviceRecord ReadDevice(sqlite3_stmt* st) {
  model::DeviceRecord r;
  r.id            = ColText(st, 0);
  r.name          = ColText(st, 1);
  r.secret_hash   = ColText(st, 2);
  r.info_json     = ColText(st, 3);
  r.status_json   = ColText(st, 4);
  r.settings_json = ColText(st, 5);
  r.presence      = static_cast<relay::v1::Presence>(ColI32(st, 6));
  r.last_seen_ms  = ColU64(st, 7);
  r.created_at_ms = ColU64(st, 8);
  r.paired        = ColI32(st, 9) != 0;
  return r;
}

model::CommandRecord ReadCommand(sqlite3_stmt* st) {
  model::CommandRecord r;
  r.id              = ColText(st, 0);
  r.device_id       = ColText(st, 1);
  r.action          = ColText(st, 2);
  r.params_json     = ColText(st, 3);
  r.status          = static_cast<relay::v1::CommandStatus>(ColI32(st, 4));
  r.created_at_ms   = ColU64(st, 5);
  r.delivered_at_ms = ColU64(st, 6);
  r.completed_at_ms = ColU64(st, 7);
  r.error           = ColText(st, 8);
  r.sequence        = ColU64(st, 9);
  return r;
}

model::PairingCodeRecord ReadPairing(sqlite3_stmt* st) {
  model::PairingCodeRecord r;
  r.code          = ColText(st, 0);
  r.claim_id      = ColText(st, 1);
  r.claim_name    = ColText(st, 2);
  r.created_at_ms = ColU64(st, 3);
  r.expires_at_ms = ColU64(st, 4);
  r.redeemed      = ColI32(st, 5) != 0;
  r.device_id     = ColText(st, 6);
  return r;
}

model::RefreshTokenRecord ReadToken(sqlite3_stmt* st) {
  model::RefreshTokenRecord r;
  r.jti           = ColText(st, 0);
  r.subject       = ColText(st, 1);
  r.role          = static_cast<relay::v1::Role>(ColI32(st, 2));
  r.device_id     = ColText(st, 3);
  r.issued_at_ms  = ColU64(st, 4);
  r.expires_at_ms = ColU64(st, 5);
  r.revoked       = ColI32(st, 6) != 0;
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, serial_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO devices(id,name,secret_hash,info_json,status_json,settings_json,presence,last_seen_ms,created_at_ms,paired) "
                      "VALUES(?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.secret_hash);
  BindText(st.get(), 4, r.info_json);
  BindText(st.get(), 5, r.status_json);
  BindText(st.get(), 6, r.settings_json);
  BindI32(st.get(), 7, static_cast<int>(r.presence));
  BindU64(st.get(), 8, r.last_seen_ms);
  BindU64(st.get(), 9, r.created_at_ms);
  BindI32(st.get(), 10, r.paired ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DeviceRecord> SqliteRepository::GetDevice(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kDeviceColumns, "FROM devices WHERE id=?;").c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDevice(st.get());
}

std::vector<model::DeviceRecord> SqliteRepository::ListDevices(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kDeviceColumns, "FROM devices ORDER BY id;").c_str());

  std::vector<model::DeviceRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadDevice(st.get()));
  return out;
}

Result SqliteRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE devices SET name=?,secret_hash=?,info_json=?,status_json=?,settings_json=?,presence=?,last_seen_ms=?,paired=? "
                      "WHERE id=?;");

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.secret_hash);
  BindText(st.get(), 3, r.info_json);
  BindText(st.get(), 4, r.status_json);
  BindText(st.get(), 5, r.settings_json);
  BindI32(st.get(), 6, static_cast<int>(r.presence));
  BindU64(st.get(), 7, r.last_seen_ms);
  BindI32(st.get(), 8, r.paired ? 1 : 0);
  BindText(st.get(), 9, r.id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Commands
// ------------------------------------------------------------------

Result SqliteRepository::InsertCommand(Transaction& t, model::CommandRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO commands(id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,error) "
                     "VALUES(?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.device_id);
  BindText(st.get(), 3, r.action);
  BindText(st.get(), 4, r.params_json);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.delivered_at_ms);
  BindU64(st.get(), 8, r.completed_at_ms);
  BindText(st.get(), 9, r.error);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::CommandRecord> SqliteRepository::GetCommand(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kCommandColumns, "FROM commands WHERE id=?;").c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadCommand(st.get());
}

Result SqliteRepository::UpdateCommand(Transaction& t, const model::CommandRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE commands SET status=?,delivered_at_ms=?,completed_at_ms=?,error=? WHERE id=?;");

  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindU64(st.get(), 2, r.delivered_at_ms);
  BindU64(st.get(), 3, r.completed_at_ms);
  BindText(st.get(), 4, r.error);
  BindText(st.get(), 5, r.id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return Translate(db, rc);
}

std::vector<model::CommandRecord> SqliteRepository::ListCommandsByDevice(Transaction& t, const std::string& device_id, uint32_t limit,
                                                                         uint32_t offset) {
  auto* db = TX(t).Handle();
  // LIMIT -1 means unbounded in sqlite
  auto st = Prepare(db, Select(kCommandColumns, "FROM commands WHERE device_id=? ORDER BY seq DESC LIMIT ? OFFSET ?;").c_str());
  BindText(st.get(), 1, device_id);
  sqlite3_bind_int64(st.get(), 2, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));
  BindU64(st.get(), 3, offset);

  std::vector<model::CommandRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadCommand(st.get()));
  return out;
}

uint64_t SqliteRepository::CountCommandsByDevice(Transaction& t, const std::string& device_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM commands WHERE device_id=?;");
  BindText(st.get(), 1, device_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

std::vector<model::CommandRecord> SqliteRepository::ListOpenCommands(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kCommandColumns, "FROM commands WHERE status IN (?,?,?) ORDER BY seq ASC;").c_str());
  BindI32(st.get(), 1, relay::v1::COMMAND_STATUS_PENDING);
  BindI32(st.get(), 2, relay::v1::COMMAND_STATUS_DELIVERED);
  BindI32(st.get(), 3, relay::v1::COMMAND_STATUS_EXECUTING);

  std::vector<model::CommandRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadCommand(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Pairing codes
// ------------------------------------------------------------------

Result SqliteRepository::InsertPairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO pairing_codes(code,claim_id,claim_name,created_at_ms,expires_at_ms,redeemed,device_id) VALUES(?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.code);
  BindText(st.get(), 2, r.claim_id);
  BindText(st.get(), 3, r.claim_name);
  BindU64(st.get(), 4, r.created_at_ms);
  BindU64(st.get(), 5, r.expires_at_ms);
  BindI32(st.get(), 6, r.redeemed ? 1 : 0);
  BindText(st.get(), 7, r.device_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PairingCodeRecord> SqliteRepository::GetPairingCode(Transaction& t, const std::string& code) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kPairingColumns, "FROM pairing_codes WHERE code=?;").c_str());
  BindText(st.get(), 1, code);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPairing(st.get());
}

Result SqliteRepository::UpdatePairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE pairing_codes SET redeemed=?,device_id=?,expires_at_ms=? WHERE code=?;");

  BindI32(st.get(), 1, r.redeemed ? 1 : 0);
  BindText(st.get(), 2, r.device_id);
  BindU64(st.get(), 3, r.expires_at_ms);
  BindText(st.get(), 4, r.code);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.code);
  return Translate(db, rc);
}

std::optional<model::PairingCodeRecord> SqliteRepository::FindLivePairingCodeByClaim(Transaction& t, const std::string& claim_id, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kPairingColumns, "FROM pairing_codes WHERE claim_id=? AND redeemed=0 AND expires_at_ms>? LIMIT 1;").c_str());
  BindText(st.get(), 1, claim_id);
  BindU64(st.get(), 2, now_ms);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPairing(st.get());
}

Result SqliteRepository::DeleteExpiredPairingCodes(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM pairing_codes WHERE redeemed=0 AND expires_at_ms<=?;");
  BindU64(st.get(), 1, now_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Refresh tokens
// ------------------------------------------------------------------

Result SqliteRepository::InsertRefreshToken(Transaction& t, const model::RefreshTokenRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO refresh_tokens(jti,subject,role,device_id,issued_at_ms,expires_at_ms,revoked) VALUES(?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.jti);
  BindText(st.get(), 2, r.subject);
  BindI32(st.get(), 3, static_cast<int>(r.role));
  BindText(st.get(), 4, r.device_id);
  BindU64(st.get(), 5, r.issued_at_ms);
  BindU64(st.get(), 6, r.expires_at_ms);
  BindI32(st.get(), 7, r.revoked ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RefreshTokenRecord> SqliteRepository::GetRefreshToken(Transaction& t, const std::string& jti) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, Select(kTokenColumns, "FROM refresh_tokens WHERE jti=?;").c_str());
  BindText(st.get(), 1, jti);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadToken(st.get());
}

Result SqliteRepository::RevokeRefreshTokensForDevice(Transaction& t, const std::string& device_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE refresh_tokens SET revoked=1 WHERE subject=? OR device_id=?;");
  BindText(st.get(), 1, device_id);
  BindText(st.get(), 2, device_id);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace relay::db::sqlite
