#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace relay::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

} // namespace

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS devices (id TEXT PRIMARY KEY, name TEXT NOT NULL, secret_hash TEXT NOT NULL, info_json TEXT, status_json TEXT, settings_json TEXT NOT NULL DEFAULT '{}', presence INTEGER NOT NULL, last_seen_ms INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, paired INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS commands (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, device_id TEXT NOT NULL REFERENCES devices(id), action TEXT NOT NULL, params_json TEXT NOT NULL DEFAULT '{}', status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, delivered_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, error TEXT);",
      "CREATE INDEX IF NOT EXISTS commands_device_seq ON commands(device_id, seq);",
      "CREATE INDEX IF NOT EXISTS commands_status ON commands(status);",
      "CREATE TABLE IF NOT EXISTS pairing_codes (code TEXT PRIMARY KEY, claim_id TEXT NOT NULL, claim_name TEXT, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, redeemed INTEGER NOT NULL DEFAULT 0, device_id TEXT);",
      "CREATE TABLE IF NOT EXISTS refresh_tokens (jti TEXT PRIMARY KEY, subject TEXT NOT NULL, role INTEGER NOT NULL, device_id TEXT, issued_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, revoked INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS relay_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
  db.Exec("INSERT OR IGNORE INTO relay_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
          ", CAST(strftime('%s','now') AS INTEGER) * 1000);");

  db.Exec("SELECT id,name,secret_hash,info_json,status_json,settings_json,presence,last_seen_ms,created_at_ms,paired FROM devices LIMIT 1;");
  db.Exec("SELECT seq,id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,error FROM commands LIMIT 1;");
  db.Exec("SELECT code,claim_id,claim_name,created_at_ms,expires_at_ms,redeemed,device_id FROM pairing_codes LIMIT 1;");
  db.Exec("SELECT jti,subject,role,device_id,issued_at_ms,expires_at_ms,revoked FROM refresh_tokens LIMIT 1;");
}

} // namespace relay::db::sqlite
