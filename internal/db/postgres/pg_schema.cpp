#include "pg_schema.hpp"

namespace relay::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS devices (id TEXT PRIMARY KEY, name TEXT NOT NULL, secret_hash TEXT NOT NULL, info_json TEXT, status_json TEXT, settings_json TEXT NOT NULL DEFAULT '{}', presence SMALLINT NOT NULL, last_seen_ms BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, paired BOOLEAN NOT NULL DEFAULT TRUE);");
  tx.exec("CREATE TABLE IF NOT EXISTS commands (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, device_id TEXT NOT NULL REFERENCES devices(id), action TEXT NOT NULL, params_json TEXT NOT NULL DEFAULT '{}', status SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, delivered_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, error TEXT);");
  tx.exec("CREATE INDEX IF NOT EXISTS commands_device_seq ON commands(device_id, seq);");
  tx.exec("CREATE INDEX IF NOT EXISTS commands_status ON commands(status);");
  tx.exec("CREATE TABLE IF NOT EXISTS pairing_codes (code TEXT PRIMARY KEY, claim_id TEXT NOT NULL, claim_name TEXT, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, redeemed BOOLEAN NOT NULL DEFAULT FALSE, device_id TEXT);");
  tx.exec("CREATE TABLE IF NOT EXISTS refresh_tokens (jti TEXT PRIMARY KEY, subject TEXT NOT NULL, role SMALLINT NOT NULL, device_id TEXT, issued_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, revoked BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec("CREATE TABLE IF NOT EXISTS relay_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");

  tx.exec("INSERT INTO relay_schema_migrations(version) VALUES(1) ON CONFLICT (version) DO NOTHING;");

  tx.exec("SELECT id,name,secret_hash,info_json,status_json,settings_json,presence,last_seen_ms,created_at_ms,paired FROM devices LIMIT 1;");
  tx.exec("SELECT seq,id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,error FROM commands LIMIT 1;");
  tx.exec("SELECT code,claim_id,claim_name,created_at_ms,expires_at_ms,redeemed,device_id FROM pairing_codes LIMIT 1;");
  tx.exec("SELECT jti,subject,role,device_id,issued_at_ms,expires_at_ms,revoked FROM refresh_tokens LIMIT 1;");
  tx.commit();
}

} // namespace relay::db::postgres
