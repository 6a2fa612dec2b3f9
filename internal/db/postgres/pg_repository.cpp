#include "pg_repository.hpp"

namespace relay::db::postgres {

namespace {

constexpr const char* kDeviceSelect =
    "SELECT id,name,secret_hash,COALESCE(info_json,''),COALESCE(status_json,''),settings_json,presence,last_seen_ms,created_at_ms,paired "
    "FROM devices ";

constexpr const char* kCommandSelect =
    "SELECT id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,COALESCE(error,''),seq FROM commands ";

constexpr const char* kPairingSelect =
    "SELECT code,claim_id,COALESCE(claim_name,''),created_at_ms,expires_at_ms,redeemed,COALESCE(device_id,'') FROM pairing_codes ";

constexpr const char* kTokenSelect =
    "SELECT jti,subject,role,COALESCE(device_id,''),issued_at_ms,expires_at_ms,revoked FROM refresh_tokens ";

model::DeviceRecord ReadDevice(const pqxx::row& row) {
  model::DeviceRecord r;
  r.id            = row[0].c_str();
  r.name          = row[1].c_str();
  r.secret_hash   = row[2].c_str();
  r.info_json     = row[3].c_str();
  r.status_json   = row[4].c_str();
  r.settings_json = row[5].c_str();
  r.presence      = static_cast<relay::v1::Presence>(row[6].as<int>());
  r.last_seen_ms  = row[7].as<uint64_t>();
  r.created_at_ms = row[8].as<uint64_t>();
  r.paired        = row[9].as<bool>();
  return r;
}

model::CommandRecord ReadCommand(const pqxx::row& row) {
  model::CommandRecord r;
  r.id              = row[0].c_str();
  r.device_id       = row[1].c_str();
  r.action          = row[2].c_str();
  r.params_json     = row[3].c_str();
  r.status          = static_cast<relay::v1::CommandStatus>(row[4].as<int>());
  r.created_at_ms   = row[5].as<uint64_t>();
  r.delivered_at_ms = row[6].as<uint64_t>();
  r.completed_at_ms = row[7].as<uint64_t>();
  r.error           = row[8].c_str();
  r.sequence        = row[9].as<uint64_t>();
  return r;
}

model::PairingCodeRecord ReadPairing(const pqxx::row& row) {
  model::PairingCodeRecord r;
  r.code          = row[0].c_str();
  r.claim_id      = row[1].c_str();
  r.claim_name    = row[2].c_str();
  r.created_at_ms = row[3].as<uint64_t>();
  r.expires_at_ms = row[4].as<uint64_t>();
  r.redeemed      = row[5].as<bool>();
  r.device_id     = row[6].c_str();
  return r;
}

model::RefreshTokenRecord ReadToken(const pqxx::row& row) {
  model::RefreshTokenRecord r;
  r.jti           = row[0].c_str();
  r.subject       = row[1].c_str();
  r.role          = static_cast<relay::v1::Role>(row[2].as<int>());
  r.device_id     = row[3].c_str();
  r.issued_at_ms  = row[4].as<uint64_t>();
  r.expires_at_ms = row[5].as<uint64_t>();
  r.revoked       = row[6].as<bool>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, serial_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result PgRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO devices(id,name,secret_hash,info_json,status_json,settings_json,presence,last_seen_ms,created_at_ms,paired) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10);",
        r.id, r.name, r.secret_hash, r.info_json, r.status_json, r.settings_json, static_cast<int>(r.presence), r.last_seen_ms, r.created_at_ms,
        r.paired);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeviceRecord> PgRepository::GetDevice(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_device", id);
  if (res.empty()) return std::nullopt;
  return ReadDevice(res[0]);
}

std::vector<model::DeviceRecord> PgRepository::ListDevices(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kDeviceSelect) + "ORDER BY id;");

  std::vector<model::DeviceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDevice(row));
  return out;
}

Result PgRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_device", r.id, r.name, r.secret_hash, r.info_json, r.status_json, r.settings_json,
                                          static_cast<int>(r.presence), r.last_seen_ms, r.paired);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Commands
// ------------------------------------------------------------------

Result PgRepository::InsertCommand(Transaction& t, model::CommandRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO commands(id,device_id,action,params_json,status,created_at_ms,delivered_at_ms,completed_at_ms,error) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING seq;",
        r.id, r.device_id, r.action, r.params_json, static_cast<int>(r.status), r.created_at_ms, r.delivered_at_ms, r.completed_at_ms, r.error);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CommandRecord> PgRepository::GetCommand(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_command", id);
  if (res.empty()) return std::nullopt;
  return ReadCommand(res[0]);
}

Result PgRepository::UpdateCommand(Transaction& t, const model::CommandRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_command", r.id, static_cast<int>(r.status), r.delivered_at_ms, r.completed_at_ms, r.error);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CommandRecord> PgRepository::ListCommandsByDevice(Transaction& t, const std::string& device_id, uint32_t limit,
                                                                     uint32_t offset) {
  // LIMIT NULL means unbounded
  std::optional<int64_t> bounded;
  if (limit > 0) bounded = limit;

  auto res = TX(t).Work().exec_params(std::string(kCommandSelect) + "WHERE device_id=$1 ORDER BY seq DESC LIMIT $2 OFFSET $3;", device_id, bounded,
                                      static_cast<int64_t>(offset));

  std::vector<model::CommandRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCommand(row));
  return out;
}

uint64_t PgRepository::CountCommandsByDevice(Transaction& t, const std::string& device_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM commands WHERE device_id=$1;", device_id);
  return res[0][0].as<uint64_t>();
}

std::vector<model::CommandRecord> PgRepository::ListOpenCommands(Transaction& t) {
  auto res = TX(t).Work().exec_params(std::string(kCommandSelect) + "WHERE status IN ($1,$2,$3) ORDER BY seq ASC;",
                                      static_cast<int>(relay::v1::COMMAND_STATUS_PENDING), static_cast<int>(relay::v1::COMMAND_STATUS_DELIVERED),
                                      static_cast<int>(relay::v1::COMMAND_STATUS_EXECUTING));

  std::vector<model::CommandRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCommand(row));
  return out;
}

// ------------------------------------------------------------------
// Pairing codes
// ------------------------------------------------------------------

Result PgRepository::InsertPairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO pairing_codes(code,claim_id,claim_name,created_at_ms,expires_at_ms,redeemed,device_id) VALUES($1,$2,$3,$4,$5,$6,$7);", r.code,
        r.claim_id, r.claim_name, r.created_at_ms, r.expires_at_ms, r.redeemed, r.device_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PairingCodeRecord> PgRepository::GetPairingCode(Transaction& t, const std::string& code) {
  auto res = TX(t).Work().exec_params(std::string(kPairingSelect) + "WHERE code=$1;", code);
  if (res.empty()) return std::nullopt;
  return ReadPairing(res[0]);
}

Result PgRepository::UpdatePairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  try {
    auto res =
        TX(t).Work().exec_params("UPDATE pairing_codes SET redeemed=$2,device_id=$3,expires_at_ms=$4 WHERE code=$1;", r.code, r.redeemed, r.device_id,
                                 r.expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.code);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PairingCodeRecord> PgRepository::FindLivePairingCodeByClaim(Transaction& t, const std::string& claim_id, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(std::string(kPairingSelect) + "WHERE claim_id=$1 AND NOT redeemed AND expires_at_ms>$2 LIMIT 1;", claim_id,
                                      now_ms);
  if (res.empty()) return std::nullopt;
  return ReadPairing(res[0]);
}

Result PgRepository::DeleteExpiredPairingCodes(Transaction& t, uint64_t now_ms) {
  try {
    TX(t).Work().exec_params("DELETE FROM pairing_codes WHERE NOT redeemed AND expires_at_ms<=$1;", now_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Refresh tokens
// ------------------------------------------------------------------

Result PgRepository::InsertRefreshToken(Transaction& t, const model::RefreshTokenRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO refresh_tokens(jti,subject,role,device_id,issued_at_ms,expires_at_ms,revoked) VALUES($1,$2,$3,$4,$5,$6,$7);",
                             r.jti, r.subject, static_cast<int>(r.role), r.device_id, r.issued_at_ms, r.expires_at_ms, r.revoked);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RefreshTokenRecord> PgRepository::GetRefreshToken(Transaction& t, const std::string& jti) {
  auto res = TX(t).Work().exec_params(std::string(kTokenSelect) + "WHERE jti=$1;", jti);
  if (res.empty()) return std::nullopt;
  return ReadToken(res[0]);
}

Result PgRepository::RevokeRefreshTokensForDevice(Transaction& t, const std::string& device_id) {
  try {
    TX(t).Work().exec_params("UPDATE refresh_tokens SET revoked=TRUE WHERE subject=$1 OR device_id=$1;", device_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace relay::db::postgres
