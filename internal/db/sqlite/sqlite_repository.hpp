#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&) override;
  std::vector<model::DeviceRecord> ListDevices(Transaction&) override;
  Result UpdateDevice(Transaction&, const model::DeviceRecord&) override;

  Result InsertCommand(Transaction&, model::CommandRecord&) override;
  std::optional<model::CommandRecord> GetCommand(Transaction&, const std::string&) override;
  Result UpdateCommand(Transaction&, const model::CommandRecord&) override;
  std::vector<model::CommandRecord> ListCommandsByDevice(Transaction&, const std::string& device_id,
                                                         uint32_t limit, uint32_t offset) override;
  uint64_t CountCommandsByDevice(Transaction&, const std::string& device_id) override;
  std::vector<model::CommandRecord> ListOpenCommands(Transaction&) override;

  Result InsertPairingCode(Transaction&, const model::PairingCodeRecord&) override;
  std::optional<model::PairingCodeRecord> GetPairingCode(Transaction&, const std::string&) override;
  Result UpdatePairingCode(Transaction&, const model::PairingCodeRecord&) override;
  std::optional<model::PairingCodeRecord> FindLivePairingCodeByClaim(Transaction&, const std::string& claim_id,
                                                                     uint64_t now_ms) override;
  Result DeleteExpiredPairingCodes(Transaction&, uint64_t now_ms) override;

  Result InsertRefreshToken(Transaction&, const model::RefreshTokenRecord&) override;
  std::optional<model::RefreshTokenRecord> GetRefreshToken(Transaction&, const std::string&) override;
  Result RevokeRefreshTokensForDevice(Transaction&, const std::string& device_id) override;

private:
  std::shared_ptr<SqliteDB> db_;
  std::mutex                serial_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace relay::db::sqlite
