#pragma once

#include <mutex>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace relay::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;
  std::mutex              serial_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

} // namespace relay::db::postgres
