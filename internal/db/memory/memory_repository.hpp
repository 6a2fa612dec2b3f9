#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::DeviceRecord>                       devices;
    std::unordered_map<std::string, model::CommandRecord>            commands;
    std::unordered_map<std::string, model::PairingCodeRecord>        pairing_codes;
    std::unordered_map<std::string, model::RefreshTokenRecord>       refresh_tokens;
    uint64_t next_command_sequence = 1;
  };

  std::mutex writer_mutex_; // held by the live transaction
  State      committed_;
};

} // namespace relay::db::memory
