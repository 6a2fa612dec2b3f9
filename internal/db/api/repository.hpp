#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/command_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/pairing_code_record.hpp"
#include "internal/db/model/refresh_token_record.hpp"

namespace relay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Command sequence numbers are assigned on insert and strictly increase,
    so ordering by sequence is creation (FIFO) order

  The DB is the source of truth for:
    devices and their secrets
    commands that must survive device absence and restarts
    pairing codes and refresh tokens
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  virtual Result InsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::DeviceRecord> ListDevices(Transaction&) = 0;

  virtual Result UpdateDevice(Transaction&, const model::DeviceRecord&) = 0;

  // ---------------------------------------------------------------------
  // Commands
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result InsertCommand(Transaction&, model::CommandRecord&) = 0;

  virtual std::optional<model::CommandRecord> GetCommand(Transaction&, const std::string& id) = 0;

  virtual Result UpdateCommand(Transaction&, const model::CommandRecord&) = 0;

  // Newest first.
  virtual std::vector<model::CommandRecord> ListCommandsByDevice(Transaction&, const std::string& device_id, uint32_t limit, uint32_t offset) = 0;

  virtual uint64_t CountCommandsByDevice(Transaction&, const std::string& device_id) = 0;

  // PENDING, DELIVERED and EXECUTING commands of every device, oldest first.
  virtual std::vector<model::CommandRecord> ListOpenCommands(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Pairing codes
  // ---------------------------------------------------------------------

  virtual Result InsertPairingCode(Transaction&, const model::PairingCodeRecord&) = 0;

  virtual std::optional<model::PairingCodeRecord> GetPairingCode(Transaction&, const std::string& code) = 0;

  virtual Result UpdatePairingCode(Transaction&, const model::PairingCodeRecord&) = 0;

  // Unredeemed code for the claim that expires after now_ms.
  virtual std::optional<model::PairingCodeRecord> FindLivePairingCodeByClaim(Transaction&, const std::string& claim_id, uint64_t now_ms) = 0;

  // Drops unredeemed codes whose expiry is at or before now_ms.
  virtual Result DeleteExpiredPairingCodes(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Refresh tokens
  // ---------------------------------------------------------------------

  virtual Result InsertRefreshToken(Transaction&, const model::RefreshTokenRecord&) = 0;

  virtual std::optional<model::RefreshTokenRecord> GetRefreshToken(Transaction&, const std::string& jti) = 0;

  // Revokes tokens whose subject is the device or that are scoped to it.
  virtual Result RevokeRefreshTokensForDevice(Transaction&, const std::string& device_id) = 0;
};

} // namespace relay::db
