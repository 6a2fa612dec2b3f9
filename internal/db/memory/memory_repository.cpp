#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace relay::db::memory {

namespace {

bool IsOpen(relay::v1::CommandStatus status) {
  return status == relay::v1::COMMAND_STATUS_PENDING || status == relay::v1::COMMAND_STATUS_DELIVERED ||
         status == relay::v1::COMMAND_STATUS_EXECUTING;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.devices.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.devices[r.id] = r;
  return Result::Ok();
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(id);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeviceRecord> MemoryRepository::ListDevices(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::DeviceRecord> records;
  records.reserve(s.devices.size());
  for (const auto& [_, record] : s.devices) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.devices.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.devices[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Commands
// ------------------------------------------------------------------

Result MemoryRepository::InsertCommand(Transaction& t, model::CommandRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.commands.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  r.sequence         = s.next_command_sequence++;
  s.commands[r.id]   = r;
  return Result::Ok();
}

std::optional<model::CommandRecord> MemoryRepository::GetCommand(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.commands.find(id);
  if (it == s.commands.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateCommand(Transaction& t, const model::CommandRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.commands.find(r.id);
  if (it == s.commands.end()) return Result::Err(ErrorCode::NotFound);
  const auto sequence = it->second.sequence;
  it->second          = r;
  it->second.sequence = sequence;
  return Result::Ok();
}

std::vector<model::CommandRecord> MemoryRepository::ListCommandsByDevice(Transaction& t, const std::string& device_id, uint32_t limit,
                                                                         uint32_t offset) {
  std::vector<model::CommandRecord> all;
  for (const auto& [_, record] : TX(t).View().commands)
    if (record.device_id == device_id) all.push_back(record);

  std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) { return a.sequence > b.sequence; });

  if (offset >= all.size()) return {};
  auto first = all.begin() + offset;
  auto last  = limit == 0 ? all.end() : first + std::min<std::size_t>(limit, all.end() - first);
  return {first, last};
}

uint64_t MemoryRepository::CountCommandsByDevice(Transaction& t, const std::string& device_id) {
  const auto& commands = TX(t).View().commands;
  return static_cast<uint64_t>(
      std::count_if(commands.begin(), commands.end(), [&](const auto& entry) { return entry.second.device_id == device_id; }));
}

std::vector<model::CommandRecord> MemoryRepository::ListOpenCommands(Transaction& t) {
  std::vector<model::CommandRecord> out;
  for (const auto& [_, record] : TX(t).View().commands)
    if (IsOpen(record.status)) out.push_back(record);

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return out;
}

// ------------------------------------------------------------------
// Pairing codes
// ------------------------------------------------------------------

Result MemoryRepository::InsertPairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.pairing_codes.contains(r.code)) return Result::Err(ErrorCode::AlreadyExists);
  s.pairing_codes[r.code] = r;
  return Result::Ok();
}

std::optional<model::PairingCodeRecord> MemoryRepository::GetPairingCode(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.pairing_codes.find(code);
  if (it == s.pairing_codes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdatePairingCode(Transaction& t, const model::PairingCodeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.pairing_codes.contains(r.code)) return Result::Err(ErrorCode::NotFound);
  s.pairing_codes[r.code] = r;
  return Result::Ok();
}

std::optional<model::PairingCodeRecord> MemoryRepository::FindLivePairingCodeByClaim(Transaction& t, const std::string& claim_id, uint64_t now_ms) {
  for (const auto& [_, record] : TX(t).View().pairing_codes) {
    if (record.claim_id == claim_id && !record.redeemed && record.expires_at_ms > now_ms) return record;
  }
  return std::nullopt;
}

Result MemoryRepository::DeleteExpiredPairingCodes(Transaction& t, uint64_t now_ms) {
  std::erase_if(TX(t).Mutable().pairing_codes, [&](const auto& entry) { return !entry.second.redeemed && entry.second.expires_at_ms <= now_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Refresh tokens
// ------------------------------------------------------------------

Result MemoryRepository::InsertRefreshToken(Transaction& t, const model::RefreshTokenRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.refresh_tokens.contains(r.jti)) return Result::Err(ErrorCode::AlreadyExists);
  s.refresh_tokens[r.jti] = r;
  return Result::Ok();
}

std::optional<model::RefreshTokenRecord> MemoryRepository::GetRefreshToken(Transaction& t, const std::string& jti) {
  const auto& s  = TX(t).View();
  auto        it = s.refresh_tokens.find(jti);
  if (it == s.refresh_tokens.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::RevokeRefreshTokensForDevice(Transaction& t, const std::string& device_id) {
  for (auto& [_, record] : TX(t).Mutable().refresh_tokens) {
    if (record.subject == device_id || record.device_id == device_id) record.revoked = true;
  }
  return Result::Ok();
}

} // namespace relay::db::memory
