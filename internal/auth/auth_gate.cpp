#include "auth_gate.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/auth/secret_hasher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace relay::auth {

namespace {

constexpr int kPairingAttempts = 16;

std::string NormalizeCode(std::string code) {
  std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return code;
}

bool IsExpired(int64_t exp_s, int64_t now_s) {
  return exp_s != 0 && exp_s <= now_s;
}

} // namespace

AuthGate::AuthGate(std::shared_ptr<db::Repository> repository, AuthOptions options, util::ClockFn clock, CodeGenerator generator)
    : repository_(std::move(repository)),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)),
      generator_(generator ? std::move(generator) : CodeGenerator(&AuthGate::RandomPairingCode)),
      codec_(options_.secret_key) {
  if (!repository_) {
    throw std::invalid_argument("AuthGate requires a repository");
  }
}

std::string AuthGate::RandomPairingCode() {
  static constexpr char kAlphabet[] = "0123456789ABCDEF";
  const auto            raw         = RandomBytes(3);
  std::string           code;
  code.reserve(6);
  for (unsigned char b : raw) {
    code.push_back(kAlphabet[b >> 4]);
    code.push_back(kAlphabet[b & 0x0F]);
  }
  return code;
}

// ---------------------------------------------------------------------------
// Pairing
// ---------------------------------------------------------------------------

PairingIssue AuthGate::IssuePairingCode(const relay::v1::DeviceClaim& claim) {
  if (claim.claim_id().empty()) {
    throw util::InvalidArgument("device claim requires claim_id");
  }

  const auto now    = clock_();
  const auto now_ms = util::ToUnixMillis(now);

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteExpiredPairingCodes(*tx, now_ms), "purge pairing codes");

  if (repository_->FindLivePairingCodeByClaim(*tx, claim.claim_id(), now_ms)) {
    throw util::AlreadyExists("claim already holds a live pairing code");
  }

  db::model::PairingCodeRecord record;
  record.claim_id      = claim.claim_id();
  record.claim_name    = claim.name();
  record.created_at_ms = now_ms;
  record.expires_at_ms = util::ToUnixMillis(now + options_.pairing_ttl);

  for (int attempt = 0; attempt < kPairingAttempts; ++attempt) {
    auto candidate = NormalizeCode(generator_());
    if (repository_->GetPairingCode(*tx, candidate)) {
      continue;
    }
    record.code = std::move(candidate);
    break;
  }
  if (record.code.empty()) {
    throw util::ResourceExhausted("no free pairing code after retries");
  }

  db::ThrowIfError(repository_->InsertPairingCode(*tx, record), "insert pairing code");
  tx->Commit();

  RELAY_LOG_INFO("pairing code issued", {observability::StringField("claim_id", record.claim_id)});
  return PairingIssue{record.code, util::FromUnixMillis(record.expires_at_ms)};
}

RedeemedDevice AuthGate::RedeemPairingCode(const std::string& code, const std::string& name, const relay::v1::DeviceInfo& info) {
  const auto normalized = NormalizeCode(code);
  const auto now        = clock_();
  const auto now_ms     = util::ToUnixMillis(now);

  std::lock_guard lock(redemption_mutex_);
  auto            tx = repository_->Begin();

  auto pairing = repository_->GetPairingCode(*tx, normalized);
  if (!pairing || pairing->redeemed || pairing->expires_at_ms <= now_ms) {
    throw util::InvalidOrExpiredCode("pairing code is unknown, expired or already used");
  }

  RedeemedDevice out;
  out.device_id     = util::NewId();
  out.device_secret = GenerateDeviceSecret();

  db::model::DeviceRecord device;
  device.id            = out.device_id;
  device.name          = !name.empty() ? name : (!pairing->claim_name.empty() ? pairing->claim_name : info.name());
  device.secret_hash   = HashSecret(out.device_secret, options_.pbkdf2_iterations);
  device.info_json     = util::ToJson(info);
  device.presence      = relay::v1::PRESENCE_OFFLINE;
  device.created_at_ms = now_ms;
  device.paired        = true;
  db::ThrowIfError(repository_->InsertDevice(*tx, device), "insert device");

  pairing->redeemed  = true;
  pairing->device_id = out.device_id;
  db::ThrowIfError(repository_->UpdatePairingCode(*tx, *pairing), "consume pairing code");

  out.tokens = MintTokens(*tx, out.device_id, relay::v1::ROLE_DEVICE, out.device_id, util::ToUnixSeconds(now));
  tx->Commit();

  RELAY_LOG_INFO("device paired", {observability::DeviceField(out.device_id), observability::StringField("name", device.name)});
  return out;
}

std::string AuthGate::LookupPairing(const std::string& code) {
  auto tx      = repository_->Begin();
  auto pairing = repository_->GetPairingCode(*tx, NormalizeCode(code));
  tx->Commit();

  if (!pairing) {
    throw util::NotFound("pairing code not found");
  }
  if (!pairing->redeemed) {
    throw util::InvalidState("pairing code has not been redeemed yet");
  }
  return pairing->device_id;
}

// ---------------------------------------------------------------------------
// Tokens
// ---------------------------------------------------------------------------

std::string AuthGate::MintAccessToken(const std::string& subject, relay::v1::Role role, const std::string& device_id, int64_t now_s) const {
  relay::v1::TokenClaims claims;
  claims.set_sub(subject);
  claims.set_role(role);
  claims.set_iat(now_s);
  claims.set_exp(now_s + options_.access_ttl.count());
  claims.set_jti(util::NewId());
  claims.set_device_id(device_id);
  return codec_.Encode(claims);
}

IssuedTokens AuthGate::MintTokens(db::Transaction& tx, const std::string& subject, relay::v1::Role role, const std::string& device_id, int64_t now_s) {
  relay::v1::TokenClaims refresh;
  refresh.set_sub(subject);
  refresh.set_role(role);
  refresh.set_iat(now_s);
  refresh.set_exp(options_.refresh_ttl.count() > 0 ? now_s + options_.refresh_ttl.count() : 0);
  refresh.set_jti(util::NewId());
  refresh.set_refresh(true);
  refresh.set_device_id(device_id);

  db::model::RefreshTokenRecord record;
  record.jti           = refresh.jti();
  record.subject       = subject;
  record.role          = role;
  record.device_id     = device_id;
  record.issued_at_ms  = static_cast<uint64_t>(now_s) * 1000;
  record.expires_at_ms = refresh.exp() > 0 ? static_cast<uint64_t>(refresh.exp()) * 1000 : 0;
  db::ThrowIfError(repository_->InsertRefreshToken(tx, record), "insert refresh token");

  IssuedTokens tokens;
  tokens.access_token   = MintAccessToken(subject, role, device_id, now_s);
  tokens.refresh_token  = codec_.Encode(refresh);
  tokens.expires_in_sec = options_.access_ttl.count();
  return tokens;
}

Identity AuthGate::VerifyAccessToken(const std::string& token) const {
  const auto claims = codec_.Decode(token);
  if (claims.refresh()) {
    throw util::TokenInvalid("refresh token presented as access token");
  }
  if (IsExpired(claims.exp(), util::ToUnixSeconds(clock_()))) {
    throw util::TokenExpired("access token expired");
  }

  Identity identity;
  identity.subject   = claims.sub();
  identity.role      = claims.role();
  identity.device_id = claims.role() == relay::v1::ROLE_DEVICE ? claims.sub() : claims.device_id();
  if (identity.device_id.empty()) {
    throw util::TokenInvalid("token carries no device scope");
  }
  return identity;
}

IssuedTokens AuthGate::Refresh(const std::string& refresh_token) {
  relay::v1::TokenClaims claims;
  try {
    claims = codec_.Decode(refresh_token);
  } catch (const util::TokenInvalid& e) {
    throw util::RefreshInvalid(e.what());
  }

  const auto now_s = util::ToUnixSeconds(clock_());
  if (!claims.refresh() || claims.jti().empty()) {
    throw util::RefreshInvalid("not a refresh token");
  }
  if (IsExpired(claims.exp(), now_s)) {
    throw util::RefreshInvalid("refresh token expired");
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetRefreshToken(*tx, claims.jti());
  tx->Commit();
  if (!record || record->revoked || record->subject != claims.sub()) {
    throw util::RefreshInvalid("refresh token unknown or revoked");
  }

  IssuedTokens tokens;
  tokens.access_token   = MintAccessToken(claims.sub(), claims.role(), claims.device_id(), now_s);
  tokens.expires_in_sec = options_.access_ttl.count();
  return tokens;
}

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

IssuedTokens AuthGate::LoginDevice(const std::string& device_id, const std::string& secret) {
  auto tx     = repository_->Begin();
  auto device = repository_->GetDevice(*tx, device_id);
  if (!device || !device->paired || !VerifySecret(secret, device->secret_hash)) {
    throw util::AuthFailure("unknown device or bad secret");
  }

  auto tokens = MintTokens(*tx, device_id, relay::v1::ROLE_DEVICE, device_id, util::ToUnixSeconds(clock_()));
  tx->Commit();
  return tokens;
}

ControllerCredentials AuthGate::RegisterController(const std::string& device_id, const std::string& name) {
  auto tx     = repository_->Begin();
  auto device = repository_->GetDevice(*tx, device_id);
  if (!device || !device->paired) {
    throw util::NotFound("device not found: " + device_id);
  }

  ControllerCredentials out;
  out.controller_id = util::NewId();
  out.tokens        = MintTokens(*tx, out.controller_id, relay::v1::ROLE_CONTROLLER, device_id, util::ToUnixSeconds(clock_()));
  tx->Commit();

  RELAY_LOG_INFO("controller registered",
                 {observability::StringField("controller_id", out.controller_id), observability::DeviceField(device_id),
                  observability::StringField("name", name)});
  return out;
}

void AuthGate::RevokeDevice(const std::string& device_id) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->RevokeRefreshTokensForDevice(*tx, device_id), "revoke refresh tokens");
  tx->Commit();
}

} // namespace relay::auth
