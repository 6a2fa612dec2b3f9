#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/auth/auth_gate.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using relay::auth::AuthGate;
using relay::auth::AuthOptions;
using relay::db::memory::MemoryRepository;
using relay::util::TimePoint;

AuthOptions TestOptions() {
  AuthOptions options;
  options.secret_key        = "auth-gate-test-key";
  options.pbkdf2_iterations = 1000;
  return options;
}

relay::v1::DeviceClaim Claim(const std::string& id, const std::string& name = "kitchen phone") {
  relay::v1::DeviceClaim claim;
  claim.set_claim_id(id);
  claim.set_name(name);
  return claim;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  TimePoint                         now        = relay::util::FromUnixMillis(1'700'000'000'000ULL);
  std::unique_ptr<AuthGate>         gate;

  explicit Fixture(AuthGate::CodeGenerator generator = {}) {
    gate = std::make_unique<AuthGate>(repository, TestOptions(), [this] { return now; }, std::move(generator));
  }
};

void TestPairingCodeRedeemsOnce() {
  Fixture f([] { return std::string("ab12cd"); });

  const auto issue = f.gate->IssuePairingCode(Claim("install-1"));
  assert(issue.code == "AB12CD");
  assert(issue.expires_at == f.now + std::chrono::minutes(10));

  assert(Throws<relay::util::InvalidState>([&] { (void)f.gate->LookupPairing("AB12CD"); }));

  relay::v1::DeviceInfo info;
  info.set_model("Pixel 7");
  const auto redeemed = f.gate->RedeemPairingCode("ab12cd", "", info);
  assert(!redeemed.device_id.empty());
  assert(redeemed.device_secret.size() == 32);
  assert(!redeemed.tokens.access_token.empty());
  assert(!redeemed.tokens.refresh_token.empty());
  assert(redeemed.tokens.expires_in_sec == 3600);

  assert(f.gate->LookupPairing("AB12CD") == redeemed.device_id);

  assert(Throws<relay::util::InvalidOrExpiredCode>([&] { (void)f.gate->RedeemPairingCode("AB12CD", "", info); }));
  assert(Throws<relay::util::InvalidOrExpiredCode>([&] { (void)f.gate->RedeemPairingCode("FFFFFF", "", info); }));
  assert(Throws<relay::util::NotFound>([&] { (void)f.gate->LookupPairing("FFFFFF"); }));

  auto tx     = f.repository->Begin();
  auto device = f.repository->GetDevice(*tx, redeemed.device_id);
  tx->Commit();
  assert(device.has_value());
  assert(device->name == "kitchen phone");
  assert(device->paired);
  assert(device->presence == relay::v1::PRESENCE_OFFLINE);
  assert(device->secret_hash != redeemed.device_secret);
}

void TestExpiredPairingCodeIsRejected() {
  Fixture f([] { return std::string("0A0B0C"); });
  (void)f.gate->IssuePairingCode(Claim("install-2"));

  f.now += std::chrono::minutes(10);
  assert(Throws<relay::util::InvalidOrExpiredCode>([&] { (void)f.gate->RedeemPairingCode("0A0B0C", "late", {}); }));
}

void TestLiveClaimCannotIssueTwice() {
  int  counter = 0;
  Fixture f([&counter] { return std::string("C0DE0") + std::to_string(counter++ % 10); });

  (void)f.gate->IssuePairingCode(Claim("install-3"));
  assert(Throws<relay::util::AlreadyExists>([&] { (void)f.gate->IssuePairingCode(Claim("install-3")); }));
  assert(Throws<relay::util::InvalidArgument>([&] { (void)f.gate->IssuePairingCode(Claim("")); }));

  // Once the first code lapses the claim may ask again.
  f.now += std::chrono::minutes(11);
  const auto again = f.gate->IssuePairingCode(Claim("install-3"));
  assert(!again.code.empty());
}

void TestCollidingGeneratorRetriesThenGivesUp() {
  Fixture f([] { return std::string("SAME00"); });
  (void)f.gate->IssuePairingCode(Claim("install-4"));
  assert(Throws<relay::util::ResourceExhausted>([&] { (void)f.gate->IssuePairingCode(Claim("install-5")); }));
}

void TestAccessTokenVerification() {
  Fixture    f([] { return std::string("111111"); });
  (void)f.gate->IssuePairingCode(Claim("install-6"));
  const auto redeemed = f.gate->RedeemPairingCode("111111", "garage cam", {});

  const auto identity = f.gate->VerifyAccessToken(redeemed.tokens.access_token);
  assert(identity.subject == redeemed.device_id);
  assert(identity.role == relay::v1::ROLE_DEVICE);
  assert(identity.device_id == redeemed.device_id);

  assert(Throws<relay::util::TokenInvalid>([&] { (void)f.gate->VerifyAccessToken(redeemed.tokens.refresh_token); }));
  assert(Throws<relay::util::TokenInvalid>([&] { (void)f.gate->VerifyAccessToken("garbage"); }));

  f.now += std::chrono::hours(1);
  assert(Throws<relay::util::TokenExpired>([&] { (void)f.gate->VerifyAccessToken(redeemed.tokens.access_token); }));
}

void TestRefreshAndRevocation() {
  Fixture    f([] { return std::string("222222"); });
  (void)f.gate->IssuePairingCode(Claim("install-7"));
  const auto redeemed = f.gate->RedeemPairingCode("222222", "porch", {});

  f.now += std::chrono::hours(2);
  const auto refreshed = f.gate->Refresh(redeemed.tokens.refresh_token);
  assert(refreshed.refresh_token.empty());
  assert(f.gate->VerifyAccessToken(refreshed.access_token).device_id == redeemed.device_id);

  assert(Throws<relay::util::RefreshInvalid>([&] { (void)f.gate->Refresh(redeemed.tokens.access_token); }));
  assert(Throws<relay::util::RefreshInvalid>([&] { (void)f.gate->Refresh("not.a.token"); }));

  f.gate->RevokeDevice(redeemed.device_id);
  assert(Throws<relay::util::RefreshInvalid>([&] { (void)f.gate->Refresh(redeemed.tokens.refresh_token); }));

  f.now += std::chrono::hours(24 * 8);
  // A fresh login after revocation gets a working refresh token again.
  const auto login = f.gate->LoginDevice(redeemed.device_id, redeemed.device_secret);
  assert(!f.gate->Refresh(login.refresh_token).access_token.empty());
}

void TestDeviceLogin() {
  Fixture    f([] { return std::string("333333"); });
  (void)f.gate->IssuePairingCode(Claim("install-8"));
  const auto redeemed = f.gate->RedeemPairingCode("333333", "hall", {});

  const auto tokens = f.gate->LoginDevice(redeemed.device_id, redeemed.device_secret);
  assert(f.gate->VerifyAccessToken(tokens.access_token).subject == redeemed.device_id);

  assert(Throws<relay::util::AuthFailure>([&] { (void)f.gate->LoginDevice(redeemed.device_id, "wrong"); }));
  assert(Throws<relay::util::AuthFailure>([&] { (void)f.gate->LoginDevice("no-such-device", redeemed.device_secret); }));
}

void TestControllerCredentialsAreScoped() {
  Fixture    f([] { return std::string("444444"); });
  (void)f.gate->IssuePairingCode(Claim("install-9"));
  const auto redeemed = f.gate->RedeemPairingCode("444444", "nursery", {});

  const auto controller = f.gate->RegisterController(redeemed.device_id, "parent tablet");
  assert(!controller.controller_id.empty());

  const auto identity = f.gate->VerifyAccessToken(controller.tokens.access_token);
  assert(identity.subject == controller.controller_id);
  assert(identity.role == relay::v1::ROLE_CONTROLLER);
  assert(identity.device_id == redeemed.device_id);

  assert(Throws<relay::util::NotFound>([&] { (void)f.gate->RegisterController("no-such-device", "x"); }));

  // Revoking the device also revokes refresh tokens scoped to it.
  f.gate->RevokeDevice(redeemed.device_id);
  assert(Throws<relay::util::RefreshInvalid>([&] { (void)f.gate->Refresh(controller.tokens.refresh_token); }));
}

} // namespace

int main() {
  TestPairingCodeRedeemsOnce();
  TestExpiredPairingCodeIsRejected();
  TestLiveClaimCannotIssueTwice();
  TestCollidingGeneratorRetriesThenGivesUp();
  TestAccessTokenVerification();
  TestRefreshAndRevocation();
  TestDeviceLogin();
  TestControllerCredentialsAreScoped();

  std::cout << "relay_unit_auth_gate: pass\n";
  return 0;
}
