#include "internal/runtime/startup_checks.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::db::memory::MemoryRepository;
using market::model::Setting;
using market::runtime::CheckMasterAddress;
using market::runtime::CheckNetwork;
using market::runtime::EnsureIgnoreNotificationsBefore;
using market::runtime::RunStartupChecks;

std::optional<Setting> Read(MemoryRepository& repo, std::string_view key) {
  auto tx      = repo.BeginRead();
  auto setting = repo.GetSetting(*tx, std::string(key));
  tx->Commit();
  return setting;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFirstStartPersistsIdentity() {
  MemoryRepository repo;
  RunStartupChecks(repo, "EQ-master", true);

  assert(Read(repo, Setting::kMasterAddress)->value == "EQ-master");
  assert(Read(repo, Setting::kInMainnet)->AsBool() == true);
  assert(Read(repo, Setting::kIgnoreNotificationsBefore)->AsTime());

  // Same identity passes again.
  RunStartupChecks(repo, "EQ-master", true);
}

void TestChangedMasterAddressIsFatal() {
  MemoryRepository repo;
  CheckMasterAddress(repo, "EQ-master");

  assert(Throws<market::util::ConfigMismatch>([&] { CheckMasterAddress(repo, "EQ-other"); }));
  assert(Read(repo, Setting::kMasterAddress)->value == "EQ-master");
}

void TestBlankMasterAddressIsRejected() {
  MemoryRepository repo;
  assert(Throws<market::util::InvalidArgument>([&] { CheckMasterAddress(repo, " \t"); }));
  assert(!Read(repo, Setting::kMasterAddress));
}

void TestChangedNetworkIsFatal() {
  MemoryRepository repo;
  CheckNetwork(repo, false);

  assert(Throws<market::util::ConfigMismatch>([&] { CheckNetwork(repo, true); }));
  CheckNetwork(repo, false);
}

void TestIgnoreNotificationsBeforeIsSeededOnce() {
  MemoryRepository repo;
  EnsureIgnoreNotificationsBefore(repo);
  const auto first = Read(repo, Setting::kIgnoreNotificationsBefore)->AsTime();

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  EnsureIgnoreNotificationsBefore(repo);
  assert(Read(repo, Setting::kIgnoreNotificationsBefore)->AsTime() == first);
}

} // namespace

int main() {
  TestFirstStartPersistsIdentity();
  TestChangedMasterAddressIsFatal();
  TestBlankMasterAddressIsRejected();
  TestChangedNetworkIsFatal();
  TestIgnoreNotificationsBeforeIsSeededOnce();

  std::cout << "market_indexer_unit_startup_checks: pass\n";
  return 0;
}
