#include "startup_checks.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::runtime {

using observability::StringField;
using observability::TimeField;

void CheckMasterAddress(db::Repository& repository, const std::string& master_address) {
  if (std::all_of(master_address.begin(), master_address.end(), [](unsigned char c) { return std::isspace(c); })) {
    throw util::InvalidArgument("Master contract address is not set");
  }

  auto tx     = repository.Begin();
  auto stored = repository.GetSetting(*tx, std::string(model::Setting::kMasterAddress));
  if (!stored) {
    db::ThrowIfDbError(repository.UpsertSetting(*tx, model::Setting::FromString(model::Setting::kMasterAddress, master_address)),
                       "save master address");
    tx->Commit();
  } else if (stored->value != master_address) {
    MARKET_LOG_CRITICAL("Master contract address changed",
                        {StringField("stored", stored->value), StringField("configured", master_address)});
    throw util::ConfigMismatch("Master contract changed");
  }

  MARKET_LOG_INFO("Master contract address", {StringField("address", master_address)});
}

void CheckNetwork(db::Repository& repository, bool use_mainnet) {
  auto tx     = repository.Begin();
  auto stored = repository.GetSetting(*tx, std::string(model::Setting::kInMainnet));
  if (!stored) {
    db::ThrowIfDbError(repository.UpsertSetting(*tx, model::Setting::FromBool(model::Setting::kInMainnet, use_mainnet)), "save net type");
    tx->Commit();
  } else if (stored->AsBool() != use_mainnet) {
    MARKET_LOG_CRITICAL("Net type changed", {StringField("stored", stored->value), StringField("configured", use_mainnet ? "true" : "false")});
    throw util::ConfigMismatch("Net type changed");
  }

  MARKET_LOG_INFO(use_mainnet ? "Net type: MAINnet" : "Net type: TESTnet");
}

void EnsureIgnoreNotificationsBefore(db::Repository& repository) {
  auto tx = repository.Begin();
  if (repository.GetSetting(*tx, std::string(model::Setting::kIgnoreNotificationsBefore))) {
    return;
  }

  const auto now = util::Now();
  db::ThrowIfDbError(repository.UpsertSetting(*tx, model::Setting::FromTime(model::Setting::kIgnoreNotificationsBefore, now)),
                     "save ignore_notifications_before");
  tx->Commit();
  MARKET_LOG_INFO("Notifications before this moment are ignored", {TimeField("since", now)});
}

void RunStartupChecks(db::Repository& repository, const std::string& master_address, bool use_mainnet) {
  CheckMasterAddress(repository, master_address);
  CheckNetwork(repository, use_mainnet);
  EnsureIgnoreNotificationsBefore(repository);
}

} // namespace market::runtime
