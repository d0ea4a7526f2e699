#pragma once

#include <string>

#include "internal/db/api/repository.hpp"

namespace market::runtime {

/*
  One-time safety rails run before any task starts.

  The first start persists the configured identity; every later start
  must match it. A mismatch throws util::ConfigMismatch and the process
  must not continue.
*/

void CheckMasterAddress(db::Repository& repository, const std::string& master_address);

void CheckNetwork(db::Repository& repository, bool use_mainnet);

// Seeds ignore_notifications_before with the current time when absent.
void EnsureIgnoreNotificationsBefore(db::Repository& repository);

void RunStartupChecks(db::Repository& repository, const std::string& master_address, bool use_mainnet);

} // namespace market::runtime
