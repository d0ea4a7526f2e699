#pragma once

#include "internal/model/entities.hpp"

namespace market::chain {

/*
  Remote source of truth for tracked entities.

  Read* fills the entity's contract fields in place, keyed by its index
  and address, and sets last_sync to the freshness the chain data is known
  correct as of. Failures throw util::RemoteFailure. No retry happens
  here; the sync scheduler owns retry.
*/
class ContractReader {
 public:
  virtual ~ContractReader() = default;

  // Throws while the connection is not usable yet.
  virtual void InitIfNeeded() = 0;

  virtual void ReadAdmin(model::Admin& admin) = 0;
  virtual void ReadUser(model::User& user)    = 0;
  virtual void ReadOrder(model::Order& order) = 0;
};

} // namespace market::chain
