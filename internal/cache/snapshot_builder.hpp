#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "snapshot.hpp"

namespace market::cache {

/*
  Builds a complete Snapshot from the store inside one read transaction.
  Either returns a fully built snapshot or throws; nothing is published
  here.
*/
class SnapshotBuilder {
 public:
  explicit SnapshotBuilder(std::shared_ptr<db::Repository> repository);

  std::shared_ptr<const Snapshot> Build();

 private:
  std::shared_ptr<db::Repository> repository_;
};

// Upper-cased name, description and technical task, used by free-text search.
std::string BuildSearchText(const model::Order& order);

} // namespace market::cache
