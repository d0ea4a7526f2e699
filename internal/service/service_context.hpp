#pragma once

#include <memory>

namespace market::cache { class SnapshotHolder; }
namespace market::db { class Repository; }

namespace market::service {

/*
  Dependency container shared by the query services.
*/
struct ServiceContext {
  std::shared_ptr<market::cache::SnapshotHolder> snapshots;
  std::shared_ptr<market::db::Repository>        repository;
};

}
