#include "snapshot_holder.hpp"

#include "internal/util/errors.hpp"

namespace market::cache {

SnapshotHolder::SnapshotHolder() : current_(std::make_shared<const Snapshot>()) {
}

std::shared_ptr<const Snapshot> SnapshotHolder::Current() const {
  return current_.load(std::memory_order_acquire);
}

void SnapshotHolder::Publish(std::shared_ptr<const Snapshot> snapshot) {
  if (!snapshot) {
    throw util::InvalidArgument("cannot publish an empty snapshot pointer");
  }
  current_.store(std::move(snapshot), std::memory_order_release);
  version_.fetch_add(1, std::memory_order_acq_rel);
}

uint64_t SnapshotHolder::Version() const {
  return version_.load(std::memory_order_acquire);
}

} // namespace market::cache
