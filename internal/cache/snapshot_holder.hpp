#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "snapshot.hpp"

namespace market::cache {

/*
  Owns the current snapshot. Readers take a reference with Current()
  and keep using it for the whole request; Publish() swaps the pointer
  atomically, so a reader sees either the old or the new snapshot, never
  a mix. No locks on the read path.
*/
class SnapshotHolder {
 public:
  // Starts with an empty snapshot.
  SnapshotHolder();

  std::shared_ptr<const Snapshot> Current() const;

  void Publish(std::shared_ptr<const Snapshot> snapshot);

  // Number of Publish() calls so far.
  uint64_t Version() const;

 private:
  std::atomic<std::shared_ptr<const Snapshot>> current_;
  std::atomic<uint64_t>                        version_{0};
};

} // namespace market::cache
