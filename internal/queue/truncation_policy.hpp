#pragma once

#include <cstddef>
#include <cstdint>

#include "internal/util/single_flight.hpp"

namespace outbox::worker {
class TaskScheduler;
}

namespace outbox::queue {

class PayloadQueue;

/*
  Keeps a queue within max_items by evicting its oldest records.

  Single-flight: while a pass is scheduled or running, further triggers are
  dropped rather than queued. The pass that does run lists the directory
  afresh, so it restores the bound for every enqueue that preceded it.

  The owning PayloadQueue must outlive any pass it scheduled.
*/
class TruncationPolicy {
 public:
  TruncationPolicy(PayloadQueue& queue, uint32_t max_items);

  /*
    Schedule a pass on the worker scheduler. Without a scheduler (or after
    it shut down) the pass runs on the calling thread.
  */
  void Trigger(worker::TaskScheduler* scheduler);

  /*
    Run a pass now. Returns the number of records evicted; 0 without doing
    anything when another pass holds the guard.
  */
  std::size_t Run();

  bool Running() const { return guard_.Busy(); }

 private:
  std::size_t RunGuarded();

  PayloadQueue&      queue_;
  uint32_t           max_items_;
  util::SingleFlight guard_;
};

} // namespace outbox::queue
