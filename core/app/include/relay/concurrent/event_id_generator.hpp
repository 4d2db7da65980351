#pragma once

#include <atomic>
#include <cstdint>

namespace relay {

// -----------------------------------------------------------------------------
// EventIdGenerator: the event log's monotonic id source
// -----------------------------------------------------------------------------
//
// @brief  Produces process-wide, strictly increasing stream event ids. The
//         first id is 1; id 0 is never issued so it can mean "nothing seen".
//
// @details
// Every event the BroadcastEngine creates, in any room, takes its id from one
// shared generator. Replay relies on this: a subscriber presents the last id
// it saw and receives exactly the buffered events with a larger id. Because
// the generator is shared, ids are unique across rooms too, and a cursor
// from one room can never alias an event in another.
//
// The generator never introduces gaps. Gaps a subscriber observes come only
// from buffer eviction.
//
// Why not a global:
//   The generator is a value member of BrokerEngine and injected by reference
//   into BroadcastEngine. Tests create their own generator and so always
//   start from 1.
//
// Thread model:
//   next_id() is safe from any thread (atomic fetch_add). In the broker it is
//   only called on the request loop, but the atomic costs nothing and keeps
//   the class correct if a second loop is ever added.
// -----------------------------------------------------------------------------
class EventIdGenerator {
 public:
  EventIdGenerator() = default;

  // Non-copyable, non-movable: two copies would hand out duplicate ids.
  EventIdGenerator(const EventIdGenerator&) = delete;
  EventIdGenerator& operator=(const EventIdGenerator&) = delete;
  EventIdGenerator(EventIdGenerator&&) = delete;
  EventIdGenerator& operator=(EventIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next event id (1, 2, 3, ...).
  //
  // Side-effects: Atomically increments the internal counter.
  // -------------------------------------------------------------------------
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // last_issued()
  // -------------------------------------------------------------------------
  // @brief  The most recently issued id, or 0 if none has been issued.
  // -------------------------------------------------------------------------
  std::uint64_t last_issued() const {
    return next_id_.load(std::memory_order_relaxed) - 1;
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace relay
