#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace fair
{

class TicketOverflow: public std::overflow_error
{
public:
  TicketOverflow();
};

// FIFO gate made of two counters, as in a ticket spinlock
// https://lwn.net/Articles/267968/
// Unlike a ticket lock the holder of a ticket decides when to pass the turn on,
// so the position in the queue is decoupled from how long the resource is held.
class TicketSequencer
{
public:
  using Ticket = std::uint64_t;
  static constexpr std::size_t sDefaultSpinCount = 128;
  // the counter is not allowed to reach this value, so no ticket is ever handed out twice
  static constexpr Ticket sLastTicket = std::numeric_limits<Ticket>::max();
private:
  static constexpr std::size_t hardware_destructive_interference_size = 64;
  alignas(hardware_destructive_interference_size) std::atomic<Ticket> mNext;
  alignas(hardware_destructive_interference_size) std::atomic<Ticket> mServing;
  alignas(hardware_destructive_interference_size) std::atomic<std::size_t> mParked;
  const std::size_t mSpinCount;
  std::mutex mLock;
  std::condition_variable mCond;
private:
  bool spinUntilServing(Ticket ticket) const;
public:
  explicit TicketSequencer(std::size_t spinCount = sDefaultSpinCount, Ticket first = 0);
  TicketSequencer(const TicketSequencer&) = delete;
  TicketSequencer& operator=(const TicketSequencer&) = delete;
  Ticket enqueue();
  std::optional<Ticket> tryEnqueue();
  void waitForTurn(Ticket ticket);
  bool isServing(Ticket ticket) const;
  void advance();
  Ticket nextTicket() const;
  Ticket nowServing() const;
};

}
