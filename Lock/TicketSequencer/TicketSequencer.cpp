#include "TicketSequencer.hpp"
#include <thread>

namespace fair
{

TicketOverflow::TicketOverflow(): std::overflow_error("ticket counter overflow") {}

TicketSequencer::TicketSequencer(std::size_t spinCount, Ticket first)
  : mNext(first)
  , mServing(first)
  , mParked(0)
  , mSpinCount(spinCount) {}

TicketSequencer::Ticket TicketSequencer::enqueue()
{
  // acq_rel for the same reason as in a ticket lock: a later exchange must read
  // the value stored by the previous one, not an older one
  auto ticket = mNext.load(std::memory_order_relaxed);
  do
  {
    // the counter never wraps, it stays at the limit and every later call throws
    if(ticket == sLastTicket)
    {
      throw TicketOverflow();
    }
  }
  while(!mNext.compare_exchange_weak(ticket, ticket + 1, std::memory_order_acq_rel, std::memory_order_relaxed));
  return ticket;
}

std::optional<TicketSequencer::Ticket> TicketSequencer::tryEnqueue()
{
  auto serving = mServing.load(std::memory_order_acquire);
  if(serving == sLastTicket)
  {
    throw TicketOverflow();
  }
  auto expected = serving;
  // mServing <= mNext and only the owner of mServing may advance it,
  // so a successful exchange means nobody is queued and the ticket is served now
  if(!mNext.compare_exchange_strong(expected, serving + 1, std::memory_order_acq_rel, std::memory_order_relaxed))
  {
    return std::nullopt;
  }
  return serving;
}

bool TicketSequencer::spinUntilServing(Ticket ticket) const
{
  for(std::size_t i = 0; i < mSpinCount; ++i)
  {
    if(isServing(ticket))
    {
      return true;
    }
    if(i % 16 == 15)
    {
      std::this_thread::yield();
    }
  }
  return isServing(ticket);
}

void TicketSequencer::waitForTurn(Ticket ticket)
{
  if(spinUntilServing(ticket))
  {
    return;
  }
  std::unique_lock lk(mLock);
  // mParked and mServing are both seq_cst here and in advance():
  // either the predicate sees the new value or advance() sees a parked thread
  mParked.fetch_add(1);
  mCond.wait(lk, [this, ticket](){ return mServing.load() == ticket; });
  mParked.fetch_sub(1);
}

bool TicketSequencer::isServing(Ticket ticket) const
{
  return mServing.load(std::memory_order_acquire) == ticket;
}

void TicketSequencer::advance()
{
  mServing.fetch_add(1);
  if(mParked.load() == 0)
  {
    return;
  }
  {
    std::lock_guard lk(mLock);
  }
  // waiters park on distinct tickets, only one of them is served next
  mCond.notify_all();
}

TicketSequencer::Ticket TicketSequencer::nextTicket() const
{
  return mNext.load(std::memory_order_relaxed);
}

TicketSequencer::Ticket TicketSequencer::nowServing() const
{
  return mServing.load(std::memory_order_relaxed);
}

}
