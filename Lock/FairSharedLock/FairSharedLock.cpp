#include "FairSharedLock.hpp"
#include <cassert>
#include <thread>

namespace fair
{

FairSharedLock::FairSharedLock(std::size_t spinCount)
  : mSequencer(spinCount)
  , mReaders(0)
  , mWriterActive(false)
  , mWriterPending(false)
  , mSpinCount(spinCount) {}

void FairSharedLock::admitReader()
{
  // a writer served before us has already cleared the flag before advancing
  assert(!mWriterActive.load(std::memory_order_relaxed));
  mReaders.fetch_add(1, std::memory_order_relaxed);
  mSequencer.advance();
}

void FairSharedLock::admitWriter()
{
  assert(mReaders.load(std::memory_order_relaxed) == 0);
  mWriterActive.store(true, std::memory_order_relaxed);
}

void FairSharedLock::waitForReadersToDrain()
{
  // the turn is held, so the reader count can only go down from here
  for(std::size_t i = 0; i < mSpinCount; ++i)
  {
    if(mReaders.load(std::memory_order_acquire) == 0)
    {
      return;
    }
    if(i % 16 == 15)
    {
      std::this_thread::yield();
    }
  }
  std::unique_lock lk(mDrainLock);
  // seq_cst pairs with unlock_shared(): either we see zero readers
  // or the last reader sees the pending writer and notifies
  mWriterPending.store(true);
  mDrainCond.wait(lk, [this](){ return mReaders.load() == 0; });
  mWriterPending.store(false, std::memory_order_relaxed);
}

void FairSharedLock::lock()
{
  auto ticket = mSequencer.enqueue();
  mSequencer.waitForTurn(ticket);
  waitForReadersToDrain();
  admitWriter();
}

bool FairSharedLock::try_lock()
{
  if(!mSequencer.tryEnqueue())
  {
    return false;
  }
  if(mReaders.load(std::memory_order_acquire) != 0)
  {
    // give the turn to whoever queued behind us
    mSequencer.advance();
    return false;
  }
  admitWriter();
  return true;
}

void FairSharedLock::unlock()
{
  assert(mWriterActive.load(std::memory_order_relaxed));
  mWriterActive.store(false, std::memory_order_relaxed);
  mSequencer.advance();
}

void FairSharedLock::lock_shared()
{
  auto ticket = mSequencer.enqueue();
  mSequencer.waitForTurn(ticket);
  admitReader();
}

bool FairSharedLock::try_lock_shared()
{
  if(!mSequencer.tryEnqueue())
  {
    return false;
  }
  admitReader();
  return true;
}

void FairSharedLock::unlock_shared()
{
  auto prev = mReaders.fetch_sub(1);
  assert(prev != 0);
  if(prev == 1 && mWriterPending.load())
  {
    {
      std::lock_guard lk(mDrainLock);
    }
    mDrainCond.notify_one();
  }
}

std::size_t FairSharedLock::readerCount() const
{
  return mReaders.load(std::memory_order_relaxed);
}

bool FairSharedLock::writerActive() const
{
  return mWriterActive.load(std::memory_order_relaxed);
}

const TicketSequencer& FairSharedLock::sequencer() const
{
  return mSequencer;
}

}
