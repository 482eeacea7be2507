#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include "TicketSequencer.hpp"

namespace fair
{

// Read-write lock whose requests are admitted in arrival order, reads and writes alike.
// Every request first takes a ticket from the sequencer. A reader passes the turn on
// as soon as it is counted, so consecutive readers overlap. A writer keeps the turn
// until unlock(), so nothing queued behind it can get in while it drains earlier readers.
//
// Satisfies the SharedMutex requirements. Not recursive, no upgrade or downgrade.
class FairSharedLock
{
private:
  TicketSequencer mSequencer;
  std::atomic<std::size_t> mReaders;
  std::atomic<bool> mWriterActive;
  std::atomic<bool> mWriterPending;
  const std::size_t mSpinCount;
  std::mutex mDrainLock;
  std::condition_variable mDrainCond;
private:
  void admitReader();
  void admitWriter();
  void waitForReadersToDrain();
public:
  explicit FairSharedLock(std::size_t spinCount = TicketSequencer::sDefaultSpinCount);
  FairSharedLock(const FairSharedLock&) = delete;
  FairSharedLock& operator=(const FairSharedLock&) = delete;
  void lock();
  bool try_lock();
  void unlock();
  void lock_shared();
  bool try_lock_shared();
  void unlock_shared();
  std::size_t readerCount() const;
  bool writerActive() const;
  const TicketSequencer& sequencer() const;
};

}
