#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include "FairSharedLock.hpp"

namespace fair
{

template <typename T>
class RwLock;

// Shared access to the value of an RwLock. Released on destruction only.
template <typename T>
class ReadGuard
{
  friend class RwLock<T>;
private:
  FairSharedLock* mLock;
  const T* mData;
private:
  ReadGuard(FairSharedLock& lock, const T& data);
public:
  ReadGuard(const ReadGuard&) = delete;
  ReadGuard(ReadGuard&& other) noexcept;
  ReadGuard& operator=(const ReadGuard&) = delete;
  ReadGuard& operator=(ReadGuard&&) = delete;
  ~ReadGuard();
  const T& get() const;
  const T& operator*() const;
  const T* operator->() const;
};

// Exclusive access to the value of an RwLock. Released on destruction only.
template <typename T>
class WriteGuard
{
  friend class RwLock<T>;
private:
  FairSharedLock* mLock;
  T* mData;
private:
  WriteGuard(FairSharedLock& lock, T& data);
public:
  WriteGuard(const WriteGuard&) = delete;
  WriteGuard(WriteGuard&& other) noexcept;
  WriteGuard& operator=(const WriteGuard&) = delete;
  WriteGuard& operator=(WriteGuard&&) = delete;
  ~WriteGuard();
  T& get() const;
  T& operator*() const;
  T* operator->() const;
};

// A value protected by a FairSharedLock. The value is reachable through guards only.
//
// There is no poisoning: a guard still releases when its scope is left by an exception,
// and whatever state the value was left in is visible to the next holder.
template <typename T>
class RwLock
{
private:
  FairSharedLock mLock;
  T mData;
public:
  RwLock();
  explicit RwLock(T data, std::size_t spinCount = TicketSequencer::sDefaultSpinCount);
  RwLock(const RwLock&) = delete;
  RwLock(RwLock&&) = delete;
  RwLock& operator=(const RwLock&) = delete;
  RwLock& operator=(RwLock&&) = delete;
  ~RwLock() = default;
  ReadGuard<T> read();
  WriteGuard<T> write();
  std::optional<ReadGuard<T>> tryRead();
  std::optional<WriteGuard<T>> tryWrite();
  std::size_t readerCount() const;
  bool writerActive() const;
  const TicketSequencer& sequencer() const;
};

}

#include "RwLock.inl"
