namespace fair
{

template <typename T>
ReadGuard<T>::ReadGuard(FairSharedLock& lock, const T& data): mLock(&lock), mData(&data) {}
template <typename T>
ReadGuard<T>::ReadGuard(ReadGuard&& other) noexcept
  : mLock(std::exchange(other.mLock, nullptr))
  , mData(std::exchange(other.mData, nullptr)) {}
template <typename T>
ReadGuard<T>::~ReadGuard()
{
  if(mLock)
  {
    mLock->unlock_shared();
  }
}
template <typename T>
const T& ReadGuard<T>::get() const
{
  return *mData;
}
template <typename T>
const T& ReadGuard<T>::operator*() const
{
  return *mData;
}
template <typename T>
const T* ReadGuard<T>::operator->() const
{
  return mData;
}

template <typename T>
WriteGuard<T>::WriteGuard(FairSharedLock& lock, T& data): mLock(&lock), mData(&data) {}
template <typename T>
WriteGuard<T>::WriteGuard(WriteGuard&& other) noexcept
  : mLock(std::exchange(other.mLock, nullptr))
  , mData(std::exchange(other.mData, nullptr)) {}
template <typename T>
WriteGuard<T>::~WriteGuard()
{
  if(mLock)
  {
    mLock->unlock();
  }
}
template <typename T>
T& WriteGuard<T>::get() const
{
  return *mData;
}
template <typename T>
T& WriteGuard<T>::operator*() const
{
  return *mData;
}
template <typename T>
T* WriteGuard<T>::operator->() const
{
  return mData;
}

template <typename T>
RwLock<T>::RwLock(): mLock(), mData() {}
template <typename T>
RwLock<T>::RwLock(T data, std::size_t spinCount): mLock(spinCount), mData(std::move(data)) {}
template <typename T>
ReadGuard<T> RwLock<T>::read()
{
  mLock.lock_shared();
  return ReadGuard<T>(mLock, mData);
}
template <typename T>
WriteGuard<T> RwLock<T>::write()
{
  mLock.lock();
  return WriteGuard<T>(mLock, mData);
}
template <typename T>
std::optional<ReadGuard<T>> RwLock<T>::tryRead()
{
  if(!mLock.try_lock_shared())
  {
    return std::nullopt;
  }
  return ReadGuard<T>(mLock, mData);
}
template <typename T>
std::optional<WriteGuard<T>> RwLock<T>::tryWrite()
{
  if(!mLock.try_lock())
  {
    return std::nullopt;
  }
  return WriteGuard<T>(mLock, mData);
}
template <typename T>
std::size_t RwLock<T>::readerCount() const
{
  return mLock.readerCount();
}
template <typename T>
bool RwLock<T>::writerActive() const
{
  return mLock.writerActive();
}
template <typename T>
const TicketSequencer& RwLock<T>::sequencer() const
{
  return mLock.sequencer();
}

}
