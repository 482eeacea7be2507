#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "FairSharedLock.hpp"

using fair::FairSharedLock;

template <typename Pred>
bool waitUntil(Pred pred)
{
  using namespace std::literals::chrono_literals;
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while(!pred())
  {
    if(std::chrono::steady_clock::now() > deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

BOOST_AUTO_TEST_CASE(TestFairSharedLockExclusiveCount)
{
  static constexpr std::size_t numThread = 16;
  static constexpr std::size_t numIncr = 10000;
  std::size_t count = 0;
  FairSharedLock lock;
  {
    std::promise<void> start;
    auto fut = start.get_future().share();
    std::vector<std::future<void>> ready;
    std::vector<std::future<void>> done;
    for(std::size_t i = 0; i < numThread; ++i)
    {
      std::promise<void> promise;
      ready.push_back(promise.get_future());
      done.push_back(std::async(std::launch::async, [p = std::move(promise), start = fut, &lock, &count]()mutable{
        p.set_value();
        start.wait();
        for(std::size_t i = 0; i < numIncr; ++i)
        {
          std::lock_guard lk(lock);
          count++;
        }
      }));
    }
    for(auto& fut: ready)
    {
      fut.wait();
    }
    start.set_value();
    for(auto& fut: done)
    {
      fut.wait();
    }
  }
  BOOST_CHECK_EQUAL(count, numThread * numIncr);
  BOOST_CHECK(!lock.writerActive());
  BOOST_CHECK_EQUAL(lock.sequencer().nowServing(), lock.sequencer().nextTicket());
}

BOOST_AUTO_TEST_CASE(TestFairSharedLockMutualExclusion)
{
  static constexpr std::size_t numReader = 8;
  static constexpr std::size_t numWriter = 4;
  static constexpr std::size_t numTry = 2000;
  FairSharedLock lock;
  std::atomic<int> readers(0);
  std::atomic<int> writers(0);
  std::atomic<bool> violated(false);
  {
    std::promise<void> start;
    auto fut = start.get_future().share();
    std::vector<std::future<void>> done;
    for(std::size_t i = 0; i < numReader; ++i)
    {
      done.push_back(std::async(std::launch::async, [start = fut, &lock, &readers, &writers, &violated](){
        start.wait();
        for(std::size_t i = 0; i < numTry; ++i)
        {
          std::shared_lock lk(lock);
          readers.fetch_add(1);
          if(writers.load() != 0)
          {
            violated.store(true);
          }
          std::this_thread::yield();
          readers.fetch_sub(1);
        }
      }));
    }
    for(std::size_t i = 0; i < numWriter; ++i)
    {
      done.push_back(std::async(std::launch::async, [start = fut, &lock, &readers, &writers, &violated](){
        start.wait();
        for(std::size_t i = 0; i < numTry; ++i)
        {
          std::unique_lock lk(lock);
          if(writers.fetch_add(1) != 0 || readers.load() != 0)
          {
            violated.store(true);
          }
          std::this_thread::yield();
          writers.fetch_sub(1);
        }
      }));
    }
    start.set_value();
    for(auto& fut: done)
    {
      fut.wait();
    }
  }
  BOOST_CHECK(!violated.load());
  BOOST_CHECK_EQUAL(lock.readerCount(), 0);
  BOOST_CHECK(!lock.writerActive());
}

BOOST_AUTO_TEST_CASE(TestFairSharedLockReadersOverlap)
{
  static constexpr std::size_t numReader = 8;
  FairSharedLock lock;
  std::atomic<std::size_t> inside(0);
  std::atomic<std::size_t> maxSeen(0);
  std::vector<std::future<void>> done;
  for(std::size_t i = 0; i < numReader; ++i)
  {
    done.push_back(std::async(std::launch::async, [&lock, &inside, &maxSeen](){
      std::shared_lock lk(lock);
      inside.fetch_add(1);
      // nobody leaves before every reader got in
      waitUntil([&inside](){ return inside.load() == numReader; });
      auto seen = lock.readerCount();
      auto prev = maxSeen.load();
      while(prev < seen && !maxSeen.compare_exchange_weak(prev, seen));
    }));
  }
  for(auto& fut: done)
  {
    fut.wait();
  }
  BOOST_CHECK_EQUAL(inside.load(), numReader);
  BOOST_CHECK_EQUAL(maxSeen.load(), numReader);
  BOOST_CHECK_EQUAL(lock.readerCount(), 0);
}

BOOST_AUTO_TEST_CASE(TestFairSharedLockTryLockSingleThread)
{
  FairSharedLock lock;
  lock.lock();
  BOOST_CHECK(lock.writerActive());
  BOOST_CHECK(!lock.try_lock_shared());
  BOOST_CHECK(!lock.try_lock());
  lock.unlock();

  BOOST_REQUIRE(lock.try_lock_shared());
  lock.lock_shared();
  BOOST_CHECK_EQUAL(lock.readerCount(), 2);
  BOOST_CHECK(!lock.try_lock());
  // a failed try_lock passes its turn on
  BOOST_CHECK_EQUAL(lock.sequencer().nowServing(), lock.sequencer().nextTicket());
  lock.unlock_shared();
  lock.unlock_shared();

  BOOST_REQUIRE(lock.try_lock());
  BOOST_CHECK(lock.writerActive());
  lock.unlock();
  BOOST_CHECK(!lock.writerActive());
  BOOST_CHECK_EQUAL(lock.sequencer().nowServing(), lock.sequencer().nextTicket());
}

BOOST_AUTO_TEST_CASE(TestFairSharedLockTryLockSharedDoesNotBypassWriter)
{
  using namespace std::literals::chrono_literals;
  FairSharedLock lock;
  lock.lock_shared();
  std::atomic<bool> writerIn(false);
  auto writer = std::async(std::launch::async, [&lock, &writerIn](){
    std::lock_guard lk(lock);
    writerIn.store(true);
  });
  BOOST_REQUIRE(waitUntil([&lock](){ return lock.sequencer().nextTicket() == 2; }));
  // only readers hold the lock, but a writer is queued
  BOOST_CHECK(!lock.try_lock_shared());
  BOOST_CHECK(!lock.try_lock());
  BOOST_CHECK(writer.wait_for(20ms) == std::future_status::timeout);
  BOOST_CHECK(!writerIn.load());
  lock.unlock_shared();
  BOOST_REQUIRE(writer.wait_for(5s) == std::future_status::ready);
  BOOST_CHECK(writerIn.load());
}

// readers R1, R2 active, then writer W, then reader R3: W gets in before R3
BOOST_AUTO_TEST_CASE(TestFairSharedLockLateReaderQueuesBehindWriter)
{
  using namespace std::literals::chrono_literals;
  FairSharedLock lock(0);
  std::mutex orderLock;
  std::vector<std::string> order;
  auto record = [&orderLock, &order](const std::string& name){
    std::lock_guard lk(orderLock);
    order.push_back(name);
  };
  lock.lock_shared();
  lock.lock_shared();
  auto writer = std::async(std::launch::async, [&lock, &record](){
    std::lock_guard lk(lock);
    record("W");
  });
  BOOST_REQUIRE(waitUntil([&lock](){ return lock.sequencer().nextTicket() == 3; }));
  auto reader = std::async(std::launch::async, [&lock, &record](){
    std::shared_lock lk(lock);
    record("R3");
  });
  BOOST_REQUIRE(waitUntil([&lock](){ return lock.sequencer().nextTicket() == 4; }));
  std::this_thread::sleep_for(20ms);
  lock.unlock_shared();
  std::this_thread::sleep_for(20ms);
  {
    std::lock_guard lk(orderLock);
    BOOST_CHECK(order.empty());
  }
  BOOST_CHECK_EQUAL(lock.readerCount(), 1);
  lock.unlock_shared();
  BOOST_REQUIRE(writer.wait_for(5s) == std::future_status::ready);
  BOOST_REQUIRE(reader.wait_for(5s) == std::future_status::ready);
  BOOST_REQUIRE_EQUAL(order.size(), 2);
  BOOST_CHECK_EQUAL(order[0], "W");
  BOOST_CHECK_EQUAL(order[1], "R3");
}

BOOST_AUTO_TEST_CASE(TestFairSharedLockNoWriterStarvation)
{
  using namespace std::literals::chrono_literals;
  static constexpr std::size_t numReader = 8;
  static constexpr std::size_t numWrite = 50;
  FairSharedLock lock;
  std::atomic<bool> stop(false);
  std::vector<std::future<void>> readers;
  for(std::size_t i = 0; i < numReader; ++i)
  {
    readers.push_back(std::async(std::launch::async, [&lock, &stop](){
      std::random_device rnd;
      std::mt19937 engine(rnd());
      std::uniform_int_distribution<> dist(50, 200);
      while(!stop.load())
      {
        std::shared_lock lk(lock);
        std::this_thread::sleep_for(std::chrono::microseconds(dist(engine)));
      }
    }));
  }
  auto writer = std::async(std::launch::async, [&lock](){
    for(std::size_t i = 0; i < numWrite; ++i)
    {
      std::lock_guard lk(lock);
    }
  });
  auto status = writer.wait_for(10s);
  stop.store(true);
  for(auto& fut: readers)
  {
    fut.wait();
  }
  BOOST_CHECK(status == std::future_status::ready);
}
