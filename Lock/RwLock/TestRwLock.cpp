#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "RwLock.hpp"

using fair::RwLock;

class jthread
{
private:
  std::thread t;
public:
  template <typename F, typename... Args>
  jthread(F&& f, Args&&... args): t(std::forward<F>(f), std::forward<Args>(args)...)
  {
    static_assert(std::is_invocable_v<F, Args&&...>);
  }
  jthread(const jthread&) = delete;
  jthread(jthread&&) = default;
  jthread& operator=(const jthread) = delete;
  jthread& operator=(jthread&&) = default;
  void join()
  {
    t.join();
  }
  ~jthread() noexcept
  {
    if(t.joinable())
    {
      t.join();
    }
  }
};

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

BOOST_AUTO_TEST_CASE(TestRwLockWriteThenRead)
{
  RwLock<int> lock(0);
  {
    auto guard = lock.write();
    *guard = 1;
    BOOST_CHECK(lock.writerActive());
  }
  BOOST_CHECK(!lock.writerActive());
  auto guard = lock.read();
  BOOST_CHECK_EQUAL(*guard, 1);
  BOOST_CHECK_EQUAL(lock.readerCount(), 1);
}

BOOST_AUTO_TEST_CASE(TestRwLockGuardAccess)
{
  RwLock<std::vector<std::string>> lock;
  {
    auto guard = lock.write();
    guard->push_back("a");
    guard.get().push_back("b");
  }
  auto guard = lock.read();
  BOOST_CHECK_EQUAL(guard->size(), 2);
  BOOST_CHECK_EQUAL(guard.get().back(), "b");
}

BOOST_AUTO_TEST_CASE(TestRwLockTryVariants)
{
  RwLock<int> lock(0);
  {
    auto locked = lock.write();
    BOOST_CHECK(!lock.tryRead());
    BOOST_CHECK(!lock.tryWrite());
  }
  {
    auto locked1 = lock.read();
    auto locked2 = lock.tryRead();
    BOOST_REQUIRE(locked2);
    BOOST_CHECK_EQUAL(lock.readerCount(), 2);
    BOOST_CHECK(!lock.tryWrite());
  }
  BOOST_CHECK_EQUAL(lock.readerCount(), 0);
  auto locked = lock.tryWrite();
  BOOST_REQUIRE(locked);
  **locked = 42;
  locked.reset();
  BOOST_CHECK_EQUAL(*lock.read(), 42);
}

BOOST_AUTO_TEST_CASE(TestRwLockGuardMove)
{
  RwLock<int> lock(7);
  {
    auto guard = lock.read();
    auto moved = std::move(guard);
    BOOST_CHECK_EQUAL(*moved, 7);
    BOOST_CHECK_EQUAL(lock.readerCount(), 1);
  }
  BOOST_CHECK_EQUAL(lock.readerCount(), 0);
  {
    auto guard = lock.write();
    auto moved = std::move(guard);
    *moved = 8;
  }
  BOOST_CHECK(!lock.writerActive());
  BOOST_CHECK_EQUAL(lock.sequencer().nowServing(), lock.sequencer().nextTicket());
  BOOST_CHECK_EQUAL(*lock.read(), 8);
}

BOOST_AUTO_TEST_CASE(TestRwLockReleasedOnException)
{
  RwLock<int> lock(0);
  try
  {
    auto guard = lock.write();
    *guard = 1;
    throw std::runtime_error("mutator failed");
  }
  catch(const std::runtime_error&)
  {
  }
  BOOST_CHECK(!lock.writerActive());
  // no poisoning, the partial update is visible
  auto guard = lock.tryRead();
  BOOST_REQUIRE(guard);
  BOOST_CHECK_EQUAL(**guard, 1);
}

BOOST_AUTO_TEST_CASE(TestRwLockCounterNoLostUpdate)
{
  static constexpr int numIncr = 1000;
  auto counter = std::make_shared<RwLock<int>>(0);
  {
    jthread writer([counter](){
      for(int i = 0; i < numIncr; ++i)
      {
        *counter->write() += 1;
      }
    });
    int last = 0;
    for(int i = 0; i < numIncr; ++i)
    {
      auto value = *counter->read();
      BOOST_REQUIRE_LE(last, value);
      last = value;
    }
  }
  BOOST_CHECK_EQUAL(*counter->read(), numIncr);
}

BOOST_AUTO_TEST_CASE(TestRwLockVisibility)
{
  static constexpr std::size_t numThread = 8;
  static constexpr std::size_t numIncr = 1000;
  RwLock<std::vector<std::size_t>> lock;
  std::atomic<bool> violated(false);
  {
    std::promise<void> start;
    auto fut = start.get_future().share();
    std::vector<std::future<void>> done;
    for(std::size_t i = 0; i < numThread; ++i)
    {
      done.push_back(std::async(std::launch::async, [start = fut, &lock, &violated](){
        start.wait();
        for(std::size_t i = 0; i < numIncr; ++i)
        {
          std::size_t size;
          {
            auto guard = lock.write();
            guard->push_back(guard->size());
            size = guard->size();
          }
          auto guard = lock.read();
          // everything up to our own push is visible, in order
          if(guard->size() < size || (*guard)[size - 1] != size - 1)
          {
            violated.store(true);
          }
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
  auto guard = lock.read();
  BOOST_REQUIRE_EQUAL(guard->size(), numThread * numIncr);
  for(std::size_t i = 0; i < guard->size(); ++i)
  {
    BOOST_REQUIRE_EQUAL((*guard)[i], i);
  }
}

BOOST_AUTO_TEST_CASE(TestRwLockMultiThreaded)
{
  static constexpr std::size_t numReader = 10;
  static constexpr std::size_t numWriter = 2;
  static constexpr std::size_t numTry = 50;
  static constexpr unsigned int writeLock = 1u << 31;
  auto lock = std::make_shared<RwLock<unsigned int>>(0);
  std::atomic<bool> violated(false);
  {
    std::vector<jthread> threads;
    threads.reserve(numReader + numWriter);
    for(std::size_t i = 0; i < numReader; ++i)
    {
      threads.emplace_back([lock, &violated](){
        std::random_device rnd;
        std::mt19937 engine(rnd());
        std::uniform_int_distribution<> dist(100, 500);
        for(std::size_t j = 0; j < numTry; ++j)
        {
          {
            auto locked = lock->read();
            if(*locked & writeLock)
            {
              violated.store(true);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(dist(engine)));
          }
          std::this_thread::yield();
        }
      });
    }
    for(std::size_t i = 0; i < numWriter; ++i)
    {
      threads.emplace_back([lock, &violated](){
        std::random_device rnd;
        std::mt19937 engine(rnd());
        std::uniform_int_distribution<> dist(100, 500);
        for(std::size_t j = 0; j < numTry; ++j)
        {
          {
            auto locked = lock->write();
            if(*locked & writeLock)
            {
              violated.store(true);
            }
            *locked |= writeLock;
            std::this_thread::sleep_for(std::chrono::microseconds(dist(engine)));
            *locked &= ~writeLock;
            *locked += 1;
          }
          std::this_thread::yield();
        }
      });
    }
  }
  BOOST_CHECK(!violated.load());
  BOOST_CHECK_EQUAL(*lock->read(), numWriter * numTry);
}

// requests issued one after another while a writer holds the lock are admitted in issue order;
// consecutive readers may overlap, so only pairs involving a writer are ordered
BOOST_AUTO_TEST_CASE(TestRwLockAdmissionOrder)
{
  const std::vector<bool> isWriter{false, true, false, false, true, false, true, true, false};
  RwLock<int> lock(0);
  std::mutex orderLock;
  std::vector<std::size_t> order;
  {
    // joined after the held guard is released
    std::vector<jthread> threads;
    threads.reserve(isWriter.size());
    auto held = lock.write();
    for(std::size_t i = 0; i < isWriter.size(); ++i)
    {
      auto before = lock.sequencer().nextTicket();
      threads.emplace_back([i, writer = isWriter[i], &lock, &orderLock, &order](){
        auto record = [i, &orderLock, &order](){
          std::lock_guard lk(orderLock);
          order.push_back(i);
        };
        if(writer)
        {
          auto guard = lock.write();
          record();
        }
        else
        {
          auto guard = lock.read();
          record();
        }
      });
      BOOST_REQUIRE(waitUntil([&lock, before](){ return lock.sequencer().nextTicket() == before + 1; }));
    }
  }
  BOOST_REQUIRE_EQUAL(order.size(), isWriter.size());
  std::vector<std::size_t> position(order.size());
  for(std::size_t p = 0; p < order.size(); ++p)
  {
    position[order[p]] = p;
  }
  for(std::size_t i = 0; i < isWriter.size(); ++i)
  {
    for(std::size_t j = i + 1; j < isWriter.size(); ++j)
    {
      if(isWriter[i] || isWriter[j])
      {
        BOOST_CHECK_LT(position[i], position[j]);
      }
    }
  }
}

// two writers queued with no readers: the first one finishes before the second gets in
BOOST_AUTO_TEST_CASE(TestRwLockWritersSerialized)
{
  using namespace std::literals::chrono_literals;
  RwLock<std::vector<std::string>> lock;
  for(int i = 0; i < 5; ++i)
  {
    auto guard = lock.read();
  }
  BOOST_REQUIRE_EQUAL(lock.sequencer().nextTicket(), 5);
  std::promise<void> release;
  auto released = release.get_future();
  std::atomic<bool> firstIn(false);
  auto first = std::async(std::launch::async, [&lock, &firstIn, r = std::move(released)]()mutable{
    auto guard = lock.write();
    firstIn.store(true);
    guard->push_back("W1 in");
    r.wait();
    guard->push_back("W1 out");
  });
  BOOST_REQUIRE(waitUntil([&firstIn](){ return firstIn.load(); }));
  BOOST_CHECK_EQUAL(lock.sequencer().nowServing(), 5);
  auto second = std::async(std::launch::async, [&lock](){
    auto guard = lock.write();
    guard->push_back("W2 in");
  });
  BOOST_REQUIRE(waitUntil([&lock](){ return lock.sequencer().nextTicket() == 7; }));
  BOOST_CHECK(second.wait_for(20ms) == std::future_status::timeout);
  release.set_value();
  BOOST_REQUIRE(first.wait_for(5s) == std::future_status::ready);
  BOOST_REQUIRE(second.wait_for(5s) == std::future_status::ready);
  auto guard = lock.read();
  const std::vector<std::string> expected{"W1 in", "W1 out", "W2 in"};
  BOOST_CHECK_EQUAL_COLLECTIONS(guard->begin(), guard->end(), expected.begin(), expected.end());
}
