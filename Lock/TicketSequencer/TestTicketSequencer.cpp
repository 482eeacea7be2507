#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>
#include <thread>
#include <chrono>
#include <future>
#include <vector>
#include "TicketSequencer.hpp"

using fair::TicketSequencer;

BOOST_AUTO_TEST_CASE(TestTicketSequencerSingleThread)
{
  TicketSequencer sequencer;
  BOOST_CHECK_EQUAL(sequencer.enqueue(), 0);
  BOOST_CHECK_EQUAL(sequencer.enqueue(), 1);
  BOOST_CHECK_EQUAL(sequencer.enqueue(), 2);
  BOOST_CHECK_EQUAL(sequencer.nextTicket(), 3);
  BOOST_CHECK(sequencer.isServing(0));
  BOOST_CHECK(!sequencer.isServing(1));
  sequencer.waitForTurn(0);
  sequencer.advance();
  BOOST_CHECK(sequencer.isServing(1));
  BOOST_CHECK_EQUAL(sequencer.nowServing(), 1);
  sequencer.advance();
  sequencer.advance();
  BOOST_CHECK_EQUAL(sequencer.nowServing(), sequencer.nextTicket());
}

BOOST_AUTO_TEST_CASE(TestTicketSequencerTryEnqueue)
{
  TicketSequencer sequencer;
  auto first = sequencer.tryEnqueue();
  BOOST_REQUIRE(first);
  BOOST_CHECK_EQUAL(*first, 0);
  BOOST_CHECK(sequencer.isServing(*first));
  // ticket 0 is still being served
  BOOST_CHECK(!sequencer.tryEnqueue());
  auto queued = sequencer.enqueue();
  sequencer.advance();
  // ticket 1 is served but has an owner
  BOOST_CHECK(!sequencer.tryEnqueue());
  sequencer.waitForTurn(queued);
  sequencer.advance();
  auto second = sequencer.tryEnqueue();
  BOOST_REQUIRE(second);
  BOOST_CHECK_EQUAL(*second, 2);
  BOOST_CHECK_EQUAL(sequencer.nextTicket(), 3);
}

BOOST_AUTO_TEST_CASE(TestTicketSequencerWakesParkedWaiter)
{
  using namespace std::literals::chrono_literals;
  TicketSequencer sequencer(0);
  auto first = sequencer.enqueue();
  std::promise<void> enqueued;
  auto ready = enqueued.get_future();
  auto done = std::async(std::launch::async, [&sequencer, p = std::move(enqueued)]()mutable{
    auto ticket = sequencer.enqueue();
    p.set_value();
    sequencer.waitForTurn(ticket);
    sequencer.advance();
  });
  ready.wait();
  BOOST_CHECK(done.wait_for(50ms) == std::future_status::timeout);
  sequencer.waitForTurn(first);
  sequencer.advance();
  BOOST_REQUIRE(done.wait_for(5s) == std::future_status::ready);
  BOOST_CHECK_EQUAL(sequencer.nowServing(), 2);
}

// every ticket is served exactly once, in increasing order
void checkServedInOrder(std::size_t spinCount)
{
  static constexpr std::size_t numThread = 16;
  static constexpr std::size_t numIncr = 1000;
  TicketSequencer sequencer(spinCount);
  std::vector<TicketSequencer::Ticket> served;
  served.reserve(numThread * numIncr);
  {
    std::promise<void> start;
    auto fut = start.get_future().share();
    std::vector<std::future<void>> ready;
    std::vector<std::future<void>> done;
    for(std::size_t i = 0; i < numThread; ++i)
    {
      std::promise<void> promise;
      ready.push_back(promise.get_future());
      done.push_back(std::async(std::launch::async, [p = std::move(promise), start = fut, &sequencer, &served]()mutable{
        p.set_value();
        start.wait();
        for(std::size_t i = 0; i < numIncr; ++i)
        {
          auto ticket = sequencer.enqueue();
          sequencer.waitForTurn(ticket);
          served.push_back(ticket);
          sequencer.advance();
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
  BOOST_REQUIRE_EQUAL(served.size(), numThread * numIncr);
  for(std::size_t i = 0; i < served.size(); ++i)
  {
    BOOST_REQUIRE_EQUAL(served[i], i);
  }
  BOOST_CHECK_EQUAL(sequencer.nowServing(), sequencer.nextTicket());
}

BOOST_AUTO_TEST_CASE(TestTicketSequencerFifoSpinning)
{
  checkServedInOrder(TicketSequencer::sDefaultSpinCount);
}

BOOST_AUTO_TEST_CASE(TestTicketSequencerFifoParking)
{
  checkServedInOrder(0);
}

BOOST_AUTO_TEST_CASE(TestTicketSequencerOverflow)
{
  TicketSequencer sequencer(TicketSequencer::sDefaultSpinCount, TicketSequencer::sLastTicket - 2);
  auto first = sequencer.enqueue();
  auto second = sequencer.enqueue();
  BOOST_CHECK_EQUAL(first, TicketSequencer::sLastTicket - 2);
  BOOST_CHECK_EQUAL(second, TicketSequencer::sLastTicket - 1);
  BOOST_CHECK_THROW(sequencer.enqueue(), fair::TicketOverflow);
  // the counter does not wrap, so the error repeats instead of reusing ticket 0
  BOOST_CHECK_THROW(sequencer.enqueue(), fair::TicketOverflow);
  BOOST_CHECK_EQUAL(sequencer.nextTicket(), TicketSequencer::sLastTicket);
  // tickets already handed out are still served
  sequencer.waitForTurn(first);
  sequencer.advance();
  sequencer.waitForTurn(second);
  sequencer.advance();
  BOOST_CHECK_EQUAL(sequencer.nowServing(), TicketSequencer::sLastTicket);
  BOOST_CHECK_THROW(sequencer.tryEnqueue(), fair::TicketOverflow);
  BOOST_CHECK_THROW(sequencer.enqueue(), fair::TicketOverflow);
}

BOOST_AUTO_TEST_CASE(TestTicketSequencerTryEnqueueOverflow)
{
  TicketSequencer sequencer(TicketSequencer::sDefaultSpinCount, TicketSequencer::sLastTicket - 1);
  auto ticket = sequencer.tryEnqueue();
  BOOST_REQUIRE(ticket);
  BOOST_CHECK_EQUAL(*ticket, TicketSequencer::sLastTicket - 1);
  sequencer.advance();
  BOOST_CHECK_THROW(sequencer.tryEnqueue(), fair::TicketOverflow);
  BOOST_CHECK_THROW(sequencer.tryEnqueue(), fair::TicketOverflow);
  BOOST_CHECK_EQUAL(sequencer.nextTicket(), TicketSequencer::sLastTicket);
  BOOST_CHECK_EQUAL(sequencer.nowServing(), TicketSequencer::sLastTicket);
}
