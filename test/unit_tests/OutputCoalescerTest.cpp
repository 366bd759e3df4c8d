#include "OutputCoalescer.hpp"

#include "TestHeaders.hpp"

using namespace tether;

TEST_CASE("Small writes wait for the flush interval", "[OutputCoalescer]") {
  OutputCoalescer coalescer;
  REQUIRE(!coalescer.hasPendingData());
  REQUIRE(!coalescer.shouldFlush(0));

  coalescer.append("ls -la\r\n", 100);
  coalescer.append("total 0\r\n", 105);
  REQUIRE(coalescer.hasPendingData());
  REQUIRE(!coalescer.shouldFlush(100 + OutputCoalescer::FLUSH_INTERVAL_MS - 1));
  REQUIRE(coalescer.shouldFlush(100 + OutputCoalescer::FLUSH_INTERVAL_MS));

  REQUIRE(coalescer.take(120) == "ls -la\r\ntotal 0\r\n");
  REQUIRE(!coalescer.hasPendingData());
  REQUIRE(!coalescer.shouldFlush(1000));
}

TEST_CASE("A full chunk flushes immediately", "[OutputCoalescer]") {
  OutputCoalescer coalescer;
  coalescer.append(string(OutputCoalescer::FLUSH_BYTES, 'x'), 10);
  REQUIRE(coalescer.shouldFlush(10));
}

TEST_CASE("Take returns one chunk at a time in order", "[OutputCoalescer]") {
  OutputCoalescer coalescer;
  string data = string(OutputCoalescer::FLUSH_BYTES, 'a') +
                string(OutputCoalescer::FLUSH_BYTES, 'b') + "tail";
  coalescer.append(data, 0);

  string first = coalescer.take(1);
  REQUIRE(first == string(OutputCoalescer::FLUSH_BYTES, 'a'));
  // The rest has already waited, so it is due right away.
  REQUIRE(coalescer.shouldFlush(1));
  string second = coalescer.take(1);
  REQUIRE(second == string(OutputCoalescer::FLUSH_BYTES, 'b'));
  REQUIRE(coalescer.take(1) == "tail");
  REQUIRE(first + second + "tail" == data);
}

TEST_CASE("Back pressure starts at the buffer limit", "[OutputCoalescer]") {
  OutputCoalescer coalescer;
  REQUIRE(coalescer.canAcceptMore());
  coalescer.append(string(OutputCoalescer::MAX_BUFFER_SIZE - 1, 'z'), 0);
  REQUIRE(coalescer.canAcceptMore());
  coalescer.append("z", 0);
  REQUIRE(!coalescer.canAcceptMore());
  REQUIRE(coalescer.size() == OutputCoalescer::MAX_BUFFER_SIZE);

  string first = coalescer.take(0);
  REQUIRE(first.size() == OutputCoalescer::FLUSH_BYTES);
  REQUIRE(coalescer.canAcceptMore());
}

TEST_CASE("Clear drops pending output", "[OutputCoalescer]") {
  OutputCoalescer coalescer;
  coalescer.append("partial", 0);
  coalescer.append("", 5);
  coalescer.clear();
  REQUIRE(!coalescer.hasPendingData());
  REQUIRE(coalescer.take(10).empty());
}
