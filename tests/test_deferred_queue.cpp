#include <catch2/catch_test_macros.hpp>
#include "client/deferred_queue.hpp"
#include <stdexcept>

using volley::client::DeferredQueue;

TEST_CASE("DeferredQueue is FIFO", "[queue]") {
    DeferredQueue<int> queue(4);
    queue.push(1);
    queue.push(2);
    queue.push(3);

    REQUIRE(queue.size() == 3);
    REQUIRE(queue.pop() == 1);
    REQUIRE(queue.pop() == 2);
    REQUIRE(queue.pop() == 3);
    REQUIRE(queue.empty());
}

TEST_CASE("DeferredQueue evicts the oldest entry when full", "[queue]") {
    DeferredQueue<int> queue(2);
    REQUIRE_FALSE(queue.push(1));
    REQUIRE_FALSE(queue.push(2));
    REQUIRE(queue.push(3));

    REQUIRE(queue.size() == 2);
    REQUIRE(queue.front() == 2);
    REQUIRE(queue.pop() == 2);
    REQUIRE(queue.pop() == 3);
}

TEST_CASE("DeferredQueue needs a positive capacity", "[queue]") {
    REQUIRE_THROWS_AS(DeferredQueue<int>(0), std::invalid_argument);
}
