#include <catch2/catch.hpp>

#include "rangedl/result_channel.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <thread>
#include <utility>
#include <vector>

using namespace rangedl;

TEST_CASE("Channel preserves order per producer", "[channel]") {
    auto channel = makeChannel<std::pair<int, int>>();
    auto receiver = std::move(channel.second);

    constexpr int kProducers = 4;
    constexpr int kItems = 1000;
    std::atomic<int> rejected{0};
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([sender = channel.first, p, &rejected]() mutable {
            for (int i = 0; i < kItems; ++i) {
                if (!sender.send({p, i})) {
                    ++rejected;
                }
            }
        });
    }
    channel.first = Sender<std::pair<int, int>>{};

    std::map<int, int> next;
    int received = 0;
    while (auto item = receiver.receive()) {
        CHECK(item->second == next[item->first]);
        next[item->first] = item->second + 1;
        ++received;
    }
    for (auto& producer : producers) {
        producer.join();
    }
    CHECK(received == kProducers * kItems);
    CHECK(rejected.load() == 0);
}

TEST_CASE("Receiver sees disconnection once every sender is gone", "[channel]") {
    auto channel = makeChannel<int>();
    auto receiver = std::move(channel.second);

    {
        auto copy = channel.first;
        REQUIRE(copy.send(1));
    }
    REQUIRE(channel.first.send(2));
    channel.first = Sender<int>{};

    auto first = receiver.receive();
    auto second = receiver.receive();
    REQUIRE(first);
    REQUIRE(second);
    CHECK(*first == 1);
    CHECK(*second == 2);
    CHECK_FALSE(receiver.receive());
}

TEST_CASE("Closed receiver makes send fail", "[channel]") {
    auto channel = makeChannel<int>();
    auto sender = std::move(channel.first);

    SECTION("Explicit close") {
        channel.second.close();
        CHECK(sender.isClosed());
        CHECK_FALSE(sender.send(1));
    }

    SECTION("Receiver destroyed") {
        { auto receiver = std::move(channel.second); }
        CHECK(sender.isClosed());
        CHECK_FALSE(sender.send(1));
    }

    SECTION("Default constructed sender is never open") {
        Sender<int> orphan;
        CHECK(orphan.isClosed());
        CHECK_FALSE(orphan.send(1));
    }
}

TEST_CASE("Bounded channel applies backpressure", "[channel]") {
    auto channel = makeChannel<int>(2);
    auto receiver = std::move(channel.second);

    std::atomic<int> sent{0};
    std::thread producer([sender = std::move(channel.first), &sent]() mutable {
        for (int i = 0; i < 5; ++i) {
            if (!sender.send(i)) {
                return;
            }
            ++sent;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(sent.load() == 2);

    for (int i = 0; i < 5; ++i) {
        auto value = receiver.receive();
        REQUIRE(value);
        CHECK(*value == i);
    }
    producer.join();
    CHECK(sent.load() == 5);
    CHECK_FALSE(receiver.receive());
}

TEST_CASE("Closing unblocks a sender waiting on a full channel", "[channel]") {
    auto channel = makeChannel<int>(1);
    auto receiver = std::move(channel.second);

    std::atomic<bool> first_send_result{false};
    std::atomic<bool> second_send_result{true};
    std::thread producer([sender = std::move(channel.first), &first_send_result, &second_send_result]() mutable {
        first_send_result = sender.send(1);
        second_send_result = sender.send(2);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    receiver.close();
    producer.join();
    CHECK(first_send_result.load());
    CHECK_FALSE(second_send_result.load());
}
