#include <gtest/gtest.h>
#include "orca/core/work_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace orca;

TEST(WorkQueue, PopsInArrivalOrder) {
    WorkQueue<std::string> queue;
    queue.push("e-1");
    queue.push("e-2");

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(*queue.pop(), "e-1");
    EXPECT_EQ(*queue.pop(), "e-2");
    EXPECT_EQ(queue.size(), 0u);
}

TEST(WorkQueue, ClosedQueueRefusesAndDrains) {
    WorkQueue<std::string> queue;
    ASSERT_TRUE(queue.push("accepted"));
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push("late"));

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "accepted");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(WorkQueue, CloseWakesBlockedConsumer) {
    WorkQueue<int> queue;
    std::atomic<bool> woke{false};

    std::thread consumer([&]() {
        auto item = queue.pop();
        EXPECT_FALSE(item.has_value());
        woke = true;
    });

    queue.close();
    consumer.join();
    EXPECT_TRUE(woke.load());
}

TEST(WorkQueue, ManyProducersOneConsumerSeeEveryItem) {
    WorkQueue<int> queue;
    long total = 0;
    int received = 0;

    std::thread consumer([&]() {
        while (auto item = queue.pop()) {
            total += *item;
            ++received;
        }
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < 250; ++i) {
                queue.push(p * 250 + i);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    queue.close();
    consumer.join();

    EXPECT_EQ(received, 1000);
    EXPECT_EQ(total, 999L * 1000L / 2);
}
