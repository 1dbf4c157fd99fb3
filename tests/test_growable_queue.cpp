/**
 * @file test_growable_queue.cpp
 * @brief Тесты растущей очереди заданий
 */

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "sync/growable_queue.hpp"

namespace weavekit::tests {

using sync::GrowableQueue;

class GrowableQueueTest : public ::testing::Test {};

/**
 * @brief Тест: пустая очередь сразу завершается
 */
TEST_F(GrowableQueueTest, EmptyQueueEnds) {
    GrowableQueue<int> queue;
    EXPECT_FALSE(queue.next().has_value());
}

/**
 * @brief Тест: начальный набор выдаётся по порядку
 */
TEST_F(GrowableQueueTest, SeededItems) {
    GrowableQueue<int> queue(std::vector<int>{1, 2, 3});
    EXPECT_EQ(queue.pending(), 3u);

    for (int expected : {1, 2, 3}) {
        auto item = queue.next();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, expected);
        queue.mark_idle();
    }
    EXPECT_FALSE(queue.next().has_value());
}

/**
 * @brief Тест: N выданных + M добавленных = N + M до конца потока
 */
TEST_F(GrowableQueueTest, PushDuringDrain) {
    constexpr int N = 5;
    constexpr int M = 7;

    std::vector<int> seed;
    for (int i = 0; i < N; ++i) {
        seed.push_back(i);
    }
    GrowableQueue<int> queue(std::move(seed));

    int received = 0;
    for (int i = 0; i < N; ++i) {
        auto item = queue.next();
        ASSERT_TRUE(item.has_value());
        ++received;
        EXPECT_EQ(queue.in_flight(), 1u);
        // Первое задание порождает M новых до mark_idle
        if (i == 0) {
            for (int j = 0; j < M; ++j) {
                queue.push(100 + j);
            }
        }
        queue.mark_idle();
    }

    while (auto item = queue.next()) {
        ++received;
        queue.mark_idle();
    }

    EXPECT_EQ(received, N + M);
    EXPECT_EQ(queue.in_flight(), 0u);
}

/**
 * @brief Тест: ожидающий поток просыпается при push из задания в обработке
 */
TEST_F(GrowableQueueTest, WaiterSeesLatePush) {
    GrowableQueue<int> queue(std::vector<int>{1});

    auto first = queue.next();
    ASSERT_TRUE(first.has_value());

    std::atomic<bool> got_second{false};
    std::thread waiter([&] {
        auto item = queue.next();
        if (item && *item == 2) {
            got_second = true;
            queue.mark_idle();
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push(2);
    queue.mark_idle();

    waiter.join();
    EXPECT_TRUE(got_second.load());
    EXPECT_FALSE(queue.next().has_value());
}

/**
 * @brief Тест: close() завершает поток и отбрасывает новые задания
 */
TEST_F(GrowableQueueTest, CloseEndsStream) {
    GrowableQueue<int> queue(std::vector<int>{1, 2, 3});

    auto item = queue.next();
    ASSERT_TRUE(item.has_value());
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.next().has_value());

    queue.push(4);
    EXPECT_EQ(queue.pending(), 0u);
    queue.mark_idle();
}

/**
 * @brief Тест: пул потоков обрабатывает порождаемые задания ровно один раз
 */
TEST_F(GrowableQueueTest, WorkersProcessTree) {
    // Каждое задание n < 1000 порождает 2n+1 и 2n+2: полное двоичное дерево
    GrowableQueue<int> queue(std::vector<int>{0});

    std::mutex mutex;
    std::multiset<int> seen;

    sync::drain_with_workers(queue, 8, [&](int n) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(n);
        }
        if (n < 1000) {
            queue.push(std::vector<int>{2 * n + 1, 2 * n + 2});
        }
    });

    // Узлы 0..2000 включительно
    EXPECT_EQ(seen.size(), 2001u);
    for (int i = 0; i <= 2000; ++i) {
        EXPECT_EQ(seen.count(i), 1u) << i;
    }
}

/**
 * @brief Тест: степень параллельности не превышает width
 */
TEST_F(GrowableQueueTest, BoundedConcurrency) {
    std::vector<int> seed(64, 0);
    GrowableQueue<int> queue(std::move(seed));

    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    sync::drain_with_workers(queue, 4, [&](int) {
        const int now = ++active;
        int expected = peak.load();
        while (now > expected && !peak.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        --active;
    });

    EXPECT_LE(peak.load(), 4);
    EXPECT_GE(peak.load(), 1);
}

/**
 * @brief Тест: close() из обработчика останавливает пул
 */
TEST_F(GrowableQueueTest, CloseFromWorker) {
    std::vector<int> seed(1000);
    for (int i = 0; i < 1000; ++i) {
        seed[static_cast<std::size_t>(i)] = i;
    }
    GrowableQueue<int> queue(std::move(seed));

    std::atomic<int> processed{0};
    sync::drain_with_workers(queue, 4, [&](int) {
        if (++processed == 10) {
            queue.close();
        }
    });

    // Задания в полёте могут завершиться после close()
    EXPECT_GE(processed.load(), 10);
    EXPECT_LT(processed.load(), 1000);
}

} // namespace weavekit::tests
