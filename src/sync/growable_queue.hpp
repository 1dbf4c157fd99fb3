/**
 * @file growable_queue.hpp
 * @brief Растущая очередь заданий для пула потоков
 *
 * Очередь, в которую задания можно добавлять во время обработки. Работа
 * считается законченной, когда очередь пуста и ни одно выданное задание
 * не находится в обработке: только тогда next() возвращает std::nullopt.
 *
 * Каждое задание, полученное через next(), должно быть завершено вызовом
 * mark_idle() после обработки (включая задания, порождающие новые).
 *
 * Копии GrowableQueue разделяют одно состояние.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace weavekit::sync {

template <typename T>
class GrowableQueue {
public:
    GrowableQueue() : state_(std::make_shared<State>()) {}

    /**
     * @brief Создать очередь с начальным набором заданий
     */
    explicit GrowableQueue(std::vector<T> initial) : state_(std::make_shared<State>()) {
        for (auto& item : initial) {
            state_->items.push_back(std::move(item));
        }
    }

    /**
     * @brief Добавить задание
     *
     * После close() задания молча отбрасываются.
     */
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) {
                return;
            }
            state_->items.push_back(std::move(item));
        }
        state_->cv.notify_one();
    }

    /**
     * @brief Добавить пачку заданий
     */
    void push(std::vector<T> items) {
        if (items.empty()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) {
                return;
            }
            for (auto& item : items) {
                state_->items.push_back(std::move(item));
            }
        }
        state_->cv.notify_all();
    }

    /**
     * @brief Получить следующее задание
     *
     * Блокируется, пока очередь пуста и есть задания в обработке.
     *
     * @return Задание или std::nullopt если работа закончена или очередь закрыта
     */
    [[nodiscard]] std::optional<T> next() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait(lock, [this] {
            return state_->closed || !state_->items.empty() || state_->in_flight == 0;
        });

        if (state_->closed || state_->items.empty()) {
            return std::nullopt;
        }

        T item = std::move(state_->items.front());
        state_->items.pop_front();
        ++state_->in_flight;
        return item;
    }

    /**
     * @brief Отметить завершение обработки задания
     */
    void mark_idle() {
        bool finished = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->in_flight > 0) {
                --state_->in_flight;
            }
            finished = state_->in_flight == 0 && state_->items.empty();
        }
        if (finished) {
            state_->cv.notify_all();
        }
    }

    /**
     * @brief Закрыть очередь
     *
     * Оставшиеся задания отбрасываются, все ожидающие next() получают nullopt.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
            state_->items.clear();
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->closed;
    }

    /// @brief Количество заданий, ожидающих выдачи
    [[nodiscard]] std::size_t pending() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->items.size();
    }

    /// @brief Количество выданных, но не завершённых заданий
    [[nodiscard]] std::size_t in_flight() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->in_flight;
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<T> items;
        std::size_t in_flight{0};
        bool closed{false};
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Обработать очередь пулом потоков
 *
 * Запускает width потоков, каждый забирает задания через next() и вызывает
 * fn(item). fn может добавлять новые задания в ту же очередь. Возвращает
 * управление, когда работа закончена или очередь закрыта.
 *
 * fn не должна бросать исключения: ошибки обработки сообщаются через
 * состояние, захваченное в fn.
 *
 * @param queue Очередь заданий
 * @param width Количество потоков (минимум 1)
 * @param fn Обработчик задания
 */
template <typename T, typename Fn>
void drain_with_workers(GrowableQueue<T>& queue, std::size_t width, Fn fn) {
    if (width == 0) {
        width = 1;
    }

    std::vector<std::thread> workers;
    workers.reserve(width);

    for (std::size_t i = 0; i < width; ++i) {
        workers.emplace_back([&queue, &fn] {
            while (auto item = queue.next()) {
                fn(std::move(*item));
                queue.mark_idle();
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace weavekit::sync
