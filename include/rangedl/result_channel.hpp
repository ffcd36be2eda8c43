#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace rangedl {

namespace detail {

template <typename T>
struct ChannelState {
    explicit ChannelState(std::size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> queue;
    std::size_t capacity;
    std::size_t senders{0};
    bool receiver_closed{false};
};

} // namespace detail

template <typename T>
class Sender;

template <typename T>
class Receiver;

// capacity == 0 makes the channel unbounded.
template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel(std::size_t capacity = 0);

// Producer half. Copies share the channel; the receiver sees the channel as
// disconnected once every copy has been destroyed.
template <typename T>
class Sender {
public:
    Sender() = default;

    Sender(const Sender& other) : state_(other.state_) { attach(); }

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() { detach(); }

    // Blocks while a bounded channel is full. Returns false if the receiver
    // is gone, in which case the value is dropped.
    bool send(T value) {
        if (!state_) {
            return false;
        }

        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_full.wait(lock, [this] {
            return state_->receiver_closed || state_->capacity == 0 ||
                   state_->queue.size() < state_->capacity;
        });
        if (state_->receiver_closed) {
            return false;
        }

        state_->queue.push_back(std::move(value));
        lock.unlock();
        state_->not_empty.notify_one();
        return true;
    }

    [[nodiscard]] bool isClosed() const {
        if (!state_) {
            return true;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->receiver_closed;
    }

private:
    template <typename U>
    friend std::pair<Sender<U>, Receiver<U>> makeChannel(std::size_t capacity);

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        attach();
    }

    void attach() {
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->senders;
        }
    }

    void detach() {
        if (!state_) {
            return;
        }
        bool last = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            last = (--state_->senders == 0);
        }
        if (last) {
            state_->not_empty.notify_all();
        }
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// Single consumer half.
template <typename T>
class Receiver {
public:
    Receiver() = default;
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&&) noexcept = default;

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    // Waits for the next value. Returns std::nullopt once the queue is
    // drained and no sender is left, or after close().
    std::optional<T> receive() {
        if (!state_) {
            return std::nullopt;
        }

        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_empty.wait(lock, [this] {
            return !state_->queue.empty() || state_->senders == 0 || state_->receiver_closed;
        });
        if (state_->receiver_closed || state_->queue.empty()) {
            return std::nullopt;
        }

        std::optional<T> value{std::move(state_->queue.front())};
        state_->queue.pop_front();
        lock.unlock();
        state_->not_full.notify_one();
        return value;
    }

    // Drops pending values and makes every further send() fail.
    void close() {
        if (!state_) {
            return;
        }
        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->receiver_closed = true;
            dropped.swap(state_->queue);
        }
        state_->not_full.notify_all();
        state_->not_empty.notify_all();
    }

private:
    template <typename U>
    friend std::pair<Sender<U>, Receiver<U>> makeChannel(std::size_t capacity);

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel(std::size_t capacity) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    Sender<T> sender(state);
    return {std::move(sender), Receiver<T>(std::move(state))};
}

} // namespace rangedl
