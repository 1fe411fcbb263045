#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace perp {

enum class RecvStatus : uint8_t {
    OK = 0,         // value holds the next message
    LAGGED = 1,     // missed messages were overwritten; receiver skipped ahead
    CLOSED = 2,     // sender closed and everything was drained
    EMPTY = 3       // nothing available (try_recv / recv_for timeout)
};

template<typename T>
struct RecvResult {
    RecvStatus status;
    std::optional<T> value;
    uint64_t missed;

    RecvResult() : status(RecvStatus::EMPTY), missed(0) {}
};

/**
 * Bounded multi-subscriber fan-out.
 *
 * The sender never blocks: messages go into a ring of fixed capacity and
 * overwrite the oldest entry. A receiver that falls more than `capacity`
 * messages behind gets one LAGGED result carrying the number of messages it
 * missed, then continues from the oldest message still retained.
 * Receivers only see messages sent after they subscribed.
 */
template<typename T>
class BroadcastChannel {
private:
    struct State {
        explicit State(size_t cap) : capacity(cap), ring(cap), tail(0), closed(false), receivers(0) {}

        const size_t capacity;
        std::vector<std::optional<T>> ring;
        uint64_t tail;              // sequence number of the next message
        bool closed;
        size_t receivers;
        std::mutex mutex;
        std::condition_variable cv;
    };

public:
    class Receiver {
    public:
        Receiver() : next_(0) {}

        Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)), next_(other.next_) {}

        Receiver& operator=(Receiver&& other) noexcept {
            if (this != &other) {
                release();
                state_ = std::move(other.state_);
                next_ = other.next_;
            }
            return *this;
        }

        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;

        ~Receiver() { release(); }

        /**
         * Block until a message, a lag notice or close
         */
        RecvResult<T> recv() {
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->cv.wait(lock, [this] { return next_ < state_->tail || state_->closed; });
            return take_locked();
        }

        /**
         * As recv(), but gives up after `timeout` with EMPTY
         */
        template<typename Rep, typename Period>
        RecvResult<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lock(state_->mutex);
            state_->cv.wait_for(lock, timeout, [this] { return next_ < state_->tail || state_->closed; });
            return take_locked();
        }

        RecvResult<T> try_recv() {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return take_locked();
        }

        bool valid() const { return static_cast<bool>(state_); }

    private:
        friend class BroadcastChannel;

        Receiver(std::shared_ptr<State> state, uint64_t start) : state_(std::move(state)), next_(start) {}

        void release() {
            if (state_) {
                std::lock_guard<std::mutex> lock(state_->mutex);
                --state_->receivers;
            }
            state_.reset();
        }

        RecvResult<T> take_locked() {
            RecvResult<T> result;
            const uint64_t tail = state_->tail;
            const uint64_t oldest = tail > state_->capacity ? tail - state_->capacity : 0;

            if (next_ < oldest) {
                result.status = RecvStatus::LAGGED;
                result.missed = oldest - next_;
                next_ = oldest;
                return result;
            }
            if (next_ < tail) {
                result.status = RecvStatus::OK;
                result.value = state_->ring[next_ % state_->capacity];
                ++next_;
                return result;
            }
            result.status = state_->closed ? RecvStatus::CLOSED : RecvStatus::EMPTY;
            return result;
        }

        std::shared_ptr<State> state_;
        uint64_t next_;
    };

    explicit BroadcastChannel(size_t capacity)
        : state_(std::make_shared<State>(capacity == 0 ? 1 : capacity)) {}

    ~BroadcastChannel() { close(); }

    BroadcastChannel(const BroadcastChannel&) = delete;
    BroadcastChannel& operator=(const BroadcastChannel&) = delete;

    /**
     * Publish to every current receiver; returns how many were listening
     */
    size_t send(T value) {
        size_t listening;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) {
                return 0;
            }
            state_->ring[state_->tail % state_->capacity] = std::move(value);
            ++state_->tail;
            listening = state_->receivers;
        }
        state_->cv.notify_all();
        return listening;
    }

    Receiver subscribe() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->receivers;
        return Receiver(state_, state_->tail);
    }

    size_t receiver_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->receivers;
    }

    size_t capacity() const { return state_->capacity; }

    /**
     * Receivers drain what is buffered, then see CLOSED
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace perp
