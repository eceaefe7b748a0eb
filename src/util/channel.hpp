#ifndef PORTAL_UTIL_CHANNEL_HPP
#define PORTAL_UTIL_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @file channel.hpp
 * @brief Multi-producer, single-consumer queue that knows when its other end is gone.
 *
 * DESIGN GOALS:
 *   - Senders are copyable; the channel is disconnected for the receiver once
 *     the last Sender is destroyed and the queue has drained.
 *   - The Receiver is move-only; once it is destroyed, send() returns false.
 *   - tryRecv() never blocks, so a worker can poll between units of work.
 *
 * USAGE:
 *   @code
 *   auto [tx, rx] = portal::util::makeChannel<int>();
 *   tx.send(7);
 *   int v = 0;
 *   if (rx.tryRecv(v) == portal::util::RecvStatus::Value) { ... }
 *   @endcode
 */

namespace portal {
namespace util {

enum class RecvStatus {
    Value,
    Empty,
    Disconnected
};

namespace detail {

template<typename T>
struct ChannelState
{
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<T> queue;
    size_t senders = 0;
    bool receiverAlive = true;
};

} // namespace detail

template<typename T>
class Sender
{
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state))
    {
        attach();
    }

    Sender(const Sender &other)
        : state_(other.state_)
    {
        attach();
    }

    Sender(Sender &&other) noexcept
        : state_(std::move(other.state_))
    {
    }

    Sender& operator=(Sender other) noexcept
    {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() { detach(); }

    /**
     * @brief Queue a value for the receiver.
     * @return false if the receiver has been dropped; the value is discarded.
     */
    bool send(T value) const
    {
        if (!state_) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->receiverAlive) {
                return false;
            }
            state_->queue.push_back(std::move(value));
        }
        state_->ready.notify_one();
        return true;
    }

    bool isConnected() const
    {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->receiverAlive;
    }

private:
    void attach()
    {
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->senders;
        }
    }

    void detach()
    {
        if (!state_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            --state_->senders;
        }
        state_->ready.notify_all();
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template<typename T>
class Receiver
{
public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state))
    {
    }

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver &&other) noexcept = default;

    Receiver& operator=(Receiver &&other) noexcept
    {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    /**
     * @brief Take the next value without waiting.
     */
    RecvStatus tryRecv(T &out)
    {
        if (!state_) {
            return RecvStatus::Disconnected;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return popLocked(out);
    }

    /**
     * @brief Block until a value arrives or every sender is gone.
     * @return std::nullopt once the channel is disconnected and drained.
     */
    std::optional<T> recv()
    {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->ready.wait(lock, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        T value;
        if (popLocked(value) == RecvStatus::Value) {
            return value;
        }
        return std::nullopt;
    }

    /**
     * @brief Like recv(), but gives up after the timeout.
     *        Check isDisconnected() to tell a timeout from a closed channel.
     */
    template<typename Rep, typename Period>
    std::optional<T> recvFor(const std::chrono::duration<Rep, Period> &timeout)
    {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->ready.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        T value;
        if (popLocked(value) == RecvStatus::Value) {
            return value;
        }
        return std::nullopt;
    }

    bool isDisconnected() const
    {
        if (!state_) {
            return true;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.empty() && state_->senders == 0;
    }

    /**
     * @brief Drop the receiving end; pending and future values are discarded.
     */
    void close()
    {
        if (!state_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->receiverAlive = false;
            state_->queue.clear();
        }
        state_.reset();
    }

private:
    RecvStatus popLocked(T &out)
    {
        if (!state_->queue.empty()) {
            out = std::move(state_->queue.front());
            state_->queue.pop_front();
            return RecvStatus::Value;
        }
        return state_->senders == 0 ? RecvStatus::Disconnected : RecvStatus::Empty;
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel()
{
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace util
} // namespace portal

#endif // PORTAL_UTIL_CHANNEL_HPP
