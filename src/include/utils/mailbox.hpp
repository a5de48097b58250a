#pragma once
/**
 * @file mailbox.hpp
 * @brief Bounded, closable, thread-safe FIFO for passing values between threads.
 *
 * The relay and dispatcher threads share nothing except two Mailboxes (one
 * per direction). Each direction is strictly FIFO. `close()` is the
 * termination signal: it wakes every waiter, later `send()` calls are
 * refused with `SendStatus::Closed`, and receivers still drain whatever was
 * queued before the close.
 *
 * Full-queue behaviour is chosen per mailbox:
 * - `Block`      : sender waits for space (or for close).
 * - `DropOldest` : the oldest queued value is discarded to make room.
 * - `Reject`     : the new value is refused with `SendStatus::Rejected`.
 *
 * A capacity of 0 means unbounded; the policy is then never consulted.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace gwbridge::utils
{

enum class FullPolicy
{
    Block,
    DropOldest,
    Reject
};

enum class SendStatus
{
    Sent,
    DroppedOldest, ///< Sent, but the oldest queued value was discarded.
    Rejected,
    Closed
};

[[nodiscard]] constexpr const char *to_string(FullPolicy policy) noexcept
{
    switch (policy)
    {
    case FullPolicy::Block: return "block";
    case FullPolicy::DropOldest: return "drop_oldest";
    case FullPolicy::Reject: return "reject";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char *to_string(SendStatus status) noexcept
{
    switch (status)
    {
    case SendStatus::Sent: return "sent";
    case SendStatus::DroppedOldest: return "dropped_oldest";
    case SendStatus::Rejected: return "rejected";
    case SendStatus::Closed: return "closed";
    }
    return "unknown";
}

template <typename T>
class Mailbox
{
  public:
    explicit Mailbox(std::size_t capacity = 0, FullPolicy policy = FullPolicy::Block)
        : m_capacity(capacity), m_policy(policy)
    {
    }

    Mailbox(const Mailbox &) = delete;
    Mailbox &operator=(const Mailbox &) = delete;

    /**
     * @brief Enqueues @p value according to the full-queue policy.
     * @return `Sent` or `DroppedOldest` when the value was queued.
     */
    [[nodiscard]] SendStatus send(T value)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_closed)
            return SendStatus::Closed;

        SendStatus status = SendStatus::Sent;
        if (m_capacity != 0 && m_queue.size() >= m_capacity)
        {
            switch (m_policy)
            {
            case FullPolicy::Block:
                m_not_full.wait(lock, [this] { return m_closed || m_queue.size() < m_capacity; });
                if (m_closed)
                    return SendStatus::Closed;
                break;
            case FullPolicy::DropOldest:
                m_queue.pop_front();
                status = SendStatus::DroppedOldest;
                break;
            case FullPolicy::Reject:
                return SendStatus::Rejected;
            }
        }

        m_queue.push_back(std::move(value));
        lock.unlock();
        m_not_empty.notify_one();
        return status;
    }

    /**
     * @brief Enqueues @p value even when the mailbox is at capacity.
     * For end-of-session notices that no full-queue policy may lose or delay.
     * @return `Sent`, or `Closed` when the mailbox no longer accepts values.
     */
    [[nodiscard]] SendStatus force_send(T value)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed)
                return SendStatus::Closed;
            m_queue.push_back(std::move(value));
        }
        m_not_empty.notify_one();
        return SendStatus::Sent;
    }

    /** @brief Non-blocking receive. */
    [[nodiscard]] std::optional<T> try_receive()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return pop_locked(lock);
    }

    /**
     * @brief Waits up to @p timeout for a value.
     * Returns immediately with nullopt once the mailbox is closed and drained.
     */
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait_for(lock, timeout, [this] { return m_closed || !m_queue.empty(); });
        return pop_locked(lock);
    }

    /** @brief Refuses further sends and wakes all waiters. Idempotent. */
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

    [[nodiscard]] bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /** @brief True once closed and every queued value has been received. */
    [[nodiscard]] bool is_drained() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_queue.empty();
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] FullPolicy policy() const noexcept { return m_policy; }

  private:
    std::optional<T> pop_locked(std::unique_lock<std::mutex> &lock)
    {
        if (m_queue.empty())
            return std::nullopt;
        std::optional<T> value(std::move(m_queue.front()));
        m_queue.pop_front();
        lock.unlock();
        m_not_full.notify_one();
        return value;
    }

    const std::size_t m_capacity;
    const FullPolicy m_policy;

    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::deque<T> m_queue;
    bool m_closed = false;
};

} // namespace gwbridge::utils
