#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace stevedore::core {

// Bounded multi-producer / multi-consumer message queue.
//
// The only way workers talk to the arbitration loop and the only way deposit
// notifications reach subscribers. Ownership of a value moves into the
// channel on send and out of it on receive.
//
//  - trySend() never blocks: it fails when the buffer is full (drop-on-full).
//  - send()/receive() block until they can proceed, the channel is closed,
//    or the stop token fires.
//  - After close(), pending items can still be drained; sends fail.
template <typename T>
class Channel {
public:
  explicit Channel(std::size_t capacity) : m_capacity(std::max<std::size_t>(1, capacity)) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  bool trySend(T value) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_closed || m_items.size() >= m_capacity) return false;
      m_items.push_back(std::move(value));
    }
    m_notEmpty.notify_one();
    return true;
  }

  bool send(T value, std::stop_token stop = {}) {
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      const bool ready = m_notFull.wait(lock, stop, [&] {
        return m_closed || m_items.size() < m_capacity;
      });
      if (!ready || m_closed) return false;
      m_items.push_back(std::move(value));
    }
    m_notEmpty.notify_one();
    return true;
  }

  // nullopt when stopped, or when closed and fully drained.
  std::optional<T> receive(std::stop_token stop = {}) {
    std::optional<T> out;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      const bool ready = m_notEmpty.wait(lock, stop, [&] {
        return m_closed || !m_items.empty();
      });
      if (!ready || m_items.empty()) return std::nullopt;
      out.emplace(std::move(m_items.front()));
      m_items.pop_front();
    }
    m_notFull.notify_one();
    return out;
  }

  std::optional<T> tryReceive() {
    std::optional<T> out;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_items.empty()) return std::nullopt;
      out.emplace(std::move(m_items.front()));
      m_items.pop_front();
    }
    m_notFull.notify_one();
    return out;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
  }

  std::size_t capacity() const { return m_capacity; }

private:
  mutable std::mutex m_mutex;
  std::condition_variable_any m_notEmpty;
  std::condition_variable_any m_notFull;
  std::deque<T> m_items;
  std::size_t m_capacity{1};
  bool m_closed{false};
};

} // namespace stevedore::core
