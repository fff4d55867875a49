#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace demonlist::db {

/*
  ConnectionPool

  Bounded pool of backend handles shared by every worker.

  Design notes:
  -------------
  - Handles are created lazily through the factory, up to max_connections.
  - Backend handles are NOT thread-safe: a handle is used by exactly one
    worker between Acquire() and release.
  - Acquire() blocks while the pool is saturated. With a non-zero
    acquire_timeout it gives up and throws util::ConnectionUnavailable.
  - A factory failure (server down, bad path) also surfaces as
    util::ConnectionUnavailable.

  Lifetime:
    Repository owns shared_ptr<ConnectionPool>
    Connection holds the shared_ptr<Handle> returned by Acquire(); dropping
    it hands the handle back to the idle list.
*/

template <typename Handle>
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool<Handle>> {
 public:
  using Factory = std::function<std::unique_ptr<Handle>()>;

  ConnectionPool(Factory factory, std::size_t max_connections, std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds::zero())
      : factory_(std::move(factory)),
        max_connections_(max_connections == 0 ? 1 : max_connections),
        acquire_timeout_(acquire_timeout) {
  }

  std::shared_ptr<Handle> Acquire() {
    std::unique_lock lock(mutex_);

    const auto ready = [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    };

    if (acquire_timeout_.count() > 0) {
      if (!cv_.wait_for(lock, acquire_timeout_, ready)) {
        throw util::ConnectionUnavailable("timed out after " + std::to_string(acquire_timeout_.count()) + "ms waiting for a pooled connection");
      }
    } else {
      cv_.wait(lock, ready);
    }

    if (!idle_.empty()) {
      auto handle = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(handle.release());
    }

    ++live_connections_;
    lock.unlock();

    try {
      auto handle = factory_();
      if (!handle) {
        throw std::runtime_error("connection factory returned no handle");
      }
      return Wrap(handle.release());
    } catch (const util::ConnectionUnavailable&) {
      Forget();
      throw;
    } catch (const std::exception& e) {
      Forget();
      throw util::ConnectionUnavailable(e.what());
    }
  }

  std::size_t MaxConnections() const {
    return max_connections_;
  }

  std::size_t IdleConnections() const {
    std::lock_guard lock(mutex_);
    return idle_.size();
  }

 private:
  std::shared_ptr<Handle> Wrap(Handle* handle) {
    std::weak_ptr<ConnectionPool> weak_self = this->shared_from_this();
    return std::shared_ptr<Handle>(handle, [weak_self](Handle* released) {
      if (auto self = weak_self.lock()) {
        self->Release(released);
        return;
      }
      delete released;
    });
  }

  void Release(Handle* handle) {
    {
      std::lock_guard lock(mutex_);
      idle_.emplace_back(handle);
    }
    cv_.notify_one();
  }

  void Forget() {
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
  }

  Factory                   factory_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex                   mutex_;
  std::condition_variable              cv_;
  std::vector<std::unique_ptr<Handle>> idle_;
  std::size_t                          live_connections_ = 0;
};

} // namespace demonlist::db
