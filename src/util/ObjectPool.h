#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

// Checkout/return pool. Objects are built lazily by the factory up to
// capacity; checkouts beyond that get a transient object that is dropped on
// return instead of being kept.
template <typename T> class ObjectPool : public std::enable_shared_from_this<ObjectPool<T>> {
public:
  using Factory = std::function<std::unique_ptr<T>()>;
  using Handle = std::unique_ptr<T, std::function<void(T*)>>;

  ObjectPool(size_t capacity, Factory factory)
      : capacity_(capacity), factory_(std::move(factory)) {
    pool_.reserve(capacity);
  }

  /**
   * Check an object out of the pool.
   * The returned handle puts the object back when destroyed, so a caller can
   * never hold it past its own scope.
   */
  Handle acquire() {
    std::unique_ptr<T> ptr;
    bool pooled = true;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!pool_.empty()) {
        ptr = std::move(pool_.back());
        pool_.pop_back();
      } else if (created_ < capacity_) {
        ++created_;
      } else {
        pooled = false;
      }
      ++checkedOut_;
    }

    if (!ptr) {
        ptr = factory_();
    }

    auto weak_this = std::weak_ptr<ObjectPool<T>>(this->shared_from_this());
    return Handle(ptr.release(), [weak_this, pooled](T* p) {
        if (auto pool = weak_this.lock()) {
            pool->release(std::unique_ptr<T>(p), pooled);
        } else {
            delete p;
        }
    });
  }

  size_t checkedOut() {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkedOut_;
  }

  size_t idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
  }

private:
  void release(std::unique_ptr<T> ptr, bool pooled) {
    if (!ptr) return;
    std::lock_guard<std::mutex> lock(mutex_);
    --checkedOut_;
    if (pooled) {
      pool_.push_back(std::move(ptr));
    }
  }

  size_t capacity_;
  Factory factory_;
  std::vector<std::unique_ptr<T>> pool_;
  size_t created_ = 0;
  size_t checkedOut_ = 0;
  std::mutex mutex_;
};
