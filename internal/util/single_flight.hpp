#pragma once

#include <atomic>

namespace outbox::util {

/*
  At most one holder at a time; contenders give up instead of waiting.

      if (auto lease = flight.TryAcquire()) { ... }   // released on scope exit
*/
class SingleFlight {
 public:
  class Lease {
   public:
    Lease() = default;
    explicit Lease(std::atomic<bool>* flag) : flag_(flag) {
    }
    Lease(Lease&& other) noexcept : flag_(other.flag_) {
      other.flag_ = nullptr;
    }
    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        Release();
        flag_       = other.flag_;
        other.flag_ = nullptr;
      }
      return *this;
    }
    ~Lease() {
      Release();
    }

    Lease(const Lease&)            = delete;
    Lease& operator=(const Lease&) = delete;

    explicit operator bool() const {
      return flag_ != nullptr;
    }

    void Release() {
      if (flag_) {
        flag_->store(false);
        flag_ = nullptr;
      }
    }

   private:
    std::atomic<bool>* flag_ = nullptr;
  };

  Lease TryAcquire() {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
      return Lease{};
    }
    return Lease{&busy_};
  }

  bool Busy() const {
    return busy_.load();
  }

 private:
  std::atomic<bool> busy_{false};
};

} // namespace outbox::util
