#pragma once

#include <functional>
#include <utility>

namespace conductor {

// One-shot settlement cell: the first settle() wins, later ones are ignored
template <typename T>
class Settlement {
 public:
  using Callback = std::function<void(const T&)>;

  explicit Settlement(Callback callback) : callback_(std::move(callback)) {}

  Settlement(const Settlement&) = delete;
  Settlement& operator=(const Settlement&) = delete;

  // Returns false if the cell was already settled
  bool settle(const T& value) {
    if (settled_) return false;
    settled_ = true;

    auto callback = std::move(callback_);
    callback_ = nullptr;
    if (callback) {
      callback(value);
    }
    return true;
  }

  bool settled() const {
    return settled_;
  }

 private:
  bool settled_ = false;
  Callback callback_;
};

}  // namespace conductor
