#include "init_retry.hpp"

#include <iostream>
#include <utility>

namespace continuity {

InitRetryPolicy::InitRetryPolicy(std::string component, int max_attempts)
    : component_(std::move(component)), max_attempts_(max_attempts > 0 ? max_attempts : 1) {}

InitResult InitRetryPolicy::Run(const std::function<bool(std::string* err)>& init) {
  std::lock_guard<std::mutex> lock(mu_);
  InitResult out;
  if (initialized_) {
    out.success = true;
    out.already_initialized = true;
    return out;
  }
  if (failures_ >= max_attempts_) {
    out.error = last_error_.empty() ? "initialization attempts exhausted" : last_error_;
    return out;
  }

  std::string err;
  if (init && init(&err)) {
    initialized_ = true;
    out.success = true;
    std::cout << "[" << component_ << "] initialized\n";
    return out;
  }

  failures_++;
  last_error_ = err.empty() ? "initialization failed" : err;
  out.error = last_error_;
  out.retryable = failures_ < max_attempts_;
  std::cout << "[" << component_ << "] error init attempt=" << failures_ << "/" << max_attempts_
            << " error=" << last_error_ << "\n";
  return out;
}

bool InitRetryPolicy::initialized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return initialized_;
}

std::string InitRetryPolicy::last_error() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_error_;
}

}  // namespace continuity
