#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace continuity {

struct InitResult {
  bool success = false;
  bool already_initialized = false;
  bool retryable = false;
  std::string error;
};

// Shared initialization policy: the first successful attempt wins, a failed
// attempt may be retried until max_attempts failures have been seen, after
// which the component stays uninitialized and callers degrade.
class InitRetryPolicy {
 public:
  InitRetryPolicy(std::string component, int max_attempts = 3);

  InitResult Run(const std::function<bool(std::string* err)>& init);

  bool initialized() const;
  std::string last_error() const;

 private:
  std::string component_;
  int max_attempts_;
  mutable std::mutex mu_;
  bool initialized_ = false;
  int failures_ = 0;
  std::string last_error_;
};

}  // namespace continuity
