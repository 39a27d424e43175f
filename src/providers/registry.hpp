#pragma once

#include "providers/context_provider.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace continuity {

// Keeps providers in registration order; registering a name twice replaces
// the earlier provider in place.
class ContextProviderRegistry {
 public:
  void Register(std::unique_ptr<IContextProvider> provider) {
    if (!provider) return;
    std::lock_guard<std::mutex> lock(mu_);
    const auto name = provider->Name();
    for (auto& p : providers_) {
      if (p->Name() == name) {
        p = std::move(provider);
        return;
      }
    }
    providers_.push_back(std::move(provider));
  }

  IContextProvider* Get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& p : providers_) {
      if (p->Name() == name) return p.get();
    }
    return nullptr;
  }

  std::vector<IContextProvider*> List() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<IContextProvider*> out;
    out.reserve(providers_.size());
    for (const auto& p : providers_) out.push_back(p.get());
    return out;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return providers_.size();
  }

 private:
  mutable std::mutex mu_;
  std::vector<std::unique_ptr<IContextProvider>> providers_;
};

}  // namespace continuity
