#pragma once

#include "append_log.hpp"
#include "context_assembler.hpp"
#include "session_data_store.hpp"
#include "session_tracker.hpp"

#include <httplib.h>

namespace continuity {

class ContinuityRouter {
 public:
  // Throws ConfigurationError when any collaborator is null.
  ContinuityRouter(SessionTracker* tracker,
                   SessionDataStore* store,
                   ContextAssembler* assembler,
                   AppendLog* log,
                   size_t max_batch_size);

  void Register(httplib::Server* server);

 private:
  SessionTracker* tracker_;
  SessionDataStore* store_;
  ContextAssembler* assembler_;
  AppendLog* log_;
  size_t max_batch_size_;
};

}  // namespace continuity
