#pragma once

#include <atomic>
#include <string>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

namespace occ {

// Base for a pipeline stage running its loop on its own thread
class Stage {
public:
  explicit Stage(std::string name);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  // A loop that throws stops the whole pipeline through global_stop, with "<name> failed: <what>" as reason
  void start(StopSource& global_stop);
  void stop();

  // Loop returned on its own (end of stream) or threw
  bool finished() const { return runner_.finished(); }
  bool failed() const { return runner_.failed(); }
  std::string error() const { return runner_.error(); }

  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& global_stop,
                   const std::atomic_bool& local_stop) = 0;

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace occ
