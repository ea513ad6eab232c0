// llmlink diag: EndpointRace, first-success-wins probing of candidates
#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "diag/probe.hpp"

namespace ll {

using RaceResult = std::optional<std::string>;

// Runs one probe thread per candidate and returns the first candidate whose
// probe succeeds. When two probes succeed at nearly the same time the winner
// is whichever reaches the decision lock first; callers must not depend on it.
//
// Losing probes are told to stop through a shared CancelFlag. Their threads
// are detached and may finish in the background; anything they report after
// the decision is discarded.
class EndpointRace {
public:
  using OutcomeObserver = std::function<void(const ProbeOutcome&)>;

  explicit EndpointRace(ProbeFn probe);

  EndpointRace(const EndpointRace&) = delete;
  EndpointRace& operator=(const EndpointRace&) = delete;

  // Blocks until a probe succeeds or every probe has failed. Never throws for
  // probe failures; an empty candidate list yields std::nullopt.
  RaceResult race(const std::vector<std::string>& candidates,
                  std::chrono::milliseconds per_probe_timeout);

  // Called on the caller's thread, once per failure seen before the decision.
  void set_observer(OutcomeObserver observer) { observer_ = std::move(observer); }

  // Failures collected by the most recent race() before it was decided.
  std::vector<ProbeOutcome> last_failures() const;

private:
  struct RaceState;

  ProbeFn probe_;
  OutcomeObserver observer_;

  mutable std::mutex mutex_;
  std::vector<ProbeOutcome> last_failures_;
};

}  // namespace ll
