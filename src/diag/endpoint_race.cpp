// llmlink diag: EndpointRace implementation
#include "diag/endpoint_race.hpp"

#include <condition_variable>
#include <exception>
#include <memory>
#include <system_error>
#include <thread>

#include "ll_types.hpp"

namespace ll {

// Shared between the caller and every probe thread; outlives the race() call
// for as long as a straggler still holds it.
struct EndpointRace::RaceState {
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t pending = 0;
    bool decided = false;
    std::optional<std::string> winner;
    std::vector<ProbeOutcome> failures;
    CancelFlag cancel = make_cancel_flag();

    void report(ProbeOutcome outcome) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            --pending;
            if (!decided) {
                if (outcome.success) {
                    decided = true;
                    winner = outcome.candidate;
                    cancel->store(true);
                } else {
                    failures.push_back(std::move(outcome));
                }
            }
        }
        cv.notify_all();
    }
};

EndpointRace::EndpointRace(ProbeFn probe) : probe_(std::move(probe)) {
    if (!probe_) throw LinkError(LinkErrc::InvalidConfig, "EndpointRace requires a probe function");
}

std::vector<ProbeOutcome> EndpointRace::last_failures() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return last_failures_;
}

RaceResult EndpointRace::race(const std::vector<std::string>& candidates,
                              std::chrono::milliseconds per_probe_timeout) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        last_failures_.clear();
    }
    if (candidates.empty()) return std::nullopt;

    auto state = std::make_shared<RaceState>();
    state->pending = candidates.size();

    for (const auto& candidate : candidates) {
        ProbeFn probe = probe_;
        try {
            std::thread([state, probe, candidate, per_probe_timeout]() {
                ProbeOutcome outcome;
                if (state->cancel->load()) {
                    outcome.candidate = candidate;
                    outcome.error = "cancelled";
                } else {
                    try {
                        outcome = probe(candidate, per_probe_timeout, state->cancel);
                        outcome.candidate = candidate;
                    } catch (const std::exception& e) {
                        outcome = ProbeOutcome{};
                        outcome.candidate = candidate;
                        outcome.error = e.what();
                    } catch (...) {
                        outcome = ProbeOutcome{};
                        outcome.candidate = candidate;
                        outcome.error = "probe threw a non-standard exception";
                    }
                }
                state->report(std::move(outcome));
            }).detach();
        } catch (const std::system_error& e) {
            ProbeOutcome failed;
            failed.candidate = candidate;
            failed.error = std::string("could not start probe: ") + e.what();
            state->report(std::move(failed));
        }
    }

    std::vector<ProbeOutcome> failures;
    RaceResult winner;
    {
        std::unique_lock<std::mutex> lk(state->mutex);
        state->cv.wait(lk, [&] { return state->decided || state->pending == 0; });
        // Freeze the decision; reports arriving from now on are ignored.
        state->decided = true;
        state->cancel->store(true);
        winner = state->winner;
        failures = state->failures;
    }

    if (observer_) {
        for (const auto& f : failures) observer_(f);
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        last_failures_ = std::move(failures);
    }
    return winner;
}

}  // namespace ll
