#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace app
{

struct ShutdownBudgets
{
    std::chrono::milliseconds farewell   = constants::SHUTDOWN_BYE_BUDGET;
    std::chrono::milliseconds flush      = constants::SHUTDOWN_FLUSH_GRACE;
    std::chrono::milliseconds disconnect = constants::SHUTDOWN_DISCONNECT_BUDGET;
    std::chrono::milliseconds total      = constants::SHUTDOWN_TOTAL_BUDGET;
};

// Runs notify peer, flush, close exactly once, each stage under its own
// budget. A stage that overruns is abandoned by force-closing the transport.
class ShutdownCoordinator
{
  public:
    explicit ShutdownCoordinator(transport::ProtocolTransport &t, ShutdownBudgets b = {});

    // farewell_name set: send BYE under that display name first.
    // Concurrent and later callers block until the first run has finished.
    void run(const std::optional<std::string> &farewell_name);

    bool done() const;
    int  stages_overrun() const { return overruns_.load(); }

  private:
    bool run_stage(const char *what, std::chrono::milliseconds budget,
                   const std::function<void()> &fn);

    transport::ProtocolTransport &tx_;
    ShutdownBudgets               budgets_;

    std::atomic_bool        started_{false};
    std::atomic_int         overruns_{0};
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    bool                    done_{false};
};

}  // namespace app
