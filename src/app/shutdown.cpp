#include <algorithm>
#include <future>
#include <thread>

#include "app/shutdown.hpp"
#include "util/log.hpp"

namespace app
{

using std::chrono::milliseconds;

ShutdownCoordinator::ShutdownCoordinator(transport::ProtocolTransport &t, ShutdownBudgets b)
    : tx_(t), budgets_(b)
{
}

bool ShutdownCoordinator::run_stage(const char                  *what,
                                    milliseconds                 budget,
                                    const std::function<void()> &fn)
{
    std::promise<void> finished;
    auto               fut = finished.get_future();
    std::thread        worker([&] {
        fn();
        finished.set_value();
    });

    bool in_time = fut.wait_for(budget) == std::future_status::ready;
    if (!in_time)
    {
        ++overruns_;
        LOG_WARN("shutdown stage '%s' exceeded %lldms, closing transport", what,
                 (long long)budget.count());
        // unblocks every send/ack wait the stage may be stuck in
        tx_.disconnect();
    }
    worker.join();
    return in_time;
}

void ShutdownCoordinator::run(const std::optional<std::string> &farewell_name)
{
    if (started_.exchange(true))
    {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return done_; });
        return;
    }

    const auto start     = std::chrono::steady_clock::now();
    auto       remaining = [&](milliseconds stage) {
        auto used = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);
        return std::max(milliseconds(0), std::min(stage, budgets_.total - used));
    };

    LOG_INFO("shutting down (%s)", tx_.name().c_str());

    if (farewell_name)
    {
        run_stage("farewell", remaining(budgets_.farewell), [&] {
            if (!tx_.send_bye(*farewell_name))
                LOG_WARN("BYE not sent");
        });
    }
    run_stage("flush", remaining(budgets_.flush) + milliseconds(50), [&] {
        tx_.flush(remaining(budgets_.flush));
    });
    run_stage("disconnect", remaining(budgets_.disconnect), [&] { tx_.disconnect(); });

    {
        std::lock_guard<std::mutex> lk(mu_);
        done_ = true;
    }
    cv_.notify_all();
    LOG_INFO("shutdown complete");
}

bool ShutdownCoordinator::done() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return done_;
}

}  // namespace app
