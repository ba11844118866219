#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>

#include "app/chat_session.hpp"
#include "app/commands.hpp"
#include "app/shutdown.hpp"
#include "transport/tcp_transport.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

std::unique_ptr<transport::ProtocolTransport> make_transport(const config::Config &cfg)
{
    if (cfg.transport == config::TransportKind::Udp)
    {
        transport::ReliabilitySettings rs;
        rs.timeout     = std::chrono::milliseconds(cfg.timeout_ms);
        rs.max_retries = cfg.retries;
        return std::make_unique<transport::UdpTransport>(cfg.host, cfg.port, rs);
    }
    return std::make_unique<transport::TcpTransport>(cfg.host, cfg.port);
}

void print_output(app::Output kind, const std::string &line)
{
    // chat and replies on stdout, every kind of error on stderr
    if (kind == app::Output::Chat || kind == app::Output::Info)
    {
        std::fprintf(stdout, "%s\n", line.c_str());
        std::fflush(stdout);
    }
    else
    {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

int exit_code(app::EndReason r)
{
    switch (r)
    {
        case app::EndReason::PeerError:
        case app::EndReason::ProtocolFault:
            return exitc::protocol;
        case app::EndReason::ConnectionFault:
            return exitc::no_server;
        default:
            return exitc::ok;
    }
}

using TransportPtr = std::shared_ptr<transport::ProtocolTransport>;

// blocked in sigwait() for the life of the process. The driver may itself be
// stuck waiting for a CONFIRM, so that wait is cut short before queuing.
void start_signal_thread(transport::EventQueue &events, TransportPtr tx, sigset_t set)
{
    std::thread([&events, tx, set] {
        int sig = 0;
        while (sigwait(&set, &sig) == 0)
        {
            LOG_DEBUG("caught signal %d", sig);
            tx->abort_waits();
            events.put(transport::Event::of(transport::Event::Type::Interrupt));
        }
    }).detach();
}

// blocked in getline() for the life of the process
void start_input_thread(transport::EventQueue &events, TransportPtr tx)
{
    std::thread([&events, tx] {
        std::string line;
        while (std::getline(std::cin, line))
            events.put(transport::Event::of(transport::Event::Type::Input, line));
        tx->abort_waits();
        events.put(transport::Event::of(transport::Event::Type::InputClosed));
    }).detach();
}

}  // namespace

int main(int argc, char **argv)
{
    std::string err;
    auto        cfg = config::parse_args(argc, argv, &err);
    if (!cfg)
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        config::print_usage(argv[0]);
        return exitc::bad_args;
    }
    if (cfg->help)
    {
        config::print_usage(argv[0]);
        return exitc::ok;
    }

    if (cfg->verbose)
        wirechat::set_log_level(wirechat::Level::Debug);
    if (const char *log_level = std::getenv("WIRECHAT_LOG_LEVEL"))
        wirechat::set_log_level_by_name(log_level);

    LOG_INFO("Config: transport=%s server=%s:%u timeout=%ums retries=%u",
             config::transport_name(cfg->transport), cfg->host.c_str(), (unsigned)cfg->port,
             (unsigned)cfg->timeout_ms, (unsigned)cfg->retries);

    // every thread started below inherits the mask; only sigwait() sees these
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    // outlives the detached reader threads
    static transport::EventQueue events;

    // shared with the detached threads, which may still fire after main returns
    TransportPtr tx = make_transport(*cfg);
    if (!tx->start(events))
    {
        std::fprintf(stderr, "ERROR: cannot reach %s:%u over %s\n", cfg->host.c_str(),
                     (unsigned)cfg->port, config::transport_name(cfg->transport));
        return exitc::no_server;
    }

    start_signal_thread(events, tx, set);
    start_input_thread(events, tx);

    app::ChatSession session(*tx, print_output);

    while (!session.terminated())
    {
        auto ev = events.take_for(constants::RECV_POLL_TICK);
        session.check_timeouts();
        if (!ev)
            continue;

        switch (ev->type)
        {
            case transport::Event::Type::Input:
                app::execute(ev->detail, session);
                break;
            case transport::Event::Type::InputClosed:
            case transport::Event::Type::Interrupt:
                session.terminate(app::EndReason::LocalRequest);
                break;
            default:
                session.on_event(*ev);
                break;
        }
    }

    const app::EndReason why = session.end_reason();
    std::optional<std::string> farewell;
    if (why == app::EndReason::LocalRequest && session.authenticated())
        farewell = session.display_name();

    app::ShutdownCoordinator closer(*tx);
    closer.run(farewell);

    LOG_INFO("exiting (%s)", app::end_reason_name(why));
    return exit_code(why);
}
