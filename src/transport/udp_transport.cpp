#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

#include "transport/udp_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

UdpTransport::UdpTransport(std::string host, std::uint16_t port, ReliabilitySettings settings)
    : host_(std::move(host)), port_(port), settings_(settings)
{
}

UdpTransport::~UdpTransport()
{
    disconnect();
}

bool UdpTransport::start(EventQueue &events)
{
    if (running_.load())
        return true;

    Endpoint    server;
    std::string err;
    if (!resolve(host_, port_, SOCK_DGRAM, server, &err))
        return false;

    int fd = ::socket(server.addr.ss_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    // any local address, ephemeral port
    sockaddr_storage local{};
    socklen_t        local_len = 0;
    if (server.addr.ss_family == AF_INET6)
    {
        auto *v6        = reinterpret_cast<sockaddr_in6 *>(&local);
        v6->sin6_family = AF_INET6;
        v6->sin6_addr   = in6addr_any;
        local_len       = sizeof(sockaddr_in6);
    }
    else
    {
        auto *v4            = reinterpret_cast<sockaddr_in *>(&local);
        v4->sin_family      = AF_INET;
        v4->sin_addr.s_addr = htonl(INADDR_ANY);
        local_len           = sizeof(sockaddr_in);
    }
    if (::bind(fd, reinterpret_cast<sockaddr *>(&local), local_len) == -1)
    {
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        ::close(fd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(fd_mu_);
        fd_ = fd;
    }
    events_ = &events;
    engine_ = std::make_unique<ReliabilityEngine>(
        settings_, server,
        [this](const dgram::Bytes &b, const Endpoint &to) { return raw_send(b, to); });

    closed_.store(false);
    running_.store(true);
    rx_thr_ = std::thread([this] { rx_loop(); });

    LOG_INFO("udp socket %s -> %s (timeout=%lldms retries=%u)", local_endpoint().to_string().c_str(),
             server.to_string().c_str(), (long long)settings_.timeout.count(),
             (unsigned)settings_.max_retries);
    return true;
}

Endpoint UdpTransport::local_endpoint() const
{
    std::lock_guard<std::mutex> lk(fd_mu_);
    Endpoint                    e;
    if (fd_ == -1)
        return e;
    e.len = sizeof e.addr;
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&e.addr), &e.len) == -1)
        e.len = 0;
    return e;
}

bool UdpTransport::raw_send(const dgram::Bytes &bytes, const Endpoint &to)
{
    std::lock_guard<std::mutex> lk(fd_mu_);
    if (fd_ == -1)
        return false;
    ssize_t n;
    do
    {
        n = ::sendto(fd_, bytes.data(), bytes.size(), 0, to.sa(), to.len);
    } while (n == -1 && errno == EINTR);
    if (n == -1)
    {
        LOG_ERROR("sendto(%s) failed: %s", to.to_string().c_str(), std::strerror(errno));
        return false;
    }
    LOG_DEBUG("tx %s id=%u (%zu bytes) -> %s", dgram::type_name(bytes[0]),
              (unsigned)((bytes[1] << 8) | bytes[2]), bytes.size(), to.to_string().c_str());
    return true;
}

bool UdpTransport::send_reliable(const dgram::Bytes &frame)
{
    if (!engine_)
    {
        LOG_ERROR("transport not started");
        return false;
    }
    Delivery d = engine_->send_reliable(frame);
    if (d != Delivery::Confirmed)
        LOG_DEBUG("%s delivery %s", dgram::type_name(frame[0]), delivery_name(d));
    return d != Delivery::Failed;
}

bool UdpTransport::send_auth(std::string_view username,
                             std::string_view display_name,
                             std::string_view secret)
{
    if (!engine_)
        return false;
    return send_reliable(dgram::make_auth(engine_->next_id(), username, display_name, secret));
}

bool UdpTransport::send_join(std::string_view channel, std::string_view display_name)
{
    if (!engine_)
        return false;
    return send_reliable(dgram::make_join(engine_->next_id(), channel, display_name));
}

bool UdpTransport::send_msg(std::string_view display_name, std::string_view content)
{
    if (!engine_)
        return false;
    return send_reliable(dgram::make_msg(engine_->next_id(), display_name, content));
}

bool UdpTransport::send_bye(std::string_view display_name)
{
    if (!engine_)
        return false;
    return send_reliable(dgram::make_bye(engine_->next_id(), display_name));
}

bool UdpTransport::send_err(std::string_view display_name, std::string_view content)
{
    if (!engine_)
        return false;
    return send_reliable(dgram::make_err(engine_->next_id(), display_name, content));
}

void UdpTransport::set_request_pending(bool pending)
{
    if (engine_)
        engine_->set_request_pending(pending);
}

void UdpTransport::mark_authenticated()
{
    if (engine_)
        engine_->lock_peer();
}

void UdpTransport::handle(const std::uint8_t *buf, std::size_t len, const Endpoint &from)
{
    if (len >= dgram::HDR_SIZE)
        LOG_DEBUG("rx %s id=%u (%zu bytes) <- %s", dgram::type_name(buf[0]),
                  (unsigned)((buf[1] << 8) | buf[2]), len, from.to_string().c_str());
    Inbound in = engine_->on_datagram(buf, len, from);
    switch (in.action)
    {
        case Inbound::Action::Deliver:
        {
            std::string err;
            auto        msg = dgram::to_message(in.frame, &err);
            if (msg)
                events_->put(Event::message(std::move(*msg)));
            else
                events_->put(Event::of(Event::Type::Malformed, err));
            break;
        }
        case Inbound::Action::Malformed:
            LOG_WARN("malformed datagram from %s: %s", from.to_string().c_str(),
                     in.error.c_str());
            events_->put(Event::of(Event::Type::Malformed, in.error));
            break;
        case Inbound::Action::Acked:
        case Inbound::Action::Duplicate:
        case Inbound::Action::Ignore:
            break;
    }
}

void UdpTransport::rx_loop()
{
    std::vector<std::uint8_t> buf(constants::MAX_DATAGRAM);

    while (running_.load())
    {
        int fd;
        {
            std::lock_guard<std::mutex> lk(fd_mu_);
            fd = fd_;
        }
        if (fd == -1)
            break;

        pollfd pfd{fd, POLLIN, 0};
        int    n = ::poll(&pfd, 1, (int)constants::RECV_POLL_TICK.count());
        if (n == 0)
            continue;
        if (n == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            if (running_.load())
                events_->put(Event::of(Event::Type::Fault,
                                       std::string("poll() failed: ") + std::strerror(errno)));
            break;
        }

        sockaddr_storage src{};
        socklen_t        src_len = sizeof src;
        ssize_t got = ::recvfrom(fd, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr *>(&src),
                                 &src_len);
        if (got == -1)
        {
            // ICMP errors surface here on some stacks; the datagram layer shrugs them off
            if (errno == EINTR || errno == EAGAIN || errno == ECONNREFUSED)
                continue;
            if (running_.load())
            {
                LOG_ERROR("recvfrom() failed: %s", std::strerror(errno));
                events_->put(Event::of(Event::Type::Fault,
                                       std::string("recvfrom() failed: ") + std::strerror(errno)));
            }
            break;
        }
        handle(buf.data(), static_cast<std::size_t>(got),
               Endpoint::from(reinterpret_cast<sockaddr *>(&src), src_len));
    }
}

bool UdpTransport::flush(std::chrono::milliseconds budget)
{
    if (!engine_)
        return true;
    bool idle = engine_->wait_idle(budget);
    if (!idle)
        LOG_WARN("%zu datagrams still unconfirmed", engine_->pending());
    return idle;
}

void UdpTransport::abort_waits()
{
    if (engine_)
        engine_->abort_waits();
}

void UdpTransport::disconnect()
{
    if (closed_.exchange(true))
        return;
    running_.store(false);
    if (engine_)
        engine_->cancel();
    if (rx_thr_.joinable())
        rx_thr_.join();

    std::lock_guard<std::mutex> lk(fd_mu_);
    if (fd_ != -1)
    {
        ::close(fd_);
        fd_ = -1;
        LOG_INFO("socket closed");
    }
}

}  // namespace transport
