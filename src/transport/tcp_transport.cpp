#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "proto/textwire.hpp"
#include "transport/endpoint.hpp"
#include "transport/tcp_transport.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace transport
{

TcpTransport::TcpTransport(std::string host, std::uint16_t port)
    : host_(std::move(host)), port_(port)
{
}

TcpTransport::~TcpTransport()
{
    disconnect();
}

bool TcpTransport::connect_bounded()
{
    Endpoint    server;
    std::string err;
    if (!resolve(host_, port_, SOCK_STREAM, server, &err))
        return false;

    fd_ = ::socket(server.addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    int flags = fcntl(fd_, F_GETFL, 0);
    fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd_, server.sa(), server.len);
    if (rc == -1 && errno != EINPROGRESS)
    {
        LOG_ERROR("connect(%s) failed: %s", server.to_string().c_str(), std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    if (rc == -1)
    {
        pollfd pfd{fd_, POLLOUT, 0};
        int    n;
        do
        {
            n = ::poll(&pfd, 1, (int)constants::CONNECT_TIMEOUT.count());
        } while (n == -1 && errno == EINTR);

        int       so_err = 0;
        socklen_t sl     = sizeof so_err;
        if (n == 1)
            ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &sl);
        if (n != 1 || so_err != 0)
        {
            LOG_ERROR("connect(%s) failed: %s", server.to_string().c_str(),
                      n == 0 ? "timed out" : std::strerror(so_err ? so_err : errno));
            ::close(fd_);
            fd_ = -1;
            return false;
        }
    }

    // back to blocking; the receive thread polls before every recv
    fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK);
    int one = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof one);

    LOG_INFO("connected to %s", server.to_string().c_str());
    return true;
}

bool TcpTransport::start(EventQueue &events)
{
    if (running_.load())
        return true;
    if (!connect_bounded())
        return false;

    events_ = &events;
    closed_.store(false);
    running_.store(true);
    rx_thr_ = std::thread([this] { rx_loop(); });
    return true;
}

void TcpTransport::report_fault(const std::string &why)
{
    if (!running_.load() || fault_reported_.exchange(true))
        return;
    LOG_ERROR("%s", why.c_str());
    events_->put(Event::of(Event::Type::Fault, why));
}

void TcpTransport::rx_loop()
{
    std::string pending;
    char        buf[4096];

    while (running_.load())
    {
        pollfd pfd{fd_, POLLIN, 0};
        int    n = ::poll(&pfd, 1, (int)constants::RECV_POLL_TICK.count());
        if (n == 0)
            continue;
        if (n == -1)
        {
            if (errno == EINTR)
                continue;
            report_fault(std::string("poll() failed: ") + std::strerror(errno));
            break;
        }

        ssize_t got = ::recv(fd_, buf, sizeof buf, 0);
        if (got == 0)
        {
            report_fault("connection closed by server");
            break;
        }
        if (got == -1)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            report_fault(std::string("recv() failed: ") + std::strerror(errno));
            break;
        }
        pending.append(buf, static_cast<size_t>(got));

        std::size_t pos;
        while ((pos = pending.find(textwire::CRLF)) != std::string::npos)
        {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + textwire::CRLF.size());
            LOG_DEBUG("rx: %s", line.c_str());

            std::string err;
            auto        msg = textwire::decode(line, &err);
            if (msg)
                events_->put(Event::message(std::move(*msg)));
            else
                events_->put(Event::of(Event::Type::Malformed, err));
        }
        if (pending.size() > constants::MAX_LINE)
        {
            events_->put(Event::of(Event::Type::Malformed, "line exceeds maximum frame length"));
            pending.clear();
        }
    }
}

bool TcpTransport::send_line(const std::string &line)
{
    std::lock_guard<std::mutex> lk(tx_mu_);
    if (fd_ == -1 || closed_.load() || write_shut_.load())
    {
        LOG_ERROR("send on a closed connection");
        return false;
    }

    std::size_t off = 0;
    while (off < line.size())
    {
        ssize_t n = ::send(fd_, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("send() failed: %s", std::strerror(errno));
            return false;
        }
        off += static_cast<size_t>(n);
    }
    LOG_DEBUG("tx: %.*s", (int)(line.size() - textwire::CRLF.size()), line.c_str());
    return true;
}

bool TcpTransport::send_auth(std::string_view username,
                             std::string_view display_name,
                             std::string_view secret)
{
    return send_line(textwire::encode_auth(username, display_name, secret));
}

bool TcpTransport::send_join(std::string_view channel, std::string_view display_name)
{
    return send_line(textwire::encode_join(channel, display_name));
}

bool TcpTransport::send_msg(std::string_view display_name, std::string_view content)
{
    return send_line(textwire::encode_msg(display_name, content));
}

bool TcpTransport::send_bye(std::string_view display_name)
{
    return send_line(textwire::encode_bye(display_name));
}

bool TcpTransport::send_err(std::string_view display_name, std::string_view content)
{
    return send_line(textwire::encode_err(display_name, content));
}

// Half-close so the peer sees everything we wrote followed by FIN.
bool TcpTransport::flush(std::chrono::milliseconds /*budget*/)
{
    std::lock_guard<std::mutex> lk(tx_mu_);
    if (fd_ == -1 || closed_.load() || write_shut_.exchange(true))
        return true;
    if (::shutdown(fd_, SHUT_WR) == -1 && errno != ENOTCONN)
    {
        LOG_WARN("shutdown(SHUT_WR) failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

void TcpTransport::disconnect()
{
    if (closed_.exchange(true))
        return;
    running_.store(false);
    if (fd_ != -1)
        ::shutdown(fd_, SHUT_RDWR);
    if (rx_thr_.joinable())
        rx_thr_.join();

    std::lock_guard<std::mutex> lk(tx_mu_);
    if (fd_ != -1)
    {
        ::close(fd_);
        fd_ = -1;
        LOG_INFO("disconnected");
    }
}

}  // namespace transport
