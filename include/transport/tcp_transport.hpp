#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

// Stream binding: one CRLF-terminated text line per message.
class TcpTransport final : public ProtocolTransport
{
  public:
    TcpTransport(std::string host, std::uint16_t port);
    ~TcpTransport() override;

    bool start(EventQueue &events) override;

    bool send_auth(std::string_view username,
                   std::string_view display_name,
                   std::string_view secret) override;
    bool send_join(std::string_view channel, std::string_view display_name) override;
    bool send_msg(std::string_view display_name, std::string_view content) override;
    bool send_bye(std::string_view display_name) override;
    bool send_err(std::string_view display_name, std::string_view content) override;

    bool flush(std::chrono::milliseconds budget) override;
    void disconnect() override;

    std::string name() const override { return "tcp"; }

  private:
    bool connect_bounded();
    bool send_line(const std::string &line);
    void rx_loop();
    void report_fault(const std::string &why);

    std::string   host_;
    std::uint16_t port_;

    int              fd_{-1};
    EventQueue      *events_{nullptr};
    std::thread      rx_thr_;
    std::mutex       tx_mu_;
    std::atomic_bool running_{false};
    std::atomic_bool closed_{false};
    std::atomic_bool write_shut_{false};
    std::atomic_bool fault_reported_{false};
};

}  // namespace transport
