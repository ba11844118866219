#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "transport/itransport.hpp"
#include "transport/reliability.hpp"

namespace transport
{

// Datagram binding: binary frames, each confirmed by the peer.
class UdpTransport final : public ProtocolTransport
{
  public:
    UdpTransport(std::string host, std::uint16_t port, ReliabilitySettings settings);
    ~UdpTransport() override;

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
    void abort_waits() override;

    void set_request_pending(bool pending) override;
    void mark_authenticated() override;

    std::string name() const override { return "udp"; }

    // valid after start()
    Endpoint                 local_endpoint() const;
    const ReliabilityEngine *engine() const { return engine_.get(); }

  private:
    bool send_reliable(const dgram::Bytes &frame);
    bool raw_send(const dgram::Bytes &bytes, const Endpoint &to);
    void rx_loop();
    void handle(const std::uint8_t *buf, std::size_t len, const Endpoint &from);

    std::string         host_;
    std::uint16_t       port_;
    ReliabilitySettings settings_;

    int                                fd_{-1};
    mutable std::mutex                 fd_mu_;
    EventQueue                        *events_{nullptr};
    std::unique_ptr<ReliabilityEngine> engine_;
    std::thread                        rx_thr_;
    std::atomic_bool                   running_{false};
    std::atomic_bool                   closed_{false};
};

}  // namespace transport
