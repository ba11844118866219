#include "transport/reliability.hpp"
#include "util/log.hpp"

namespace transport
{

const char *delivery_name(Delivery d)
{
    switch (d)
    {
        case Delivery::Confirmed:
            return "confirmed";
        case Delivery::Unconfirmed:
            return "unconfirmed";
        case Delivery::Cancelled:
            return "cancelled";
        case Delivery::Failed:
            return "failed";
    }
    return "?";
}

ReliabilityEngine::ReliabilityEngine(ReliabilitySettings settings, Endpoint peer, SendFn send)
    : settings_(settings), send_(std::move(send)), peer_(peer)
{
}

std::uint16_t ReliabilityEngine::next_id()
{
    std::lock_guard<std::mutex> lk(mu_);
    return next_id_++;
}

bool ReliabilityEngine::transmit(const dgram::Bytes &frame, const Endpoint &to)
{
    if (!send_ || !send_(frame, to))
    {
        LOG_ERROR("datagram send to %s failed", to.to_string().c_str());
        return false;
    }
    return true;
}

Delivery ReliabilityEngine::send_reliable(const dgram::Bytes &frame)
{
    dgram::Header h;
    if (!dgram::unpack_header(frame.data(), frame.size(), h))
    {
        LOG_ERROR("refusing to send a datagram without a header");
        return Delivery::Failed;
    }

    std::uint32_t gen;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancelled_)
            return Delivery::Cancelled;
        pending_[h.id] = PendingAck{frame, 0};
        gen            = abort_gen_;
    }

    for (std::uint8_t attempt = 0;; ++attempt)
    {
        if (!transmit(frame, peer()))
        {
            std::lock_guard<std::mutex> lk(mu_);
            pending_.erase(h.id);
            return Delivery::Failed;
        }

        std::unique_lock<std::mutex> lk(mu_);
        ++stats_.sent;
        if (attempt > 0)
            ++stats_.retransmissions;

        cv_.wait_for(lk, settings_.timeout, [&] {
            return cancelled_ || abort_gen_ != gen || pending_.find(h.id) == pending_.end();
        });

        auto it = pending_.find(h.id);
        if (it == pending_.end())
        {
            LOG_DEBUG("%s id=%u confirmed after %u retries", dgram::type_name(h.type),
                      (unsigned)h.id, (unsigned)attempt);
            return Delivery::Confirmed;
        }
        if (cancelled_ || abort_gen_ != gen)
        {
            LOG_DEBUG("%s id=%u wait aborted", dgram::type_name(h.type), (unsigned)h.id);
            pending_.erase(it);
            cv_.notify_all();
            return Delivery::Cancelled;
        }
        if (attempt >= settings_.max_retries)
        {
            pending_.erase(it);
            break;
        }
        ++it->second.retries_used;
        LOG_WARN("%s id=%u not confirmed, retransmitting (%u/%u)", dgram::type_name(h.type),
                 (unsigned)h.id, (unsigned)it->second.retries_used,
                 (unsigned)settings_.max_retries);
    }

    LOG_WARN("%s id=%u never confirmed, sending once more without waiting",
             dgram::type_name(h.type), (unsigned)h.id);
    if (!transmit(frame, peer()))
        return Delivery::Failed;

    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.sent;
    ++stats_.unconfirmed;
    cv_.notify_all();
    return Delivery::Unconfirmed;
}

Inbound ReliabilityEngine::on_datagram(const std::uint8_t *buf,
                                       std::size_t         len,
                                       const Endpoint     &from)
{
    Inbound in;

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!peer_locked_ && from.valid() && from != peer_)
        {
            LOG_INFO("peer moved %s -> %s", peer_.to_string().c_str(), from.to_string().c_str());
            peer_ = from;
        }
    }

    dgram::Header h;
    if (!dgram::unpack_header(buf, len, h))
    {
        in.action = Inbound::Action::Malformed;
        in.error  = "datagram too short (" + std::to_string(len) + " bytes)";
        return in;
    }

    if (h.type == dgram::T_CONFIRM)
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = pending_.find(h.id);
        if (it != pending_.end())
        {
            pending_.erase(it);
            ++stats_.acks_received;
            cv_.notify_all();
        }
        else
        {
            LOG_DEBUG("stray CONFIRM id=%u", (unsigned)h.id);
        }
        in.action = Inbound::Action::Acked;
        return in;
    }

    // every frame with a readable header is confirmed, duplicates and
    // malformed bodies included
    if (transmit(dgram::make_confirm(h.id), from.valid() ? from : peer()))
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++stats_.acks_sent;
    }

    auto frame = dgram::parse(buf, len, &in.error);
    {
        std::lock_guard<std::mutex> lk(mu_);
        const bool seen   = !seen_.insert(h.id).second;
        const bool replay = h.type == dgram::T_REPLY && request_pending_;
        if (seen && !replay)
        {
            ++stats_.duplicates;
            LOG_DEBUG("duplicate %s id=%u dropped", dgram::type_name(h.type), (unsigned)h.id);
            in.action = Inbound::Action::Duplicate;
            return in;
        }
    }

    if (!frame)
    {
        in.action = Inbound::Action::Malformed;
        return in;
    }
    in.frame  = std::move(*frame);
    in.action = h.type == dgram::T_PING ? Inbound::Action::Ignore : Inbound::Action::Deliver;
    return in;
}

void ReliabilityEngine::set_request_pending(bool pending)
{
    std::lock_guard<std::mutex> lk(mu_);
    request_pending_ = pending;
}

void ReliabilityEngine::lock_peer()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!peer_locked_)
        LOG_DEBUG("peer locked at %s", peer_.to_string().c_str());
    peer_locked_ = true;
}

void ReliabilityEngine::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void ReliabilityEngine::abort_waits()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++abort_gen_;
    }
    cv_.notify_all();
}

bool ReliabilityEngine::wait_idle(std::chrono::milliseconds budget)
{
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, budget, [this] { return cancelled_ || pending_.empty(); });
}

Endpoint ReliabilityEngine::peer() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_;
}

bool ReliabilityEngine::peer_locked() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return peer_locked_;
}

std::size_t ReliabilityEngine::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

ReliabilityEngine::Stats ReliabilityEngine::stats() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return stats_;
}

}  // namespace transport
