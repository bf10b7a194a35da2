#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "engine/config.hpp"
#include "engine/types.hpp"
#include "misc/address.hpp"

namespace swarmget::engine {

/**
 * @brief Peer set policy: who to connect to and when
 *
 * Holds no sockets. The controller reports connection outcomes and gets
 * back the addresses it should dial next. Time is always passed in so the
 * policy can be driven by tests.
 */
class PeerManager
{
 public:
    using TimePoint = Clock::time_point;

    // Known but unconnected addresses kept for replenishment
    static constexpr std::size_t MAX_BACKLOG = 1000;

    enum class Admission
    {
        Connect,
        Queued,
        Duplicate,
        CoolingDown,
        Rejected,
    };

    enum class Status
    {
        Backlog,
        Connecting,
        Active,
    };

    explicit PeerManager(const SwarmConfig& config);

    /**
     * @brief Offer an address from discovery
     *
     * Connect means the caller should dial it now; the address is counted as
     * connecting from this moment on.
     */
    auto admit_candidate(const utils::PeerAddress& address, TimePoint now)
      -> Admission;

    void on_connected(const utils::PeerAddress& address);

    /**
     * @brief Remove a connecting or active address and apply its cooldown
     *
     * Failed dials and failed handshakes count as failures with exponential
     * backoff, protocol violations and bans get the long penalty, a clean
     * close resets the failure count.
     *
     * Returns the backlog addresses that should be dialed to replace it.
     */
    auto on_disconnect(
      const utils::PeerAddress& address, CloseReason reason, TimePoint now
    ) -> std::vector<utils::PeerAddress>;

    /**
     * @brief Pop eligible backlog addresses while there is room
     */
    auto next_candidates(TimePoint now) -> std::vector<utils::PeerAddress>;

    auto needs_peers() const -> bool;
    auto active_count() const -> std::size_t { return _active; }
    auto connecting_count() const -> std::size_t { return _connecting; }
    auto backlog_size() const -> std::size_t;

    auto status(const utils::PeerAddress& address) const
      -> std::optional<Status>;
    auto retry_at(const utils::PeerAddress& address) const
      -> std::optional<TimePoint>;
    auto failures(const utils::PeerAddress& address) const -> std::size_t;

 private:
    struct Entry
    {
        Status status = Status::Backlog;
        std::size_t failures = 0;
        TimePoint retry_at{};
    };

    auto _backoff(std::size_t failures) const -> std::chrono::milliseconds;
    auto _has_room() const -> bool;
    void _leave(Entry& entry);

    const std::size_t _min_peers;
    const std::size_t _max_peers;
    const std::size_t _max_connecting;
    const std::chrono::milliseconds _backoff_base;
    const std::chrono::milliseconds _backoff_cap;
    const std::chrono::milliseconds _violation_penalty;

    std::map<utils::PeerAddress, Entry> _entries;
    std::size_t _active = 0;
    std::size_t _connecting = 0;
};

}  // namespace swarmget::engine
