#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "engine/types.hpp"
#include "torrent/manifest.hpp"

namespace swarmget::engine {

using namespace std::chrono_literals;

/**
 * @brief What happens once the hard timeout passes after bytes have arrived
 *
 * `max_warnings` limits how many warnings are emitted (one per monitor tick
 * past the deadline until the cap is reached). `kill_after` optionally fails
 * the swarm with Timeout once that much time has passed since start, even
 * with an active transfer. Without it an active transfer is never killed.
 */
struct HardTimeoutPolicy
{
    std::size_t max_warnings = 1;
    std::optional<std::chrono::milliseconds> kill_after;
};

struct SwarmConfig
{
    // Liveness
    std::chrono::milliseconds connect_timeout = 30s;
    std::chrono::milliseconds idle_timeout = 60s;
    std::chrono::milliseconds hard_timeout = 10800s;
    HardTimeoutPolicy hard_timeout_policy;
    std::chrono::milliseconds monitor_interval = 5s;

    // Peer set
    std::size_t min_peers = 4;
    std::size_t max_peers = 50;
    std::size_t max_connecting = 8;

    // Requests
    std::size_t max_requests_per_peer = 5;
    std::uint32_t block_size = torrent::DEFAULT_BLOCK_SIZE;

    // Peer session
    std::chrono::milliseconds handshake_timeout = 10s;
    std::chrono::milliseconds request_timeout = 30s;
    std::chrono::milliseconds keepalive_interval = 120s;
    std::chrono::milliseconds peer_inactivity_timeout = 180s;

    // Address cooldown
    std::chrono::milliseconds backoff_base = 5s;
    std::chrono::milliseconds backoff_cap = 10min;
    std::chrono::milliseconds violation_penalty = 30min;

    // Discovery polling
    std::chrono::milliseconds discovery_interval = 30s;
    std::chrono::milliseconds discovery_backoff_cap = 5min;

    // Retry budgets
    std::size_t storage_retry_limit = 3;
    std::size_t metadata_retry_limit = 3;
    std::size_t corrupt_warning_threshold = 5;
    std::size_t corrupt_strikes_before_ban = 2;

    bool recheck_existing = true;
    unsigned progress_step_percent = 5;

    // Generated when not set
    std::optional<PeerId> peer_id;
};

}  // namespace swarmget::engine
