#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "engine/config.hpp"
#include "engine/discovery.hpp"
#include "engine/events.hpp"
#include "engine/metadata.hpp"
#include "engine/peer_connection.hpp"
#include "engine/peer_manager.hpp"
#include "engine/piece_selector.hpp"
#include "engine/types.hpp"
#include "misc/rate_meter.hpp"
#include "storage/piece_store.hpp"
#include "torrent/descriptor.hpp"

namespace swarmget::engine {

/**
 * @brief Swarm controller
 *
 * Owns all swarm state and mutates it only from its own I/O thread. Peer
 * sessions, disk jobs and discovery queries report back by posting to that
 * thread. Hashing and file writes run on a single disk thread, blocking
 * discovery queries on a small pool of their own.
 */
class Swarm
{
 public:
    // Scheduler period for discovery polls and backlog dialing
    static constexpr auto TICK_INTERVAL = std::chrono::milliseconds(250);

    // Port reported to trackers, nothing listens on it
    static constexpr std::uint16_t ANNOUNCE_PORT = 6881;

    Swarm(
      torrent::ContentDescriptor descriptor,
      std::filesystem::path destination,
      SwarmConfig config,
      std::vector<std::shared_ptr<DiscoverySource>> sources,
      std::shared_ptr<EventSink> sink
    );

    ~Swarm();

    Swarm(const Swarm&) = delete;
    Swarm& operator=(const Swarm&) = delete;

    void run();
    void cancel();
    auto snapshot() const -> Snapshot;
    auto wait() -> Outcome;
    auto wait_for(std::chrono::milliseconds timeout) -> std::optional<Outcome>;

    auto peer_id() const -> const PeerId& { return _peer_id; }

 private:
    struct Session
    {
        std::shared_ptr<PeerConnection> connection;
        utils::PeerAddress address;
        bool established = false;
        std::vector<std::uint8_t> pending_bitfield;
        std::vector<std::uint32_t> pending_haves;
        std::size_t strikes = 0;
    };

    struct SourceState
    {
        std::shared_ptr<DiscoverySource> source;
        std::size_t failures = 0;
        Clock::time_point next_poll;
        // Earliest time an early re-poll may happen
        Clock::time_point not_before;
        bool in_flight = false;
    };

    // Lifecycle
    void _begin();
    void _install_manifest(torrent::Manifest manifest);
    void _on_store_ready(
      tl::expected<std::unique_ptr<storage::PieceStore>, storage::StoreError> store,
      std::size_t rechecked
    );
    void _complete();
    void _fail(FailureReason reason, std::string message);
    void _on_cancel();
    void _terminate(Outcome outcome);

    // Discovery and peers
    void _tick();
    void _poll_discovery(Clock::time_point now);
    void _on_discovered(
      std::size_t index,
      tl::expected<PeerList, std::string> result
    );
    void _connect(const utils::PeerAddress& address);
    void _on_peer_event(PeerEvent event);
    void _on_established(Session& session, const peer_event::Established& event);
    void _on_closed(PeerKey key, const peer_event::Closed& event);
    void _close_sessions();

    // Pieces
    void _apply_pending(PeerKey key, Session& session);
    void _on_bitfield(PeerKey key, Session& session, std::vector<std::uint8_t> bits);
    void _on_have(PeerKey key, Session& session, std::uint32_t piece);
    void _on_block(PeerKey key, peer_event::Block& block);
    void _update_interest(PeerKey key, Session& session);
    void _fill_requests(PeerKey key);
    void _fill_all();
    void _verify(std::size_t piece);
    void _on_verified(
      std::size_t piece,
      tl::expected<storage::VerifyResult, storage::StoreError> result
    );
    void _on_corrupt(std::size_t piece);

    // Metadata
    void _on_extended_handshake(PeerKey key, const proto::ExtendedHandshake& handshake);
    void _on_metadata(PeerKey key, const proto::MetadataMsg& msg);
    void _request_metadata(PeerKey key);

    // Liveness and reporting
    void _arm_monitor();
    void _monitor();
    void _arm_tick();
    void _report_progress();
    void _publish();
    void _emit(EventStatus status, std::string message, nlohmann::json fields = nlohmann::json::object());
    void _warn(std::string message);

    auto _elapsed() const -> std::chrono::milliseconds;
    auto _bytes_retained() const -> std::uint64_t;
    auto _established_count() const -> std::size_t;

    const torrent::ContentDescriptor _descriptor;
    const std::filesystem::path _destination;
    const SwarmConfig _config;
    const std::shared_ptr<EventSink> _sink;
    const PeerId _peer_id;

    asio::io_context _io;
    asio::executor_work_guard<asio::io_context::executor_type> _work;
    asio::thread_pool _disk{1};
    asio::thread_pool _discovery{2};
    asio::steady_timer _monitor_timer;
    asio::steady_timer _tick_timer;
    std::thread _thread;
    std::stop_source _stop;

    // Owned by the I/O thread
    SwarmState _state = SwarmState::Resolving;
    bool _completing = false;
    Clock::time_point _start;
    Clock::time_point _last_progress;

    std::optional<torrent::Manifest> _manifest;
    std::unique_ptr<storage::PieceStore> _store;
    std::unique_ptr<PieceSelector> _selector;
    std::optional<MetadataAssembler> _metadata;
    PeerManager _peers;
    std::vector<SourceState> _sources;

    std::map<PeerKey, Session> _sessions;
    PeerKey _next_key = 0;
    bool _ever_established = false;

    std::uint64_t _bytes_downloaded = 0;
    // Sum of verified piece sizes, kept here so the store lock stays off this thread
    std::uint64_t _bytes_verified = 0;
    utils::RateMeter _rate;
    unsigned _last_percent = 0;
    bool _idle_warned = false;
    std::size_t _hard_warnings = 0;

    std::set<std::size_t> _verifying;
    std::map<std::size_t, std::size_t> _corrupt_counts;
    std::map<std::size_t, std::size_t> _storage_failures;

    // Shared with callers
    mutable std::mutex _mutex;
    std::condition_variable _done;
    Snapshot _snapshot;
    std::optional<Outcome> _outcome;
};

/**
 * @brief Reference to a running swarm
 *
 * Copies share the swarm. The last copy going away cancels a swarm that is
 * still running and waits for its threads.
 */
class SwarmHandle
{
 public:
    explicit SwarmHandle(std::shared_ptr<Swarm> swarm) : _swarm(std::move(swarm)) {}

    auto swarm() const -> Swarm& { return *_swarm; }

 private:
    std::shared_ptr<Swarm> _swarm;
};

/**
 * @brief Start transferring `descriptor` into `destination`
 *
 * Returns at once; the swarm runs on its own threads.
 */
auto start(
  torrent::ContentDescriptor descriptor,
  std::filesystem::path destination,
  SwarmConfig config = {},
  std::vector<std::shared_ptr<DiscoverySource>> sources = {},
  std::shared_ptr<EventSink> sink = nullptr
) -> SwarmHandle;

/**
 * @brief Request cooperative cancellation; returns without waiting
 */
void cancel(const SwarmHandle& handle);

auto snapshot(const SwarmHandle& handle) -> Snapshot;

/**
 * @brief Block until the swarm reaches a terminal state
 */
auto wait(const SwarmHandle& handle) -> Outcome;

}  // namespace swarmget::engine
