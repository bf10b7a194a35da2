#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "misc/address.hpp"
#include "misc/curl.hpp"
#include "torrent/descriptor.hpp"

namespace swarmget::engine {

struct PeerList
{
    std::vector<utils::PeerAddress> peers;
    // Tracker's "interval" and "min interval", when it sent them
    std::optional<std::chrono::seconds> interval;
    std::optional<std::chrono::seconds> min_interval;
};

/**
 * @brief Source of peer addresses for a content hash
 *
 * Called from a worker thread, possibly many times during a swarm's life.
 * Implementations should return promptly once `stop` is requested.
 */
class DiscoverySource
{
 public:
    virtual ~DiscoverySource() = default;

    virtual auto name() const -> std::string = 0;

    virtual auto query_peers(
      const torrent::InfoHash& info_hash, std::stop_token stop
    ) -> tl::expected<PeerList, std::string> = 0;

    /**
     * @brief Bytes still missing, reported by sources that announce it
     */
    virtual void set_left(std::uint64_t) {}
};

/**
 * @brief Fixed list of addresses (magnet "x.pe" hints, --peer options)
 */
class StaticPeerSource : public DiscoverySource
{
 public:
    explicit StaticPeerSource(std::vector<utils::PeerAddress> peers) :
      _peers(std::move(peers))
    {
    }

    auto name() const -> std::string override { return "static peers"; }

    auto query_peers(const torrent::InfoHash&, std::stop_token)
      -> tl::expected<PeerList, std::string> override
    {
        return PeerList{_peers};
    }

 private:
    std::vector<utils::PeerAddress> _peers;
};

/**
 * @brief HTTP(S) tracker announce
 *
 * The first announce accepted by the tracker carries event=started, later
 * ones are regular updates.
 */
class HttpTrackerSource : public DiscoverySource
{
 public:
    static constexpr auto REQUEST_TIMEOUT = std::chrono::seconds(15);

    HttpTrackerSource(std::string announce_url, PeerId peer_id, std::uint16_t port);

    auto name() const -> std::string override { return _announce_url; }

    auto query_peers(const torrent::InfoHash& info_hash, std::stop_token stop)
      -> tl::expected<PeerList, std::string> override;

    void set_left(std::uint64_t left) override { _left = left; }

 private:
    curl::InitContext _curl_context;

    const std::string _announce_url;
    const PeerId _peer_id;
    const std::uint16_t _port;
    std::atomic<std::uint64_t> _left{1};
    std::atomic<bool> _started{false};
};

/**
 * @brief Decode a tracker announce response body
 *
 * Understands compact ("peers" as 6-byte records, "peers6" as 18-byte
 * records) and dictionary peer lists. Non-positive intervals are ignored.
 */
auto parse_announce_response(std::span<const std::uint8_t> body)
  -> tl::expected<PeerList, std::string>;

/**
 * @brief Sources for a descriptor: static hints plus every HTTP tracker
 *
 * Trackers with other schemes are skipped with a log line.
 */
auto make_discovery_sources(
  const torrent::ContentDescriptor& descriptor,
  const std::vector<utils::PeerAddress>& extra_peers,
  const PeerId& peer_id,
  std::uint16_t port
) -> std::vector<std::shared_ptr<DiscoverySource>>;

/**
 * @brief "-SG0001-" followed by 12 random alphanumerics
 */
auto generate_peer_id() -> PeerId;

}  // namespace swarmget::engine
