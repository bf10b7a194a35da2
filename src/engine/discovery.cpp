#include "engine/discovery.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "bencode/decoders.hpp"
#include "bencode/tools.hpp"
#include "misc/logger.hpp"
#include "misc/url.hpp"

namespace swarmget::engine {

namespace {

constexpr const std::size_t PEER_V4_SIZE = 6;
constexpr const std::size_t PEER_V6_SIZE = 18;

constexpr const std::string_view PEER_ID_PREFIX = "-SG0001-";

auto decode_ip_port_binary(std::span<const std::uint8_t> bytes)
  -> utils::PeerAddress
{
    const auto port = static_cast<std::uint16_t>(
      bytes[bytes.size() - 2] << 8 | bytes[bytes.size() - 1]
    );

    if (bytes.size() == PEER_V4_SIZE) {
        return {
          fmt::format("{}.{}.{}.{}", bytes[0], bytes[1], bytes[2], bytes[3]),
          port
        };
    }

    std::string ip;
    for (std::size_t i = 0; i < 16; i += 2) {
        if (not ip.empty()) {
            ip += ':';
        }
        ip += fmt::format("{:x}", bytes[i] << 8 | bytes[i + 1]);
    }

    return {ip, port};
}

auto decode_compact_peers(const std::vector<std::uint8_t>& peers, std::size_t chunk)
  -> tl::expected<std::vector<utils::PeerAddress>, std::string>
{
    if (peers.size() % chunk != 0) {
        return tl::make_unexpected(fmt::format(
          "Compact peer list must be divisible by {}. Got length: {}", chunk,
          peers.size()
        ));
    }

    // clang-format off
    return peers
      | ranges::views::chunk(chunk)
      | ranges::views::transform([](auto record) {
          std::vector<std::uint8_t> bytes(record.begin(), record.end());
          return decode_ip_port_binary(bytes);
      })
      | ranges::to<std::vector<utils::PeerAddress>>();
    // clang-format on
}

auto decode_dict_peers(const bencode::Json& peers)
  -> std::vector<utils::PeerAddress>
{
    std::vector<utils::PeerAddress> addresses;

    for (const auto& peer : peers) {
        if (not peer.is_object() or not peer.contains("ip") or
            not peer.contains("port")) {
            continue;
        }

        auto ip = bencode::as_string(peer["ip"]);
        auto port = bencode::as_integer(peer["port"]);

        if (ip and port and *port > 0 and *port <= 65535) {
            addresses.push_back({*ip, static_cast<std::uint16_t>(*port)});
        }
    }

    return addresses;
}

}  // namespace

HttpTrackerSource::HttpTrackerSource(
  std::string announce_url, PeerId peer_id, std::uint16_t port
) :
  _announce_url(std::move(announce_url)), _peer_id(peer_id), _port(port)
{
}

auto HttpTrackerSource::query_peers(
  const torrent::InfoHash& info_hash, std::stop_token stop
) -> tl::expected<PeerList, std::string>
{
    std::string url_str;

    try {
        curl::Url url;
        url.base(_announce_url)
          .query_bytes("info_hash", info_hash)
          .query_bytes("peer_id", _peer_id)
          .query("port", _port)
          .query("uploaded", 0)
          .query("downloaded", 0)
          .query("left", _left.load())
          .query("compact", 1);

        if (not _started) {
            url.query("event", "started");
        }

        url_str = url.to_string();
    } catch (const std::invalid_argument& e) {
        return tl::make_unexpected(std::string(e.what()));
    }

    utils::internal_logger()->debug("Announce: {}", url_str);

    auto response = curl::Curl().get(url_str, REQUEST_TIMEOUT, stop);

    if (response.code != CURLE_OK) {
        return tl::make_unexpected(fmt::format(
          "Request failed: {} ({})", magic_enum::enum_name(response.code),
          curl_easy_strerror(response.code)
        ));
    }

    if (response.http_status != 200) {
        return tl::make_unexpected(
          fmt::format("HTTP status {}", response.http_status)
        );
    }

    auto parsed = parse_announce_response(response.body);
    if (parsed) {
        _started = true;
    }

    return parsed;
}

auto parse_announce_response(std::span<const std::uint8_t> body)
  -> tl::expected<PeerList, std::string>
{
    const std::string_view text{
      reinterpret_cast<const char*>(body.data()), body.size()
    };

    auto decoded = bencode::decode_all(text);
    if (not decoded) {
        return tl::make_unexpected(fmt::format(
          "Bad response from tracker: {}", magic_enum::enum_name(decoded.error())
        ));
    }

    auto [_, response] = *decoded;
    if (not response.is_object()) {
        return tl::make_unexpected(std::string("Tracker response is not a dict"));
    }

    if (response.contains("failure reason")) {
        return tl::make_unexpected(fmt::format(
          "Tracker failure: {}",
          bencode::as_string(response["failure reason"]).value_or("unknown")
        ));
    }

    std::vector<utils::PeerAddress> addresses;

    if (response.contains("peers")) {
        const auto& peers = response["peers"];

        if (peers.is_array()) {
            addresses = decode_dict_peers(peers);
        }
        else if (auto bytes = bencode::as_bytes(peers)) {
            auto compact = decode_compact_peers(*bytes, PEER_V4_SIZE);
            if (not compact) {
                return tl::make_unexpected(compact.error());
            }
            addresses = std::move(*compact);
        }
    }

    if (response.contains("peers6")) {
        if (auto bytes = bencode::as_bytes(response["peers6"])) {
            auto compact = decode_compact_peers(*bytes, PEER_V6_SIZE);
            if (not compact) {
                return tl::make_unexpected(compact.error());
            }
            addresses.insert(addresses.end(), compact->begin(), compact->end());
        }
    }

    PeerList list{std::move(addresses)};

    const auto& dict = response;
    auto read_interval = [&dict](const char* key) -> std::optional<std::chrono::seconds> {
        if (not dict.contains(key)) {
            return std::nullopt;
        }
        auto value = bencode::as_integer(dict[key]);
        if (not value or *value <= 0) {
            return std::nullopt;
        }
        return std::chrono::seconds(*value);
    };

    list.interval = read_interval("interval");
    list.min_interval = read_interval("min interval");

    return list;
}

auto make_discovery_sources(
  const torrent::ContentDescriptor& descriptor,
  const std::vector<utils::PeerAddress>& extra_peers,
  const PeerId& peer_id,
  std::uint16_t port
) -> std::vector<std::shared_ptr<DiscoverySource>>
{
    std::vector<std::shared_ptr<DiscoverySource>> sources;

    auto hints = descriptor.peer_hints;
    hints.insert(hints.end(), extra_peers.begin(), extra_peers.end());

    if (not hints.empty()) {
        sources.push_back(std::make_shared<StaticPeerSource>(std::move(hints)));
    }

    for (const auto& tracker : descriptor.trackers) {
        if (tracker.starts_with("http://") or tracker.starts_with("https://")) {
            sources.push_back(
              std::make_shared<HttpTrackerSource>(tracker, peer_id, port)
            );
        }
        else {
            spdlog::info("Skipping unsupported tracker {}", tracker);
        }
    }

    if (descriptor.dht and sources.empty()) {
        spdlog::warn(
          "No usable trackers or peer hints and DHT lookup is not available"
        );
    }

    return sources;
}

auto generate_peer_id() -> PeerId
{
    static constexpr std::string_view ALPHABET =
      "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

    std::random_device device;
    std::mt19937 gen(device());
    std::uniform_int_distribution<std::size_t> pick(0, ALPHABET.size() - 1);

    PeerId id{};
    std::copy(PEER_ID_PREFIX.begin(), PEER_ID_PREFIX.end(), id.begin());

    for (std::size_t i = PEER_ID_PREFIX.size(); i < id.size(); i++) {
        id[i] = static_cast<std::uint8_t>(ALPHABET[pick(gen)]);
    }

    return id;
}

}  // namespace swarmget::engine
