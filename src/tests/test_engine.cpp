#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <map>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/progress.hpp"
#include "engine/discovery.hpp"
#include "engine/events.hpp"
#include "engine/metadata.hpp"
#include "engine/peer_manager.hpp"
#include "engine/piece_selector.hpp"
#include "misc/rate_meter.hpp"
#include "tests/helpers.hpp"
#include "tests/http_tracker.hpp"

using namespace swarmget;
using namespace swarmget::engine;
using namespace std::chrono_literals;

namespace {

auto body(const std::string& text) -> std::vector<std::uint8_t>
{
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

auto full_bitfield(std::size_t size) -> proto::Bitfield
{
    proto::Bitfield bits(size);
    for (std::size_t i = 0; i < size; i++) {
        bits.set(i);
    }
    return bits;
}

}  // namespace

void test_piece_selector()
{
    // Pieces of 16 bytes in blocks of 8: [8, 8] [8, 8] [3]
    const auto torrent =
      testing::make_torrent("x", testing::random_bytes(35, 51), 16);

    constexpr PeerKey A = 1;
    constexpr PeerKey B = 2;
    constexpr PeerKey C = 3;

    PieceSelector selector(torrent.manifest, 8, 3);

    selector.on_bitfield(A, full_bitfield(3));

    proto::Bitfield first_two(3);
    first_two.set(0);
    first_two.set(1);
    selector.on_bitfield(B, first_two);
    // Repeated announcements do not inflate availability
    selector.on_have(B, 1);

    assert(selector.availability(0) == 2);
    assert(selector.availability(1) == 2);
    assert(selector.availability(2) == 1);

    // Rarest first
    assert(selector.next_block(A) == (BlockRef{2, 0, 3}));
    // Ties go to the lowest index
    assert(selector.next_block(A) == (BlockRef{0, 0, 8}));
    assert(selector.next_block(A) == (BlockRef{0, 8, 8}));

    // Per-peer cap
    assert(selector.in_flight(A) == 3);
    assert(not selector.next_block(A).has_value());

    // Blocks owned by A are never handed to B
    assert(selector.next_block(B) == (BlockRef{1, 0, 8}));
    assert(selector.owner(BlockRef{0, 0, 8}) == A);
    assert(selector.owner(BlockRef{1, 0, 8}) == B);

    // Unknown peer without a bitfield gets nothing
    assert(not selector.next_block(C).has_value());

    {
        auto released = selector.remove_peer(A);
        assert(released.size() == 3);
        assert(selector.availability(0) == 1);
        assert(selector.availability(2) == 0);
        assert(selector.block_state(BlockRef{0, 0, 8}) == PieceSelector::BlockState::Missing);
        assert(not selector.owner(BlockRef{2, 0, 3}).has_value());
    }

    // Freed blocks are requestable again
    assert(selector.next_block(B) == (BlockRef{0, 0, 8}));
    assert(selector.next_block(B) == (BlockRef{0, 8, 8}));

    assert(selector.on_block(B, BlockRef{0, 0, 8}));
    // Duplicate and foreign deliveries are refused
    assert(not selector.on_block(B, BlockRef{0, 0, 8}));
    assert(not selector.on_block(A, BlockRef{0, 8, 8}));
    assert(not selector.on_block(B, BlockRef{0, 8, 4}));
    assert(not selector.is_piece_complete(0));

    assert(selector.on_block(B, BlockRef{0, 8, 8}));
    assert(selector.is_piece_complete(0));
    assert(selector.contributors(0) == std::set<PeerKey>{B});

    selector.mark_corrupt(0);
    assert(not selector.is_piece_complete(0));
    assert(selector.contributors(0).empty());
    assert(selector.block_state(BlockRef{0, 8, 8}) == PieceSelector::BlockState::Missing);

    // Choke gives a single block back
    selector.release(B, BlockRef{1, 0, 8});
    assert(selector.in_flight(B) == 0);
    assert(selector.block_state(BlockRef{1, 0, 8}) == PieceSelector::BlockState::Missing);

    selector.mark_verified(0);
    selector.mark_verified(1);
    assert(selector.verified().test(0));
    assert(not selector.all_verified());

    // Verified pieces are never picked again
    assert(not selector.is_interesting(B));
    assert(not selector.next_block(B).has_value());

    selector.on_have(B, 2);
    assert(selector.is_interesting(B));
    assert(selector.next_block(B) == (BlockRef{2, 0, 3}));

    {
        auto released = selector.release_all(B);
        assert(released.size() == 1);
        assert(selector.in_flight(B) == 0);
    }

    selector.mark_verified(2);
    assert(selector.all_verified());

    bool thrown = false;
    try {
        selector.on_bitfield(C, proto::Bitfield(4));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        selector.on_have(C, 3);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
}

void test_piece_selector_churn()
{
    // 8 pieces of 64 bytes in blocks of 16, the last one short
    const auto torrent =
      testing::make_torrent("x", testing::random_bytes(7 * 64 + 40, 52), 64);
    const auto& manifest = torrent.manifest;
    const auto piece_count = manifest.piece_count();

    constexpr std::size_t CAP = 3;
    PieceSelector selector(manifest, 16, CAP);

    std::mt19937 rng(2024);
    auto roll = [&rng](std::size_t bound) {
        return std::uniform_int_distribution<std::size_t>(0, bound - 1)(rng);
    };

    std::map<PeerKey, proto::Bitfield> peers;
    std::map<BlockRef, PeerKey> owners;

    auto check = [&] {
        std::map<PeerKey, std::size_t> counts;
        for (const auto& [block, peer] : owners) {
            assert(selector.owner(block) == peer);
            assert(selector.block_state(block) == PieceSelector::BlockState::InFlight);
            counts[peer]++;
        }

        for (PeerKey peer = 1; peer <= 6; peer++) {
            assert(selector.in_flight(peer) == counts[peer]);
            assert(selector.in_flight(peer) <= CAP);
        }

        for (std::size_t piece = 0; piece < piece_count; piece++) {
            const auto holders = std::ranges::count_if(peers, [piece](const auto& item) {
                return item.second.test(piece);
            });
            assert(selector.availability(piece) == static_cast<std::size_t>(holders));
        }
    };

    for (int step = 0; step < 5000 and not selector.all_verified(); step++) {
        const PeerKey peer = 1 + roll(6);

        switch (roll(5)) {
            case 0:
                if (not peers.contains(peer)) {
                    proto::Bitfield bits(piece_count);
                    for (std::size_t piece = 0; piece < piece_count; piece++) {
                        if (roll(3) != 0) {
                            bits.set(piece);
                        }
                    }
                    selector.on_bitfield(peer, bits);
                    peers.emplace(peer, bits);
                }
                break;

            case 1:
            case 2: {
                auto block = selector.next_block(peer);
                if (block) {
                    assert(peers.contains(peer));
                    assert(peers.at(peer).test(block->piece));
                    // Never handed out twice
                    assert(not owners.contains(*block));
                    owners.emplace(*block, peer);
                }
                break;
            }

            case 3: {
                if (owners.empty()) {
                    break;
                }

                auto delivered = std::next(owners.begin(), roll(owners.size()));
                const auto block = delivered->first;
                const auto owner = delivered->second;

                // Late delivery from someone else is refused
                if (owner != peer) {
                    assert(not selector.on_block(peer, block));
                }

                assert(selector.on_block(owner, block));
                owners.erase(delivered);

                if (selector.is_piece_complete(block.piece)) {
                    if (roll(4) == 0) {
                        selector.mark_corrupt(block.piece);
                    }
                    else {
                        selector.mark_verified(block.piece);
                    }
                }
                break;
            }

            case 4: {
                auto released = selector.remove_peer(peer);

                std::vector<BlockRef> expected;
                for (const auto& [block, owner] : owners) {
                    if (owner == peer) {
                        expected.push_back(block);
                    }
                }
                std::ranges::sort(released);
                assert(released == expected);

                std::erase_if(owners, [peer](const auto& item) {
                    return item.second == peer;
                });
                peers.erase(peer);

                for (const auto& block : released) {
                    assert(not selector.owner(block).has_value());
                }
                break;
            }
        }

        check();
    }
}

void test_peer_manager()
{
    SwarmConfig config;
    config.min_peers = 2;
    config.max_peers = 3;
    config.max_connecting = 2;
    config.backoff_base = 1s;
    config.backoff_cap = 4s;
    config.violation_penalty = 60s;

    const utils::PeerAddress a{"10.0.0.1", 6881};
    const utils::PeerAddress b{"10.0.0.2", 6881};
    const utils::PeerAddress c{"10.0.0.3", 6881};

    const PeerManager::TimePoint now{};

    {
        PeerManager manager(config);
        assert(manager.needs_peers());

        assert(manager.admit_candidate(a, now) == PeerManager::Admission::Connect);
        assert(manager.admit_candidate(b, now) == PeerManager::Admission::Connect);
        // Dial limit reached
        assert(manager.admit_candidate(c, now) == PeerManager::Admission::Queued);
        assert(manager.admit_candidate(a, now) == PeerManager::Admission::Duplicate);
        assert(manager.admit_candidate(c, now) == PeerManager::Admission::Queued);

        assert(manager.connecting_count() == 2);
        assert(manager.backlog_size() == 1);
        assert(not manager.needs_peers());

        manager.on_connected(a);
        assert(manager.active_count() == 1);
        assert(manager.connecting_count() == 1);
        assert(manager.status(a) == PeerManager::Status::Active);

        // A failed dial frees a slot for the backlog
        auto replacements = manager.on_disconnect(b, CloseReason::ConnectFailure, now);
        assert(replacements == std::vector{c});
        assert(manager.status(b) == PeerManager::Status::Backlog);
        assert(manager.status(c) == PeerManager::Status::Connecting);
        assert(manager.failures(b) == 1);
        assert(manager.retry_at(b) == now + 1s);

        assert(manager.admit_candidate(b, now) == PeerManager::Admission::CoolingDown);
        assert(manager.admit_candidate(b, now + 1s) == PeerManager::Admission::Connect);
        assert(not manager.status(utils::PeerAddress{"10.0.0.9", 1}).has_value());
    }

    {  // Exponential backoff up to the cap
        PeerManager manager(config);

        auto t = now;
        for (auto expected : {1s, 2s, 4s, 4s}) {
            assert(manager.admit_candidate(a, t) == PeerManager::Admission::Connect);
            manager.on_disconnect(a, CloseReason::HandshakeFailure, t);
            assert(*manager.retry_at(a) == t + expected);
            t = *manager.retry_at(a);
        }
        assert(manager.failures(a) == 4);

        // A clean session resets the count
        assert(manager.admit_candidate(a, t) == PeerManager::Admission::Connect);
        manager.on_connected(a);
        manager.on_disconnect(a, CloseReason::Clean, t);
        assert(manager.failures(a) == 0);
        assert(*manager.retry_at(a) == t + 1s);

        // Misbehaving peers sit out the long penalty
        t = *manager.retry_at(a);
        assert(manager.admit_candidate(a, t) == PeerManager::Admission::Connect);
        manager.on_connected(a);
        manager.on_disconnect(a, CloseReason::ProtocolViolation, t);
        assert(*manager.retry_at(a) == t + 60s);
        assert(manager.admit_candidate(a, t + 59s) == PeerManager::Admission::CoolingDown);

        assert(manager.active_count() == 0);
        assert(manager.connecting_count() == 0);
    }

    {  // Backlog is bounded
        config.max_peers = 1;
        config.max_connecting = 1;
        PeerManager manager(config);

        assert(manager.admit_candidate(a, now) == PeerManager::Admission::Connect);

        for (std::size_t i = 0; i < PeerManager::MAX_BACKLOG; i++) {
            const utils::PeerAddress address{"10.1.0.1", static_cast<std::uint16_t>(1000 + i)};
            assert(manager.admit_candidate(address, now) == PeerManager::Admission::Queued);
        }
        assert(manager.backlog_size() == PeerManager::MAX_BACKLOG);
        assert(manager.admit_candidate(b, now) == PeerManager::Admission::Rejected);

        // Only one replacement fits
        auto replacements = manager.on_disconnect(a, CloseReason::Timeout, now);
        assert(replacements.size() == 1);
    }
}

void test_metadata_assembler()
{
    // Large enough for two metadata pieces
    const auto torrent =
      testing::make_torrent("meta", testing::random_bytes(16000, 61), 16);
    const auto& info = torrent.info_bytes;
    const auto size = info.size();
    assert(size > proto::METADATA_PIECE_SIZE);
    assert(size < 2 * proto::METADATA_PIECE_SIZE);

    auto piece = [&](std::size_t index, const std::string& source) {
        const auto begin = index * proto::METADATA_PIECE_SIZE;
        const auto end = std::min(begin + proto::METADATA_PIECE_SIZE, source.size());
        return proto::MetadataMsg{
          proto::MetadataMsgType::Data, index, source.size(),
          std::vector<std::uint8_t>(source.begin() + begin, source.begin() + end)
        };
    };

    {
        MetadataAssembler assembler(torrent.info_hash, 3);

        // Nothing to ask for before the size is known
        assert(not assembler.next_request(1).has_value());

        assert(not assembler.on_size(9, 0));
        assert(assembler.on_size(1, size));
        assert(assembler.piece_count() == 2);
        // Contradicting size is refused
        assert(not assembler.on_size(2, size + 1));
        assert(not assembler.next_request(2).has_value());

        assert(assembler.on_size(3, size));
        assert(assembler.on_size(4, size));

        assert(assembler.next_request(1) == 0u);
        // One outstanding request per peer
        assert(not assembler.next_request(1).has_value());
        assert(assembler.next_request(3) == 1u);
        // Everything is taken, duplicate the first missing piece
        assert(assembler.next_request(4) == 0u);
        assembler.remove_peer(4);

        // Unsolicited data is ignored
        assert(assembler.on_data(5, piece(0, info)) == MetadataStatus::Pending);

        assert(assembler.on_data(3, piece(1, info)) == MetadataStatus::Pending);
        assert(not assembler.is_complete());
        assert(assembler.on_data(1, piece(0, info)) == MetadataStatus::Complete);

        assert(assembler.is_complete());
        assert(assembler.info_bytes() == info);
        assert(not assembler.next_request(3).has_value());
    }

    {  // Wrong bytes with the right sizes
        MetadataAssembler assembler(torrent.info_hash, 2);
        std::string bogus(size, 'x');

        assert(assembler.on_size(1, size));
        assert(assembler.on_size(2, size));

        for (auto expected : {MetadataStatus::Corrupt, MetadataStatus::Exhausted}) {
            assert(assembler.next_request(1) == 0u);
            assert(assembler.next_request(2) == 1u);
            assert(assembler.on_data(1, piece(0, bogus)) == MetadataStatus::Pending);
            assert(assembler.on_data(2, piece(1, bogus)) == expected);
        }

        assert(assembler.failures() == 2);
        assert(not assembler.is_complete());
    }

    {  // Rejects and malformed pieces take the peer out
        MetadataAssembler assembler(torrent.info_hash, 3);
        assert(assembler.on_size(1, size));
        assert(assembler.on_size(2, size));

        assert(assembler.next_request(1) == 0u);
        assembler.on_reject(1, 0);
        assert(not assembler.next_request(1).has_value());

        assert(assembler.next_request(2) == 0u);
        auto short_piece = piece(0, info);
        short_piece.data.resize(100);
        assert(assembler.on_data(2, short_piece) == MetadataStatus::Pending);
        assert(not assembler.next_request(2).has_value());

        // A reconnecting session starts fresh
        assembler.remove_peer(2);
        assert(assembler.next_request(2) == 0u);
    }
}

void test_announce_parsing()
{
    {
        const std::string response =
          std::string("d8:intervali1800e12:min intervali60e5:peers12:") +
          std::string("\x7f\x00\x00\x01\x1a\xe1", 6) +
          std::string("\x0a\x00\x00\x02\x00\x50", 6) + "e";

        auto list = parse_announce_response(body(response));
        assert(list.has_value());
        assert(list->interval == 1800s);
        assert(list->min_interval == 60s);

        const auto& peers = list->peers;
        assert(peers.size() == 2);
        assert(peers[0] == (utils::PeerAddress{"127.0.0.1", 6881}));
        assert(peers[1] == (utils::PeerAddress{"10.0.0.2", 80}));
    }

    {
        std::string v6(16, '\0');
        v6[15] = '\x01';

        const std::string response =
          "d5:peers0:6:peers618:" + v6 + std::string("\x1a\xe1", 2) + "e";

        auto list = parse_announce_response(body(response));
        assert(list.has_value());
        assert(not list->interval.has_value());
        assert(list->peers.size() == 1);
        assert(list->peers[0] == (utils::PeerAddress{"0:0:0:0:0:0:0:1", 6881}));
        assert(list->peers[0].to_string() == "[0:0:0:0:0:0:0:1]:6881");
    }

    {
        auto list = parse_announce_response(body(
          "d5:peersld2:ip9:127.0.0.14:porti6881eed2:ip3:bad4:porti0eeee"
        ));
        assert(list.has_value());
        assert(list->peers.size() == 1);
        assert(list->peers[0] == (utils::PeerAddress{"127.0.0.1", 6881}));
    }

    {
        auto list = parse_announce_response(body("d14:failure reason6:deniede"));
        assert(not list.has_value());
        assert(list.error().find("denied") != std::string::npos);
    }

    assert(not parse_announce_response(body("d5:peers5:abcdee")).has_value());
    assert(not parse_announce_response(body("i1e")).has_value());
    assert(not parse_announce_response(body("<html>")).has_value());

    {
        auto empty = parse_announce_response(body("d8:intervali60ee"));
        assert(empty.has_value());
        assert(empty->peers.empty());
        assert(empty->interval == 60s);
    }

    // Zero and negative intervals fall back to the configured schedule
    {
        auto list = parse_announce_response(body("d8:intervali0e12:min intervali-5ee"));
        assert(list.has_value());
        assert(not list->interval.has_value());
        assert(not list->min_interval.has_value());
    }
}

void test_discovery_sources()
{
    const auto peer_id = generate_peer_id();
    const std::string prefix(peer_id.begin(), peer_id.begin() + 8);
    assert(prefix == "-SG0001-");

    for (std::size_t i = 8; i < peer_id.size(); i++) {
        assert(std::isalnum(static_cast<unsigned char>(peer_id[i])));
    }

    torrent::ContentDescriptor descriptor;
    descriptor.peer_hints = {{"127.0.0.1", 6881}};
    descriptor.trackers = {"http://tracker/announce", "udp://tracker:80"};

    auto sources = make_discovery_sources(
      descriptor, {{"127.0.0.2", 6882}}, peer_id, 6881
    );
    assert(sources.size() == 2);
    assert(sources[0]->name() == "static peers");
    assert(sources[1]->name() == "http://tracker/announce");

    auto list = sources[0]->query_peers(descriptor.info_hash, {});
    assert(list.has_value());
    assert(list->peers.size() == 2);
    assert(list->peers[1] == (utils::PeerAddress{"127.0.0.2", 6882}));
    assert(not list->interval.has_value());

    descriptor.peer_hints.clear();
    descriptor.trackers = {"udp://tracker:80"};
    assert(make_discovery_sources(descriptor, {}, peer_id, 6881).empty());
}

void test_http_tracker_announce()
{
    torrent::InfoHash info_hash{};
    info_hash.fill(0x11);

    {
        testing::HttpTracker tracker(
          std::string("d8:intervali900e12:min intervali30e5:peers6:") +
          std::string("\x7f\x00\x00\x01\x1a\xe1", 6) + "e"
        );

        HttpTrackerSource source(tracker.announce_url(), generate_peer_id(), 6881);
        source.set_left(1000);

        auto first = source.query_peers(info_hash, {});
        assert(first.has_value());
        assert(first->peers.size() == 1);
        assert(first->peers[0] == (utils::PeerAddress{"127.0.0.1", 6881}));
        assert(first->interval == 900s);
        assert(first->min_interval == 30s);

        auto second = source.query_peers(info_hash, {});
        assert(second.has_value());

        // Only the first announce starts the session
        const auto requests = tracker.requests();
        assert(requests.size() == 2);
        assert(requests[0].find("event=started") != std::string::npos);
        assert(requests[1].find("event=") == std::string::npos);

        for (const auto& request : requests) {
            assert(request.starts_with("/announce?"));
            assert(request.find("left=1000") != std::string::npos);
            assert(request.find("compact=1") != std::string::npos);
        }
    }

    // A refused announce is not a start, the next one tries again
    {
        testing::HttpTracker tracker("d14:failure reason6:deniede");
        HttpTrackerSource source(tracker.announce_url(), generate_peer_id(), 6881);

        assert(not source.query_peers(info_hash, {}).has_value());
        assert(not source.query_peers(info_hash, {}).has_value());

        const auto requests = tracker.requests();
        assert(requests.size() == 2);
        assert(requests[1].find("event=started") != std::string::npos);
    }
}

void test_events()
{
    {
        SwarmEvent event{EventStatus::Downloading, "Downloading", 1500ms, {{"progress", 50}}};
        assert(event.status_tag() == "downloading");

        auto json = event.to_json();
        assert(json["status"] == "downloading");
        assert(json["message"] == "Downloading");
        assert(json["timestamp"] == 1500);
        assert(json["progress"] == 50);
        assert(not json.contains("error"));
    }

    {
        SwarmEvent event{EventStatus::Error, "No peers found", 10ms};
        auto json = event.to_json();
        assert(json["status"] == "error");
        assert(json["error"] == "No peers found");
    }

    {
        std::ostringstream out;
        JsonLinesEventSink sink(out);

        sink.on_event(SwarmEvent{EventStatus::Init, "Starting", 0ms, {{"outputDir", "/tmp"}}});
        sink.on_event(SwarmEvent{EventStatus::Complete, "Done", 20ms});

        std::istringstream lines(out.str());
        std::string line;

        std::getline(lines, line);
        auto first = nlohmann::json::parse(line);
        assert(first["status"] == "init");
        assert(first["outputDir"] == "/tmp");

        std::getline(lines, line);
        assert(nlohmann::json::parse(line)["status"] == "complete");

        assert(not std::getline(lines, line));
    }

    assert(progress_percent(0, 0) == 0);
    assert(progress_percent(1, 3) == 33);
    assert(progress_percent(2, 3) == 67);
    assert(progress_percent(5, 4) == 100);
}

void test_rate_meter()
{
    using Clock = utils::RateMeter::Clock;

    utils::RateMeter meter(1s);
    const Clock::time_point t0{};

    assert(meter.rate(t0) == 0.0);

    meter.add(1000, t0);
    meter.add(1000, t0 + 500ms);
    assert(meter.rate(t0 + 500ms) == 2000.0);

    // First sample left the window
    assert(meter.rate(t0 + 1400ms) == 1000.0);
    assert(meter.rate(t0 + 3s) == 0.0);
}

void test_formatting()
{
    using client::format_bytes;
    using client::format_time;

    assert(format_bytes(0) == "0 B");
    assert(format_bytes(512) == "512.00 B");
    assert(format_bytes(1536) == "1.50 KB");
    assert(format_bytes(1024 * 1024) == "1.00 MB");
    assert(format_bytes(3ull * 1024 * 1024 * 1024) == "3.00 GB");

    assert(format_time(0) == "Unknown");
    assert(format_time(-5) == "Unknown");
    assert(format_time(5000) == "5s");
    assert(format_time(61000) == "1m 1s");
    assert(format_time(3723000) == "1h 2m 3s");
}
