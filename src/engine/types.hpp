#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "misc/address.hpp"
#include "proto/bitfield.hpp"

namespace swarmget::engine {

using Clock = std::chrono::steady_clock;

// Identifies one peer session for the lifetime of a swarm
using PeerKey = std::uint64_t;

using PeerId = std::array<std::uint8_t, 20>;

struct BlockRef
{
    std::uint32_t piece;
    std::uint32_t offset;
    std::uint32_t length;

    auto operator<=>(const BlockRef&) const = default;
};

enum class SwarmState
{
    Resolving,
    Discovering,
    Transferring,
    Completed,
    Failed,
    Cancelled,
};

inline auto is_terminal(SwarmState state) -> bool
{
    return state == SwarmState::Completed or state == SwarmState::Failed or
           state == SwarmState::Cancelled;
}

enum class FailureReason
{
    DiscoveryTimeout,
    MetadataUnavailable,
    ManifestCorrupt,
    StorageIOError,
    Timeout,
    InvalidDescriptor,
};

enum class CloseReason
{
    Clean,
    ConnectFailure,
    HandshakeFailure,
    ProtocolViolation,
    Timeout,
    IoError,
    Banned,
    Cancelled,
};

enum class RequestError
{
    PeerBusy,
    PeerChoking,
    NotEstablished,
};

struct FileReport
{
    std::filesystem::path path;
    std::uint64_t size;
};

struct Completed
{
    std::vector<FileReport> files;
    std::uint64_t total_bytes;
    std::chrono::milliseconds elapsed;
};

struct Failed
{
    FailureReason reason;
    std::string message;
    std::uint64_t bytes_retained;
};

struct Cancelled
{
    std::uint64_t bytes_retained;
};

using Outcome = std::variant<Completed, Failed, Cancelled>;

struct PeerSnapshot
{
    utils::PeerAddress address;
    bool choking = true;
    std::size_t outstanding = 0;
    // Payload bytes per second from this peer
    double download_rate = 0.0;

    auto operator==(const PeerSnapshot&) const -> bool = default;
};

/**
 * @brief Progress record published by the controller
 *
 * Snapshots are taken on state changes only, so reading one twice without
 * anything happening in between yields equal records.
 */
struct Snapshot
{
    SwarmState state = SwarmState::Resolving;
    std::uint64_t bytes_downloaded = 0;
    std::uint64_t bytes_verified = 0;
    std::uint64_t total_bytes = 0;
    std::size_t peer_count = 0;
    proto::Bitfield pieces;
    double download_rate = 0.0;
    // Established sessions only
    std::vector<PeerSnapshot> peers;

    auto operator==(const Snapshot&) const -> bool = default;
};

}  // namespace swarmget::engine
