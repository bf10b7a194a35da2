#include "engine/peer_manager.hpp"

#include <algorithm>

#include <magic_enum.hpp>

#include "misc/logger.hpp"

namespace swarmget::engine {

PeerManager::PeerManager(const SwarmConfig& config) :
  _min_peers(config.min_peers),
  _max_peers(std::max<std::size_t>(config.max_peers, 1)),
  _max_connecting(std::max<std::size_t>(config.max_connecting, 1)),
  _backoff_base(config.backoff_base),
  _backoff_cap(config.backoff_cap),
  _violation_penalty(config.violation_penalty)
{
}

auto PeerManager::admit_candidate(
  const utils::PeerAddress& address, TimePoint now
) -> Admission
{
    auto found = _entries.find(address);

    if (found != _entries.end()) {
        auto& entry = found->second;

        if (entry.status != Status::Backlog) {
            return Admission::Duplicate;
        }
        if (entry.retry_at > now) {
            return Admission::CoolingDown;
        }
        if (not _has_room()) {
            return Admission::Queued;
        }

        entry.status = Status::Connecting;
        _connecting++;
        return Admission::Connect;
    }

    if (_has_room()) {
        _entries[address] = Entry{Status::Connecting, 0, now};
        _connecting++;
        return Admission::Connect;
    }

    if (backlog_size() >= MAX_BACKLOG) {
        return Admission::Rejected;
    }

    _entries[address] = Entry{Status::Backlog, 0, now};
    return Admission::Queued;
}

void PeerManager::on_connected(const utils::PeerAddress& address)
{
    auto found = _entries.find(address);
    if (found == _entries.end() or found->second.status != Status::Connecting) {
        return;
    }

    found->second.status = Status::Active;
    _connecting--;
    _active++;
}

auto PeerManager::on_disconnect(
  const utils::PeerAddress& address, CloseReason reason, TimePoint now
) -> std::vector<utils::PeerAddress>
{
    auto found = _entries.find(address);
    if (found == _entries.end() or found->second.status == Status::Backlog) {
        return next_candidates(now);
    }

    auto& entry = found->second;
    _leave(entry);

    switch (reason) {
        case CloseReason::Clean:
            entry.failures = 0;
            entry.retry_at = now + _backoff_base;
            break;

        case CloseReason::Cancelled:
            entry.retry_at = now;
            break;

        case CloseReason::ProtocolViolation:
        case CloseReason::Banned:
            entry.failures++;
            entry.retry_at = now + _violation_penalty;
            break;

        default:
            entry.failures++;
            entry.retry_at = now + _backoff(entry.failures);
            break;
    }

    utils::internal_logger()->debug(
      "{} left ({}), {} failure(s)", address, magic_enum::enum_name(reason),
      entry.failures
    );

    return next_candidates(now);
}

auto PeerManager::next_candidates(TimePoint now)
  -> std::vector<utils::PeerAddress>
{
    std::vector<utils::PeerAddress> candidates;

    for (auto& [address, entry] : _entries) {
        if (not _has_room()) {
            break;
        }

        if (entry.status == Status::Backlog and entry.retry_at <= now) {
            entry.status = Status::Connecting;
            _connecting++;
            candidates.push_back(address);
        }
    }

    return candidates;
}

auto PeerManager::needs_peers() const -> bool
{
    return _active + _connecting < _min_peers;
}

auto PeerManager::backlog_size() const -> std::size_t
{
    return std::ranges::count_if(_entries, [](const auto& item) {
        return item.second.status == Status::Backlog;
    });
}

auto PeerManager::status(const utils::PeerAddress& address) const
  -> std::optional<Status>
{
    auto found = _entries.find(address);
    if (found == _entries.end()) {
        return std::nullopt;
    }
    return found->second.status;
}

auto PeerManager::retry_at(const utils::PeerAddress& address) const
  -> std::optional<TimePoint>
{
    auto found = _entries.find(address);
    if (found == _entries.end()) {
        return std::nullopt;
    }
    return found->second.retry_at;
}

auto PeerManager::failures(const utils::PeerAddress& address) const
  -> std::size_t
{
    auto found = _entries.find(address);
    return found == _entries.end() ? 0 : found->second.failures;
}

auto PeerManager::_backoff(std::size_t failures) const
  -> std::chrono::milliseconds
{
    auto delay = _backoff_base;

    for (std::size_t i = 1; i < failures and delay < _backoff_cap; i++) {
        delay *= 2;
    }

    return std::min(delay, _backoff_cap);
}

auto PeerManager::_has_room() const -> bool
{
    return _active + _connecting < _max_peers and
           _connecting < _max_connecting;
}

void PeerManager::_leave(Entry& entry)
{
    if (entry.status == Status::Connecting) {
        _connecting--;
    }
    else if (entry.status == Status::Active) {
        _active--;
    }

    entry.status = Status::Backlog;
}

}  // namespace swarmget::engine
