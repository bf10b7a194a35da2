#include "engine/swarm.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "misc/logger.hpp"

namespace swarmget::engine {

namespace {

template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto seconds(std::chrono::milliseconds duration) -> long long
{
    return std::chrono::duration_cast<std::chrono::seconds>(duration).count();
}

}  // namespace

Swarm::Swarm(
  torrent::ContentDescriptor descriptor,
  std::filesystem::path destination,
  SwarmConfig config,
  std::vector<std::shared_ptr<DiscoverySource>> sources,
  std::shared_ptr<EventSink> sink
) :
  _descriptor(std::move(descriptor)),
  _destination(std::move(destination)),
  _config(std::move(config)),
  _sink(std::move(sink)),
  _peer_id(_config.peer_id.value_or(generate_peer_id())),
  _work(asio::make_work_guard(_io)),
  _monitor_timer(_io),
  _tick_timer(_io),
  _peers(_config)
{
    for (auto& source : sources) {
        _sources.push_back(SourceState{std::move(source)});
    }
}

Swarm::~Swarm()
{
    cancel();

    if (_thread.joinable()) {
        _thread.join();
    }

    _disk.join();
    _discovery.join();
}

void Swarm::run()
{
    if (_thread.joinable()) {
        throw std::runtime_error("Swarm is already running");
    }

    _start = Clock::now();
    _last_progress = _start;

    asio::post(_io, [this] { _begin(); });

    _thread = std::thread([this] {
        try {
            _io.run();
        } catch (const std::exception& e) {
            spdlog::critical("Swarm loop crashed: {}", e.what());

            std::scoped_lock lock(_mutex);
            if (not _outcome) {
                _outcome = Failed{FailureReason::StorageIOError, e.what(), 0};
                _snapshot.state = SwarmState::Failed;
            }
            _done.notify_all();
        }
    });
}

void Swarm::cancel()
{
    _stop.request_stop();
    asio::post(_io, [this] { _on_cancel(); });
}

auto Swarm::snapshot() const -> Snapshot
{
    std::scoped_lock lock(_mutex);
    return _snapshot;
}

auto Swarm::wait() -> Outcome
{
    std::unique_lock lock(_mutex);
    _done.wait(lock, [this] { return _outcome.has_value(); });
    return *_outcome;
}

auto Swarm::wait_for(std::chrono::milliseconds timeout) -> std::optional<Outcome>
{
    std::unique_lock lock(_mutex);
    if (not _done.wait_for(lock, timeout, [this] { return _outcome.has_value(); })) {
        return std::nullopt;
    }
    return _outcome;
}

//
// Lifecycle
//

void Swarm::_begin()
{
    _emit(
      EventStatus::Init, "Initializing download",
      {{"outputDir", _destination.string()},
       {"timeoutSecs", seconds(_config.hard_timeout)},
       {"infoHash", _descriptor.info_hash_hex()}}
    );

    _arm_monitor();
    _arm_tick();

    if (_descriptor.manifest) {
        _install_manifest(*_descriptor.manifest);
    }
    else {
        _metadata.emplace(_descriptor.info_hash, _config.metadata_retry_limit);
        spdlog::info("Fetching metadata for {}", _descriptor.name());
    }

    _poll_discovery(Clock::now());
    _publish();
}

void Swarm::_install_manifest(torrent::Manifest manifest)
{
    _manifest = std::move(manifest);
    _metadata.reset();

    for (auto& source : _sources) {
        source.source->set_left(_manifest->total_length);
    }

    asio::post(_disk, [this] {
        auto store = storage::PieceStore::open(
          _destination, *_manifest, _config.block_size
        );

        std::size_t rechecked = 0;

        if (store and _config.recheck_existing) {
            auto found = (*store)->recheck(_stop.get_token());
            if (found) {
                rechecked = *found;
            }
            else if (found.error() != storage::StoreError::CANCELLED) {
                spdlog::warn(
                  "Recheck of existing files failed: {}",
                  magic_enum::enum_name(found.error())
                );
            }
        }

        asio::post(_io, [this, store = std::move(store), rechecked]() mutable {
            _on_store_ready(std::move(store), rechecked);
        });
    });
}

void Swarm::_on_store_ready(
  tl::expected<std::unique_ptr<storage::PieceStore>, storage::StoreError> store,
  std::size_t rechecked
)
{
    if (is_terminal(_state) or _completing) {
        return;
    }

    if (not store) {
        _fail(
          FailureReason::StorageIOError,
          fmt::format(
            "Can not prepare files under {}: {}", _destination.string(),
            magic_enum::enum_name(store.error())
          )
        );
        return;
    }

    _store = std::move(*store);
    _selector = std::make_unique<PieceSelector>(
      *_manifest, _config.block_size, _config.max_requests_per_peer
    );

    const auto verified = _store->verified();
    for (std::size_t piece = 0; piece < verified.size(); piece++) {
        if (verified.test(piece)) {
            _selector->mark_verified(piece);
        }
    }
    _bytes_verified = _store->verified_bytes();

    if (rechecked > 0) {
        spdlog::info(
          "{} of {} pieces already on disk", rechecked, _manifest->piece_count()
        );
    }

    _state = SwarmState::Discovering;
    _last_progress = Clock::now();
    _last_percent =
      progress_percent(_bytes_verified, _manifest->total_length);

    _emit(
      EventStatus::Found, "Torrent found",
      {{"name", _manifest->name},
       {"size", _manifest->total_length},
       {"files", _manifest->files.size()},
       {"pieces", _manifest->piece_count()},
       {"peers", _established_count()}}
    );

    for (auto& source : _sources) {
        source.source->set_left(
          _manifest->total_length - _bytes_verified
        );
    }

    if (_selector->all_verified()) {
        _publish();
        _complete();
        return;
    }

    for (auto& [key, session] : _sessions) {
        if (session.established) {
            _apply_pending(key, session);
        }
    }

    _publish();
}

void Swarm::_complete()
{
    if (is_terminal(_state) or _completing) {
        return;
    }

    _completing = true;
    _close_sessions();

    // Every verify job was queued before this flush on the single disk thread
    asio::post(_disk, [this] {
        auto flushed = _store->flush();

        asio::post(_io, [this, flushed] {
            if (not flushed) {
                _completing = false;
                _fail(
                  FailureReason::StorageIOError,
                  "Can not flush downloaded files to disk"
                );
                return;
            }

            std::vector<FileReport> files;
            for (const auto& file : _manifest->files) {
                files.push_back(FileReport{file.path, file.length});
            }

            _terminate(Completed{
              std::move(files), _manifest->total_length, _elapsed()
            });
        });
    });
}

void Swarm::_fail(FailureReason reason, std::string message)
{
    if (is_terminal(_state) or _completing) {
        return;
    }

    spdlog::error("{}: {}", magic_enum::enum_name(reason), message);
    _terminate(Failed{reason, std::move(message), _bytes_retained()});
}

void Swarm::_on_cancel()
{
    if (is_terminal(_state) or _completing) {
        return;
    }

    spdlog::info("Cancelling download");
    _terminate(Cancelled{_bytes_retained()});
}

void Swarm::_terminate(Outcome outcome)
{
    if (is_terminal(_state)) {
        return;
    }

    _stop.request_stop();
    _close_sessions();
    _monitor_timer.cancel();
    _tick_timer.cancel();

    std::visit(
      overloaded{
        [this](const Completed& completed) {
            _state = SwarmState::Completed;

            auto files = nlohmann::json::array();
            for (std::size_t i = 0; i < completed.files.size(); i++) {
                const auto& file = completed.files[i];
                files.push_back({
                  {"index", i},
                  {"name", file.path.filename().string()},
                  {"path", file.path.string()},
                  {"size", file.size},
                });
            }

            _emit(
              EventStatus::Complete, "Download complete",
              {{"elapsed", seconds(completed.elapsed)},
               {"files", files},
               {"totalSize", completed.total_bytes},
               {"location", _destination.string()}}
            );
        },
        [this](const Failed& failed) {
            _state = SwarmState::Failed;

            // Verified pieces are already on disk, make them durable
            if (_store) {
                asio::post(_disk, [this] {
                    if (not _store->flush()) {
                        spdlog::error("Flush after failure did not succeed");
                    }
                });
            }

            _emit(
              EventStatus::Error, failed.message,
              {{"reason", std::string(magic_enum::enum_name(failed.reason))},
               {"error", failed.message},
               {"bytesRetained", failed.bytes_retained}}
            );
        },
        [this](const Cancelled& cancelled) {
            _state = SwarmState::Cancelled;

            if (_store) {
                asio::post(_disk, [this] {
                    if (not _store->flush()) {
                        spdlog::error("Flush after cancel did not succeed");
                    }
                });
            }

            _emit(
              EventStatus::Cancelled, "Download cancelled",
              {{"bytesRetained", cancelled.bytes_retained}}
            );
        },
      },
      outcome
    );

    _publish();

    {
        std::scoped_lock lock(_mutex);
        _outcome = std::move(outcome);
    }
    _done.notify_all();

    _work.reset();
}

//
// Discovery and peers
//

void Swarm::_tick()
{
    if (is_terminal(_state)) {
        return;
    }

    const auto now = Clock::now();

    _poll_discovery(now);

    for (const auto& address : _peers.next_candidates(now)) {
        _connect(address);
    }

    _arm_tick();
}

void Swarm::_poll_discovery(Clock::time_point now)
{
    for (std::size_t i = 0; i < _sources.size(); i++) {
        auto& state = _sources[i];

        // Ask again soon while the peer set is below its floor
        if (_peers.needs_peers() and state.failures == 0) {
            state.next_poll = std::min(
              state.next_poll, std::max(now + _config.backoff_base, state.not_before)
            );
        }

        if (state.in_flight or state.next_poll > now) {
            continue;
        }

        state.in_flight = true;

        asio::post(
          _discovery,
          [this, i, source = state.source, stop = _stop.get_token()] {
              if (stop.stop_requested()) {
                  return;
              }

              auto result = source->query_peers(_descriptor.info_hash, stop);

              asio::post(_io, [this, i, result = std::move(result)]() mutable {
                  _on_discovered(i, std::move(result));
              });
          }
        );
    }
}

void Swarm::_on_discovered(
  std::size_t index,
  tl::expected<PeerList, std::string> result
)
{
    auto& state = _sources[index];
    state.in_flight = false;

    if (is_terminal(_state)) {
        return;
    }

    const auto now = Clock::now();

    if (not result) {
        state.failures++;

        auto delay = _config.backoff_base;
        for (std::size_t i = 1; i < state.failures and delay < _config.discovery_backoff_cap; i++) {
            delay *= 2;
        }
        delay = std::min(delay, _config.discovery_backoff_cap);

        state.next_poll = now + delay;

        spdlog::warn(
          "Discovery via {} failed: {} (retry in {}s)", state.source->name(),
          result.error(), seconds(delay)
        );
        return;
    }

    state.failures = 0;
    // The tracker's own schedule wins over the configured one
    const Clock::duration interval = result->interval
      ? Clock::duration(*result->interval)
      : Clock::duration(_config.discovery_interval);
    state.next_poll = now + interval;
    state.not_before = now;
    if (result->min_interval) {
        state.not_before += *result->min_interval;
    }

    utils::internal_logger()->debug(
      "{} returned {} peer(s)", state.source->name(), result->peers.size()
    );

    for (const auto& address : result->peers) {
        if (_peers.admit_candidate(address, now) == PeerManager::Admission::Connect) {
            _connect(address);
        }
    }
}

void Swarm::_connect(const utils::PeerAddress& address)
{
    const auto key = ++_next_key;

    auto connection = PeerConnection::create(
      _io, key, address,
      PeerConnection::Options{
        .info_hash = _descriptor.info_hash,
        .local_peer_id = _peer_id,
        .max_requests = _config.max_requests_per_peer,
        .handshake_timeout = _config.handshake_timeout,
        .request_timeout = _config.request_timeout,
        .keepalive_interval = _config.keepalive_interval,
        .inactivity_timeout = _config.peer_inactivity_timeout,
      },
      [this](PeerEvent event) { _on_peer_event(std::move(event)); }
    );

    _sessions[key] = Session{connection, address};

    utils::internal_logger()->debug("Connecting to {}", address);
    connection->start();
}

void Swarm::_on_peer_event(PeerEvent event)
{
    auto found = _sessions.find(event.key);
    if (found == _sessions.end()) {
        return;
    }

    const auto key = event.key;
    auto& session = found->second;

    std::visit(
      overloaded{
        [&](peer_event::Established& established) {
            _on_established(session, established);
        },
        [&](peer_event::Choked&) {
            if (_selector) {
                _selector->release_all(key);
                _fill_all();
            }
        },
        [&](peer_event::Unchoked&) { _fill_requests(key); },
        [&](peer_event::Have& have) { _on_have(key, session, have.piece); },
        [&](peer_event::Bitfield& bitfield) {
            _on_bitfield(key, session, std::move(bitfield.bits));
        },
        [&](peer_event::Block& block) { _on_block(key, block); },
        [&](peer_event::ExtendedHandshake& extended) {
            _on_extended_handshake(key, extended.handshake);
        },
        [&](peer_event::Metadata& metadata) { _on_metadata(key, metadata.msg); },
        [&](peer_event::Closed& closed) { _on_closed(key, closed); },
      },
      event.event
    );
}

void Swarm::_on_established(Session& session, const peer_event::Established&)
{
    if (is_terminal(_state) or _completing) {
        session.connection->close(CloseReason::Cancelled);
        return;
    }

    session.established = true;
    _peers.on_connected(session.address);

    if (not _ever_established) {
        _ever_established = true;
        _last_progress = Clock::now();
    }

    spdlog::info("Connected to peer {}", session.address);
    _publish();
}

void Swarm::_on_closed(PeerKey key, const peer_event::Closed& event)
{
    auto found = _sessions.find(key);
    if (found == _sessions.end()) {
        return;
    }

    const auto address = found->second.address;
    const bool was_established = found->second.established;
    _sessions.erase(found);

    if (_selector) {
        _selector->remove_peer(key);
    }
    if (_metadata) {
        _metadata->remove_peer(key);
    }

    if (is_terminal(_state) or _completing) {
        return;
    }

    if (was_established) {
        spdlog::info(
          "Peer {} disconnected ({}{}{})", address,
          magic_enum::enum_name(event.reason), event.message.empty() ? "" : ": ",
          event.message
        );
    }

    for (const auto& replacement :
         _peers.on_disconnect(address, event.reason, Clock::now())) {
        _connect(replacement);
    }

    _fill_all();
    _publish();
}

void Swarm::_close_sessions()
{
    // Closed events arrive later and find no session
    auto sessions = std::exchange(_sessions, {});

    for (auto& [key, session] : sessions) {
        session.connection->close(CloseReason::Cancelled);
    }
}

//
// Pieces
//

void Swarm::_apply_pending(PeerKey key, Session& session)
{
    if (not session.pending_bitfield.empty()) {
        _on_bitfield(key, session, std::exchange(session.pending_bitfield, {}));
    }

    for (auto piece : std::exchange(session.pending_haves, {})) {
        _on_have(key, session, piece);
    }
}

void Swarm::_on_bitfield(
  PeerKey key, Session& session, std::vector<std::uint8_t> bits
)
{
    if (not _selector) {
        session.pending_bitfield = std::move(bits);
        return;
    }

    auto bitfield = proto::Bitfield::from_bytes(bits, _manifest->piece_count());
    if (not bitfield) {
        session.connection->close(CloseReason::ProtocolViolation, "Bad bitfield");
        return;
    }

    _selector->on_bitfield(key, *bitfield);
    _update_interest(key, session);
    _fill_requests(key);
}

void Swarm::_on_have(PeerKey key, Session& session, std::uint32_t piece)
{
    if (not _selector) {
        session.pending_haves.push_back(piece);
        return;
    }

    if (piece >= _manifest->piece_count()) {
        session.connection->close(
          CloseReason::ProtocolViolation, fmt::format("Have for piece {}", piece)
        );
        return;
    }

    _selector->on_have(key, piece);
    _update_interest(key, session);
    _fill_requests(key);
}

void Swarm::_on_block(PeerKey key, peer_event::Block& event)
{
    if (not _selector or is_terminal(_state) or _completing) {
        return;
    }

    const auto& block = event.block;

    if (not _selector->on_block(key, block)) {
        utils::internal_logger()->debug(
          "Dropping block {}:{} from peer {}", block.piece, block.offset, key
        );
        _fill_requests(key);
        return;
    }

    const auto now = Clock::now();
    _bytes_downloaded += block.length;
    _rate.add(block.length, now);
    _last_progress = now;
    _idle_warned = false;

    auto written = _store->write_block(block.piece, block.offset, event.data);
    if (not written) {
        spdlog::error(
          "Can not buffer block {}:{}: {}", block.piece, block.offset,
          magic_enum::enum_name(written.error())
        );
        _selector->mark_corrupt(block.piece);
        _store->discard(block.piece);
    }
    else if (_selector->is_piece_complete(block.piece)) {
        _verify(block.piece);
    }

    _fill_requests(key);
    _publish();
}

void Swarm::_update_interest(PeerKey key, Session& session)
{
    session.connection->set_interested(_selector->is_interesting(key));
}

void Swarm::_fill_requests(PeerKey key)
{
    if (not _selector or is_terminal(_state) or _completing) {
        return;
    }

    auto found = _sessions.find(key);
    if (found == _sessions.end() or not found->second.established) {
        return;
    }

    auto& connection = *found->second.connection;

    while (true) {
        auto block = _selector->next_block(key);
        if (not block) {
            break;
        }

        auto requested = connection.request_block(*block);
        if (not requested) {
            _selector->release(key, *block);
            break;
        }

        if (_state == SwarmState::Discovering) {
            _state = SwarmState::Transferring;
            _publish();
        }
    }
}

void Swarm::_fill_all()
{
    for (auto& [key, session] : _sessions) {
        _fill_requests(key);
    }
}

void Swarm::_verify(std::size_t piece)
{
    if (_verifying.contains(piece)) {
        return;
    }

    _verifying.insert(piece);

    asio::post(_disk, [this, piece] {
        auto result = _store->verify_piece(piece);
        asio::post(_io, [this, piece, result] { _on_verified(piece, result); });
    });
}

void Swarm::_on_verified(
  std::size_t piece,
  tl::expected<storage::VerifyResult, storage::StoreError> result
)
{
    _verifying.erase(piece);

    if (is_terminal(_state) or _completing) {
        return;
    }

    if (not result) {
        if (result.error() != storage::StoreError::STORAGE_IO_ERROR) {
            spdlog::error(
              "Piece {} can not be verified: {}", piece,
              magic_enum::enum_name(result.error())
            );
            _store->discard(piece);
            _selector->mark_corrupt(piece);
            _fill_all();
            return;
        }

        const auto failures = ++_storage_failures[piece];
        if (failures >= _config.storage_retry_limit) {
            _fail(
              FailureReason::StorageIOError,
              fmt::format("Writing piece {} failed {} times", piece, failures)
            );
            return;
        }

        spdlog::warn("Writing piece {} failed, retrying", piece);
        _verify(piece);
        return;
    }

    if (*result == storage::VerifyResult::Corrupt) {
        _on_corrupt(piece);
        return;
    }

    _selector->mark_verified(piece);
    _bytes_verified += _manifest->piece_size(piece);
    _storage_failures.erase(piece);

    utils::internal_logger()->debug("Piece {} verified", piece);

    for (auto& [key, session] : _sessions) {
        if (session.established) {
            _update_interest(key, session);
        }
    }

    for (auto& source : _sources) {
        source.source->set_left(
          _manifest->total_length - _bytes_verified
        );
    }

    _report_progress();
    _publish();

    if (_selector->all_verified()) {
        _complete();
    }
}

void Swarm::_on_corrupt(std::size_t piece)
{
    const auto contributors = _selector->contributors(piece);
    _selector->mark_corrupt(piece);

    const auto failures = ++_corrupt_counts[piece];

    spdlog::warn(
      "Piece {} failed verification ({} time(s)), downloading it again", piece,
      failures
    );

    for (auto key : contributors) {
        auto found = _sessions.find(key);
        if (found == _sessions.end()) {
            continue;
        }

        auto& session = found->second;
        if (++session.strikes >= _config.corrupt_strikes_before_ban) {
            spdlog::warn("Banning peer {} for sending corrupt data", session.address);
            session.connection->close(CloseReason::Banned, "Corrupt data");
        }
    }

    if (failures == _config.corrupt_warning_threshold) {
        _warn(fmt::format(
          "Piece {} failed verification {} times, the torrent metadata may "
          "be bad",
          piece, failures
        ));
    }

    _fill_all();
}

//
// Metadata
//

void Swarm::_on_extended_handshake(
  PeerKey key, const proto::ExtendedHandshake& handshake
)
{
    if (not _metadata or not handshake.metadata_size) {
        return;
    }

    if (_metadata->on_size(key, *handshake.metadata_size)) {
        _request_metadata(key);
    }
}

void Swarm::_on_metadata(PeerKey key, const proto::MetadataMsg& msg)
{
    if (not _metadata) {
        return;
    }

    if (msg.type == proto::MetadataMsgType::Reject) {
        utils::internal_logger()->debug(
          "Peer {} rejected metadata piece {}", key, msg.piece
        );
        _metadata->on_reject(key, msg.piece);
        return;
    }

    switch (_metadata->on_data(key, msg)) {
        case MetadataStatus::Pending:
            _request_metadata(key);
            break;

        case MetadataStatus::Corrupt:
            _warn("Received metadata does not match the info hash, retrying");
            for (auto& [other, session] : _sessions) {
                _request_metadata(other);
            }
            break;

        case MetadataStatus::Exhausted:
            _fail(
              FailureReason::ManifestCorrupt,
              fmt::format(
                "Metadata did not match the info hash {} times",
                _metadata->failures()
              )
            );
            break;

        case MetadataStatus::Complete: {
            auto manifest = torrent::Manifest::from_info_bytes(_metadata->info_bytes());
            if (not manifest) {
                _fail(
                  FailureReason::ManifestCorrupt,
                  fmt::format(
                    "Metadata is not a valid info dictionary: {}",
                    magic_enum::enum_name(manifest.error())
                  )
                );
                return;
            }

            spdlog::info("Metadata received: {}", manifest->name);
            _install_manifest(std::move(*manifest));
            break;
        }
    }
}

void Swarm::_request_metadata(PeerKey key)
{
    if (not _metadata) {
        return;
    }

    auto found = _sessions.find(key);
    if (found == _sessions.end() or not found->second.established or
        not found->second.connection->supports_metadata()) {
        return;
    }

    auto piece = _metadata->next_request(key);
    if (piece and not found->second.connection->request_metadata(*piece)) {
        _metadata->remove_peer(key);
    }
}

//
// Liveness and reporting
//

void Swarm::_arm_monitor()
{
    _monitor_timer.expires_after(_config.monitor_interval);
    _monitor_timer.async_wait([this](const asio::error_code& error) {
        if (not error) {
            _monitor();
        }
    });
}

void Swarm::_arm_tick()
{
    _tick_timer.expires_after(TICK_INTERVAL);
    _tick_timer.async_wait([this](const asio::error_code& error) {
        if (not error) {
            _tick();
        }
    });
}

void Swarm::_monitor()
{
    if (is_terminal(_state) or _completing) {
        return;
    }

    const auto now = Clock::now();
    const auto elapsed = _elapsed();

    if (not _ever_established and elapsed >= _config.connect_timeout) {
        _fail(
          FailureReason::DiscoveryTimeout,
          fmt::format(
            "Could not find/connect to peers within {}s",
            seconds(_config.connect_timeout)
          )
        );
        return;
    }

    if (not _manifest and elapsed >= _config.connect_timeout) {
        _fail(
          FailureReason::MetadataUnavailable,
          fmt::format(
            "No peer supplied the metadata within {}s",
            seconds(_config.connect_timeout)
          )
        );
        return;
    }

    if (elapsed >= _config.hard_timeout) {
        if (_bytes_downloaded == 0) {
            _fail(
              FailureReason::Timeout,
              fmt::format(
                "Exceeded {}s without starting download",
                seconds(_config.hard_timeout)
              )
            );
            return;
        }

        const auto& policy = _config.hard_timeout_policy;

        if (policy.kill_after and elapsed >= *policy.kill_after) {
            _fail(
              FailureReason::Timeout,
              fmt::format(
                "Download still running after {}s", seconds(*policy.kill_after)
              )
            );
            return;
        }

        if (_hard_warnings < policy.max_warnings) {
            _hard_warnings++;
            _warn(fmt::format(
              "Download time exceeds {}s, but continuing...",
              seconds(_config.hard_timeout)
            ));
        }
    }

    if (_store and not _idle_warned and
        now - _last_progress >= _config.idle_timeout) {
        _idle_warned = true;

        const auto idle =
          std::chrono::duration_cast<std::chrono::milliseconds>(now - _last_progress);

        if (_bytes_downloaded == 0) {
            _warn(fmt::format("Waiting for peers to send data ({}s)", seconds(idle)));
        }
        else {
            _warn(fmt::format("No download progress for {}s", seconds(idle)));
        }
    }

    _publish();
    _arm_monitor();
}

void Swarm::_report_progress()
{
    const auto verified = _bytes_verified;
    const auto total = _manifest->total_length;
    const auto percent = progress_percent(verified, total);
    const auto step = std::max(_config.progress_step_percent, 1u);

    if (percent / step <= _last_percent / step) {
        return;
    }

    _last_percent = percent;

    const auto speed = _rate.rate();
    const auto remaining = total - verified;
    const long long eta =
      speed > 0 ? static_cast<long long>(double(remaining) / speed * 1000.0) : -1;

    _emit(
      EventStatus::Downloading, "Download progress",
      {{"progress", percent},
       {"downloaded", verified},
       {"total", total},
       {"speed", static_cast<std::uint64_t>(speed)},
       {"eta", eta},
       {"elapsed", seconds(_elapsed())},
       {"peers", _established_count()}}
    );
}

void Swarm::_publish()
{
    Snapshot snapshot;
    snapshot.state = _state;
    snapshot.bytes_downloaded = _bytes_downloaded;
    snapshot.bytes_verified = _bytes_verified;
    snapshot.total_bytes = _manifest ? _manifest->total_length : 0;
    snapshot.peer_count = _established_count();
    snapshot.pieces = _selector ? _selector->verified() : proto::Bitfield();
    snapshot.download_rate = _rate.rate();

    for (auto& [key, session] : _sessions) {
        if (not session.established) {
            continue;
        }

        auto& connection = *session.connection;
        snapshot.peers.push_back(PeerSnapshot{
          .address = session.address,
          .choking = connection.is_choking_us(),
          .outstanding = connection.outstanding(),
          .download_rate = connection.download_rate(),
        });
    }

    std::scoped_lock lock(_mutex);
    _snapshot = std::move(snapshot);
}

void Swarm::_emit(EventStatus status, std::string message, nlohmann::json fields)
{
    SwarmEvent event{status, std::move(message), _elapsed(), std::move(fields)};

    utils::internal_logger()->debug("Event {}", event.to_json().dump());

    if (_sink) {
        _sink->on_event(event);
    }
}

void Swarm::_warn(std::string message)
{
    spdlog::warn("{}", message);
    _emit(EventStatus::Warning, std::move(message));
}

auto Swarm::_elapsed() const -> std::chrono::milliseconds
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - _start
    );
}

auto Swarm::_bytes_retained() const -> std::uint64_t
{
    return _bytes_verified;
}

auto Swarm::_established_count() const -> std::size_t
{
    return std::ranges::count_if(_sessions, [](const auto& item) {
        return item.second.established;
    });
}

//
// Public API
//

auto start(
  torrent::ContentDescriptor descriptor,
  std::filesystem::path destination,
  SwarmConfig config,
  std::vector<std::shared_ptr<DiscoverySource>> sources,
  std::shared_ptr<EventSink> sink
) -> SwarmHandle
{
    auto swarm = std::make_shared<Swarm>(
      std::move(descriptor), std::move(destination), std::move(config),
      std::move(sources), std::move(sink)
    );

    swarm->run();

    return SwarmHandle(std::move(swarm));
}

void cancel(const SwarmHandle& handle)
{
    handle.swarm().cancel();
}

auto snapshot(const SwarmHandle& handle) -> Snapshot
{
    return handle.swarm().snapshot();
}

auto wait(const SwarmHandle& handle) -> Outcome
{
    return handle.swarm().wait();
}

}  // namespace swarmget::engine
