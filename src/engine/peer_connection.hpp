#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <asio.hpp>
#include <tl/expected.hpp>

#include "engine/discovery.hpp"
#include "engine/types.hpp"
#include "misc/address.hpp"
#include "misc/rate_meter.hpp"
#include "proto/extension.hpp"
#include "proto/types.hpp"
#include "torrent/descriptor.hpp"

namespace swarmget::engine {

namespace peer_event {

struct Established
{
    PeerId peer_id;
    bool supports_extensions;
};

struct Choked
{
};

struct Unchoked
{
};

struct Have
{
    std::uint32_t piece;
};

struct Bitfield
{
    std::vector<std::uint8_t> bits;
};

struct Block
{
    BlockRef block;
    std::vector<std::uint8_t> data;
};

struct ExtendedHandshake
{
    proto::ExtendedHandshake handshake;
};

struct Metadata
{
    proto::MetadataMsg msg;
};

struct Closed
{
    CloseReason reason;
    std::string message;
};

}  // namespace peer_event

struct PeerEvent
{
    PeerKey key;

    std::variant<
      peer_event::Established,
      peer_event::Choked,
      peer_event::Unchoked,
      peer_event::Have,
      peer_event::Bitfield,
      peer_event::Block,
      peer_event::ExtendedHandshake,
      peer_event::Metadata,
      peer_event::Closed>
      event;
};

/**
 * @brief One peer wire session over TCP
 *
 * Runs entirely on the executor it was created with. Everything the session
 * learns is posted to that executor as a PeerEvent, so the owner observes
 * events in order and never from inside a socket handler. Exactly one
 * Closed event is emitted per session.
 *
 * The session only downloads: the remote side stays choked and its
 * requests are ignored.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection>
{
 public:
    enum class State
    {
        Connecting,
        Handshaking,
        Established,
        Closed,
    };

    struct Options
    {
        torrent::InfoHash info_hash;
        PeerId local_peer_id;
        std::size_t max_requests;
        std::chrono::milliseconds handshake_timeout;
        std::chrono::milliseconds request_timeout;
        std::chrono::milliseconds keepalive_interval;
        std::chrono::milliseconds inactivity_timeout;
    };

    using EventHandler = std::function<void(PeerEvent)>;

    static auto create(
      asio::io_context& io,
      PeerKey key,
      utils::PeerAddress address,
      Options options,
      EventHandler handler
    ) -> std::shared_ptr<PeerConnection>;

    void start();

    /**
     * @brief Queue a block request
     *
     * Refused with PeerChoking while the remote chokes us, PeerBusy at the
     * outstanding request limit and NotEstablished before the handshake
     * completed or after close.
     */
    auto request_block(const BlockRef& block) -> tl::expected<void, RequestError>;

    /**
     * @brief Ask for one piece of the info dictionary
     *
     * Returns false unless the remote advertised ut_metadata.
     */
    auto request_metadata(std::size_t piece) -> bool;

    void set_interested(bool interested);

    /**
     * @brief Close the socket and emit Closed; later calls do nothing
     */
    void close(CloseReason reason, std::string message = {});

    auto key() const -> PeerKey { return _key; }
    auto address() const -> const utils::PeerAddress& { return _address; }
    auto state() const -> State { return _state; }
    auto is_choking_us() const -> bool { return _peer_choking; }
    auto is_interested() const -> bool { return _am_interested; }
    auto outstanding() const -> std::size_t { return _outstanding.size(); }
    auto supports_metadata() const -> bool { return _remote_metadata_id.has_value(); }
    auto download_rate() -> double { return _rate.rate(); }

 private:
    PeerConnection(
      asio::io_context& io,
      PeerKey key,
      utils::PeerAddress address,
      Options options,
      EventHandler handler
    );

    void _on_connect(const asio::error_code& error);
    void _on_handshake(const asio::error_code& error);
    void _on_established();

    void _read_length();
    void _read_body(std::uint32_t length);
    void _dispatch(proto::Message& message);
    void _on_piece(proto::PieceMsg& piece);
    void _on_extended(proto::ExtendedMsg& extended);

    void _send(std::vector<std::uint8_t> frame);
    void _write_next();

    void _arm_keepalive();
    void _arm_inactivity();
    void _arm_request_timer();

    template<typename Event>
    void _emit(Event event)
    {
        asio::post(
          _io,
          [handler = _handler, key = _key, event = std::move(event)]() mutable {
              handler(PeerEvent{key, std::move(event)});
          }
        );
    }

    auto _on_error(const asio::error_code& error) -> bool;

    asio::io_context& _io;
    const PeerKey _key;
    const utils::PeerAddress _address;
    const Options _options;
    const EventHandler _handler;

    asio::ip::tcp::socket _socket;
    asio::steady_timer _handshake_timer;
    asio::steady_timer _keepalive_timer;
    asio::steady_timer _inactivity_timer;
    asio::steady_timer _request_timer;

    State _state = State::Connecting;

    std::vector<std::uint8_t> _handshake_buffer;
    std::vector<std::uint8_t> _length_buffer;
    std::vector<std::uint8_t> _body_buffer;

    std::deque<std::vector<std::uint8_t>> _write_queue;

    bool _peer_choking = true;
    bool _am_interested = false;
    std::optional<std::uint8_t> _remote_metadata_id;

    std::map<BlockRef, Clock::time_point> _outstanding;
    Clock::time_point _last_received;
    Clock::time_point _last_block;

    utils::RateMeter _rate;
};

}  // namespace swarmget::engine
