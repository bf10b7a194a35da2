#include "engine/peer_connection.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

#include <fmt/core.h>
#include <magic_enum.hpp>

#include "misc/logger.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"

namespace swarmget::engine {

namespace {

constexpr const char* CLIENT_NAME = "swarmget 0.1";

}  // namespace

PeerConnection::PeerConnection(
  asio::io_context& io,
  PeerKey key,
  utils::PeerAddress address,
  Options options,
  EventHandler handler
) :
  _io(io),
  _key(key),
  _address(std::move(address)),
  _options(std::move(options)),
  _handler(std::move(handler)),
  _socket(io),
  _handshake_timer(io),
  _keepalive_timer(io),
  _inactivity_timer(io),
  _request_timer(io)
{
}

auto PeerConnection::create(
  asio::io_context& io,
  PeerKey key,
  utils::PeerAddress address,
  Options options,
  EventHandler handler
) -> std::shared_ptr<PeerConnection>
{
    return std::shared_ptr<PeerConnection>(new PeerConnection(
      io, key, std::move(address), std::move(options), std::move(handler)
    ));
}

void PeerConnection::start()
{
    asio::error_code ec;
    const auto ip = asio::ip::make_address(_address.ip, ec);
    if (ec) {
        close(CloseReason::ConnectFailure, fmt::format("Bad address: {}", ec.message()));
        return;
    }

    _handshake_timer.expires_after(_options.handshake_timeout);
    _handshake_timer.async_wait([self = shared_from_this()](auto error) {
        if (error or self->_state == State::Closed or
            self->_state == State::Established) {
            return;
        }

        if (self->_state == State::Connecting) {
            self->close(CloseReason::ConnectFailure, "Connect timed out");
        }
        else {
            self->close(CloseReason::HandshakeFailure, "Handshake timed out");
        }
    });

    _socket.async_connect(
      asio::ip::tcp::endpoint(ip, _address.port),
      [self = shared_from_this()](const asio::error_code& error) {
          self->_on_connect(error);
      }
    );
}

void PeerConnection::_on_connect(const asio::error_code& error)
{
    if (_state == State::Closed) {
        return;
    }

    if (error) {
        close(CloseReason::ConnectFailure, error.message());
        return;
    }

    _state = State::Handshaking;

    proto::PeerHandshakeMsg handshake{
      .info_hash = _options.info_hash, .peer_id = _options.local_peer_id
    };
    handshake.reserved[proto::PeerHandshakeMsg::EXTENSION_BYTE] |=
      proto::PeerHandshakeMsg::EXTENSION_BIT;

    _send(proto::pack_handshake(handshake));

    _handshake_buffer.resize(proto::PeerHandshakeMsg::SIZE);
    asio::async_read(
      _socket, asio::buffer(_handshake_buffer),
      [self = shared_from_this()](const asio::error_code& error, std::size_t) {
          self->_on_handshake(error);
      }
    );
}

void PeerConnection::_on_handshake(const asio::error_code& error)
{
    if (_on_error(error)) {
        return;
    }

    auto handshake = proto::unpack_handshake(_handshake_buffer);
    if (not handshake) {
        close(
          CloseReason::HandshakeFailure,
          fmt::format("Bad handshake: {}", magic_enum::enum_name(handshake.error()))
        );
        return;
    }

    if (handshake->info_hash != _options.info_hash) {
        close(CloseReason::HandshakeFailure, "Info hash mismatch");
        return;
    }

    if (handshake->peer_id == _options.local_peer_id) {
        close(CloseReason::HandshakeFailure, "Connected to ourselves");
        return;
    }

    _handshake_timer.cancel();
    _state = State::Established;

    utils::internal_logger()->debug("{} handshake done", _address);

    _emit(peer_event::Established{
      handshake->peer_id, handshake->supports_extensions()
    });

    if (handshake->supports_extensions()) {
        proto::ExtendedHandshake extended;
        extended.extensions[proto::UT_METADATA] = proto::LOCAL_UT_METADATA_ID;
        extended.client = CLIENT_NAME;

        _send(proto::pack_extended_msg(
          proto::EXTENDED_HANDSHAKE_ID, proto::pack_extended_handshake(extended)
        ));
    }

    _on_established();
}

void PeerConnection::_on_established()
{
    _last_received = Clock::now();

    _arm_keepalive();
    _arm_inactivity();
    _read_length();
}

void PeerConnection::_read_length()
{
    _length_buffer.resize(proto::LENGTH_PREFIX_SIZE);

    asio::async_read(
      _socket, asio::buffer(_length_buffer),
      [self = shared_from_this()](const asio::error_code& error, std::size_t) {
          if (self->_on_error(error)) {
              return;
          }

          self->_last_received = Clock::now();

          auto length = proto::unpack_length_prefix(self->_length_buffer);
          if (not length) {
              self->close(
                CloseReason::ProtocolViolation,
                fmt::format(
                  "Bad frame length: {}", magic_enum::enum_name(length.error())
                )
              );
              return;
          }

          if (*length == 0) {
              self->_read_length();  // keep-alive
              return;
          }

          self->_read_body(*length);
      }
    );
}

void PeerConnection::_read_body(std::uint32_t length)
{
    _body_buffer.resize(length);

    asio::async_read(
      _socket, asio::buffer(_body_buffer),
      [self = shared_from_this()](const asio::error_code& error, std::size_t) {
          if (self->_on_error(error)) {
              return;
          }

          self->_last_received = Clock::now();

          auto message = proto::unpack_message(self->_body_buffer);
          if (not message) {
              self->close(
                CloseReason::ProtocolViolation,
                fmt::format(
                  "Bad message: {}", magic_enum::enum_name(message.error())
                )
              );
              return;
          }

          self->_dispatch(*message);

          if (self->_state != State::Closed) {
              self->_read_length();
          }
      }
    );
}

void PeerConnection::_dispatch(proto::Message& message)
{
    std::visit(
      [this](auto& msg) {
          using Msg = std::decay_t<decltype(msg)>;

          if constexpr (std::is_same_v<Msg, proto::ChokeMsg>) {
              _peer_choking = true;
              // Choke drops every pending request on the remote side
              _outstanding.clear();
              _request_timer.cancel();
              _emit(peer_event::Choked{});
          }
          else if constexpr (std::is_same_v<Msg, proto::UnchokeMsg>) {
              _peer_choking = false;
              _emit(peer_event::Unchoked{});
          }
          else if constexpr (std::is_same_v<Msg, proto::HaveMsg>) {
              _emit(peer_event::Have{msg.index});
          }
          else if constexpr (std::is_same_v<Msg, proto::BitfieldMsg>) {
              _emit(peer_event::Bitfield{std::move(msg.bits)});
          }
          else if constexpr (std::is_same_v<Msg, proto::PieceMsg>) {
              _on_piece(msg);
          }
          else if constexpr (std::is_same_v<Msg, proto::ExtendedMsg>) {
              _on_extended(msg);
          }
          else {
              // Keep-alive, interest changes, requests, cancels and DHT
              // ports need no reaction from a download-only session
          }
      },
      message
    );
}

void PeerConnection::_on_piece(proto::PieceMsg& piece)
{
    const BlockRef block{
      piece.index, piece.begin, static_cast<std::uint32_t>(piece.block.size())
    };

    auto request = _outstanding.find(block);
    if (request == _outstanding.end()) {
        utils::internal_logger()->debug(
          "{} unrequested block {}:{} ({} bytes)", _address, block.piece,
          block.offset, block.length
        );
        return;
    }

    _outstanding.erase(request);
    _last_block = Clock::now();
    _rate.add(block.length, _last_block);

    if (_outstanding.empty()) {
        _request_timer.cancel();
    }

    _emit(peer_event::Block{block, std::move(piece.block)});
}

void PeerConnection::_on_extended(proto::ExtendedMsg& extended)
{
    if (extended.extended_id == proto::EXTENDED_HANDSHAKE_ID) {
        auto handshake = proto::unpack_extended_handshake(extended.payload);
        if (not handshake) {
            close(CloseReason::ProtocolViolation, "Bad extension handshake");
            return;
        }

        _remote_metadata_id = handshake->extension_id(proto::UT_METADATA);
        _emit(peer_event::ExtendedHandshake{std::move(*handshake)});
        return;
    }

    if (extended.extended_id == proto::LOCAL_UT_METADATA_ID) {
        auto metadata = proto::unpack_metadata_msg(extended.payload);
        if (not metadata) {
            close(CloseReason::ProtocolViolation, "Bad ut_metadata message");
            return;
        }

        // Requests for our metadata are not served
        if (metadata->type != proto::MetadataMsgType::Request) {
            _emit(peer_event::Metadata{std::move(*metadata)});
        }
        else {
            proto::MetadataMsg reject{
              proto::MetadataMsgType::Reject, metadata->piece, std::nullopt, {}
            };
            if (_remote_metadata_id) {
                _send(proto::pack_extended_msg(
                  *_remote_metadata_id, proto::pack_metadata_msg(reject)
                ));
            }
        }
    }
}

auto PeerConnection::request_block(const BlockRef& block)
  -> tl::expected<void, RequestError>
{
    if (_state != State::Established) {
        return tl::make_unexpected(RequestError::NotEstablished);
    }
    if (_peer_choking) {
        return tl::make_unexpected(RequestError::PeerChoking);
    }
    if (_outstanding.size() >= _options.max_requests) {
        return tl::make_unexpected(RequestError::PeerBusy);
    }

    const bool was_idle = _outstanding.empty();
    const auto now = Clock::now();

    _outstanding.emplace(block, now);
    _send(proto::pack_request_msg(block.piece, block.offset, block.length));

    if (was_idle) {
        _last_block = now;
        _arm_request_timer();
    }

    return {};
}

auto PeerConnection::request_metadata(std::size_t piece) -> bool
{
    if (_state != State::Established or not _remote_metadata_id) {
        return false;
    }

    proto::MetadataMsg request{
      proto::MetadataMsgType::Request, piece, std::nullopt, {}
    };

    _send(proto::pack_extended_msg(
      *_remote_metadata_id, proto::pack_metadata_msg(request)
    ));

    return true;
}

void PeerConnection::set_interested(bool interested)
{
    if (_state != State::Established or _am_interested == interested) {
        return;
    }

    _am_interested = interested;
    _send(
      interested ? proto::pack_interested_msg()
                 : proto::pack_not_interested_msg()
    );
}

void PeerConnection::close(CloseReason reason, std::string message)
{
    if (_state == State::Closed) {
        return;
    }

    _state = State::Closed;

    _handshake_timer.cancel();
    _keepalive_timer.cancel();
    _inactivity_timer.cancel();
    _request_timer.cancel();

    asio::error_code ignored;
    _socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    _socket.close(ignored);

    _outstanding.clear();

    utils::internal_logger()->debug(
      "{} closed: {} {}", _address, magic_enum::enum_name(reason), message
    );

    _emit(peer_event::Closed{reason, std::move(message)});
}

void PeerConnection::_send(std::vector<std::uint8_t> frame)
{
    if (_state == State::Closed) {
        return;
    }

    const bool idle = _write_queue.empty();
    _write_queue.push_back(std::move(frame));

    if (idle) {
        _write_next();
    }
}

void PeerConnection::_write_next()
{
    asio::async_write(
      _socket, asio::buffer(_write_queue.front()),
      [self = shared_from_this()](const asio::error_code& error, std::size_t) {
          if (self->_on_error(error)) {
              return;
          }

          self->_write_queue.pop_front();
          if (not self->_write_queue.empty()) {
              self->_write_next();
          }
      }
    );
}

void PeerConnection::_arm_keepalive()
{
    _keepalive_timer.expires_after(_options.keepalive_interval);
    _keepalive_timer.async_wait([self = shared_from_this()](auto error) {
        if (error or self->_state != State::Established) {
            return;
        }

        self->_send(proto::pack_keepalive_msg());
        self->_arm_keepalive();
    });
}

void PeerConnection::_arm_inactivity()
{
    const auto deadline = _last_received + _options.inactivity_timeout;

    _inactivity_timer.expires_at(deadline);
    _inactivity_timer.async_wait([self = shared_from_this()](auto error) {
        if (error or self->_state != State::Established) {
            return;
        }

        const auto silent = Clock::now() - self->_last_received;
        if (silent >= self->_options.inactivity_timeout) {
            self->close(CloseReason::Timeout, "Peer went silent");
            return;
        }

        self->_arm_inactivity();
    });
}

void PeerConnection::_arm_request_timer()
{
    _request_timer.expires_at(_last_block + _options.request_timeout);
    _request_timer.async_wait([self = shared_from_this()](auto error) {
        if (error or self->_state != State::Established or
            self->_outstanding.empty()) {
            return;
        }

        const auto waited = Clock::now() - self->_last_block;
        if (waited >= self->_options.request_timeout) {
            self->close(
              CloseReason::Timeout,
              fmt::format("{} request(s) unanswered", self->_outstanding.size())
            );
            return;
        }

        self->_arm_request_timer();
    });
}

auto PeerConnection::_on_error(const asio::error_code& error) -> bool
{
    if (_state == State::Closed) {
        return true;
    }

    if (not error) {
        return false;
    }

    if (error == asio::error::eof) {
        close(CloseReason::Clean, "Remote closed the connection");
    }
    else {
        close(CloseReason::IoError, error.message());
    }

    return true;
}

}  // namespace swarmget::engine
