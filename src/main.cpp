#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

#include <asio.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bencode/decoders.hpp"
#include "client/progress.hpp"
#include "engine/discovery.hpp"
#include "engine/events.hpp"
#include "engine/swarm.hpp"
#include "misc/address.hpp"
#include "misc/logger.hpp"
#include "torrent/descriptor.hpp"

using Json = nlohmann::json;
namespace fs = std::filesystem;
namespace engine = swarmget::engine;
namespace torrent = swarmget::torrent;

#ifdef ENABLE_TESTS
void tests();
#endif


#define EXPECTED(assertion, msg_c_str, args...)                                \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(msg_c_str, args);                                    \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

constexpr auto DEFAULT_OUTPUT_DIR = "/tmp/downloads";

struct DownloadArgs
{
    std::string source;
    fs::path output_dir = DEFAULT_OUTPUT_DIR;
    std::optional<long long> timeout_secs;
    bool json = false;
    bool verbose = false;
    std::vector<utils::PeerAddress> peers;
};

auto decode_command(std::string encoded_value) -> ExitCode;
auto info_command(fs::path torrent_file_path) -> ExitCode;
auto magnet_parse_command(std::string magnet) -> ExitCode;
auto download_command(const DownloadArgs& args) -> ExitCode;
auto parse_download_args(int argc, char* argv[]) -> std::optional<DownloadArgs>;


int main(int argc, char* argv[])
{
    auto internal_logger = utils::internal_logger();

#ifdef NDEBUG
    spdlog::set_level(spdlog::level::info);
    internal_logger->set_level(spdlog::level::off);
#else
    spdlog::set_level(spdlog::level::debug);
    internal_logger->set_level(spdlog::level::off);
#endif

    if (argc < 2) {
        // clang-format off
        spdlog::error("Usage:");
        spdlog::error("  {} download <magnet|torrent_file_path> [output_dir] [--timeout S] [--json] [--peer ip:port]... [--verbose]", argv[0]);
        spdlog::error("  {} magnet_parse <magnet>", argv[0]);
        spdlog::error("  {} info <torrent_file_path>", argv[0]);
        spdlog::error("  {} decode <encoded_value>", argv[0]);
        // clang-format on
        return ExitCode::Fail;
    }

    std::string command = argv[1];

    try {
        if (command == "test") {
#ifdef ENABLE_TESTS
            tests();
#endif
            return ExitCode::Success;
        }

        if (command == "decode") {
            EXPECTED(argc == 3, "Usage: {} decode <encoded_value>", argv[0]);
            return decode_command(argv[2]);
        }

        if (command == "info") {
            EXPECTED(argc == 3, "Usage: {} info <torrent_file_path>", argv[0]);
            return info_command(argv[2]);
        }

        if (command == "magnet_parse") {
            EXPECTED(argc == 3, "Usage: {} magnet_parse <magnet>", argv[0]);
            return magnet_parse_command(argv[2]);
        }

        if (command == "download") {
            auto args = parse_download_args(argc, argv);
            EXPECTED(
              args.has_value(),
              "Usage: {} download <magnet|torrent_file_path> [output_dir] "
              "[--timeout S] [--json] [--peer ip:port]... [--verbose]",
              argv[0]
            );

            if (args->verbose) {
                spdlog::set_level(spdlog::level::debug);
                internal_logger->set_level(spdlog::level::debug);
            }
            else if (args->json) {
                // stdout carries the event stream only
                spdlog::set_level(spdlog::level::err);
            }

            return download_command(*args);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    return ExitCode::Fail;
}


auto parse_download_args(int argc, char* argv[]) -> std::optional<DownloadArgs>
{
    DownloadArgs args;
    bool output_set = false;

    for (int i = 2; i < argc; i++) {
        const std::string arg = argv[i];

        if (arg == "--json") {
            args.json = true;
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else if (arg == "--timeout") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }

            const auto value = std::stoll(argv[++i]);
            if (value <= 0) {
                throw std::invalid_argument(
                  fmt::format("Timeout must be positive, got {}", value)
                );
            }
            args.timeout_secs = value;
        }
        else if (arg == "--peer") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }

            auto address = utils::parse_ip_port(argv[++i]);
            if (not address) {
                throw std::invalid_argument(
                  fmt::format("Bad peer address: \"{}\"", argv[i])
                );
            }
            args.peers.push_back(std::move(*address));
        }
        else if (arg.starts_with("--")) {
            throw std::invalid_argument(fmt::format("Unknown option: {}", arg));
        }
        else if (args.source.empty()) {
            args.source = arg;
        }
        else if (not output_set) {
            args.output_dir = arg;
            output_set = true;
        }
        else {
            return std::nullopt;
        }
    }

    if (args.source.empty()) {
        return std::nullopt;
    }

    return args;
}


auto decode_command(std::string encoded_value) -> ExitCode
{
    auto decoded = bencode::decode_bencoded_value(encoded_value);
    EXPECTED(decoded.has_value(), "Error while decoding: {}", encoded_value);

    auto [_, decoded_value] = *decoded;
    fmt::print("{}\n", decoded_value.dump(-1, ' ', false, Json::error_handler_t::replace));

    return ExitCode::Success;
}

auto info_command(fs::path torrent_file_path) -> ExitCode
{
    auto descriptor = torrent::ContentDescriptor::from_torrent_file(torrent_file_path);
    EXPECTED(
      descriptor.has_value(), "Error while reading {}: {}",
      torrent_file_path.c_str(), magic_enum::enum_name(descriptor.error())
    );

    const auto& manifest = *descriptor->manifest;

    fmt::print(
      "Name: {}\nTrackers: {}\nLength: {}\nInfo Hash: {}\nPiece Length: {}\n",
      manifest.name, fmt::join(descriptor->trackers, ", "),
      manifest.total_length, descriptor->info_hash_hex(), manifest.piece_length
    );

    fmt::print("Files:\n");
    for (const auto& file : manifest.files) {
        fmt::print("  {} ({})\n", file.path.string(), swarmget::client::format_bytes(file.length));
    }

    fmt::print("Piece Hashes:\n");
    for (const auto& hash : manifest.piece_hashes) {
        fmt::print("{}\n", utils::to_hex(hash));
    }

    return ExitCode::Success;
}

auto magnet_parse_command(std::string magnet) -> ExitCode
{
    auto descriptor = torrent::ContentDescriptor::from_magnet(magnet);
    EXPECTED(
      descriptor.has_value(), "Bad magnet link: {}",
      magic_enum::enum_name(descriptor.error())
    );

    fmt::print("Info Hash: {}\n", descriptor->info_hash_hex());

    if (descriptor->display_name) {
        fmt::print("Name: {}\n", *descriptor->display_name);
    }

    for (const auto& tracker : descriptor->trackers) {
        fmt::print("Tracker URL: {}\n", tracker);
    }

    for (const auto& peer : descriptor->peer_hints) {
        fmt::print("Peer: {}\n", peer);
    }

    return ExitCode::Success;
}

auto download_command(const DownloadArgs& args) -> ExitCode
{
    auto descriptor = torrent::ContentDescriptor::from_source(args.source);
    EXPECTED(
      descriptor.has_value(), "Can not use \"{}\": {}", args.source,
      magic_enum::enum_name(descriptor.error())
    );

    std::error_code error;
    fs::create_directories(args.output_dir, error);
    EXPECTED(
      not error and fs::is_directory(args.output_dir),
      "Can not create output directory \"{}\": {}", args.output_dir.string(),
      error.message()
    );

    engine::SwarmConfig config;
    config.peer_id = engine::generate_peer_id();

    if (args.timeout_secs) {
        config.hard_timeout = std::chrono::seconds(*args.timeout_secs);
    }

    auto sources = engine::make_discovery_sources(
      *descriptor, args.peers, *config.peer_id, engine::Swarm::ANNOUNCE_PORT
    );

    std::shared_ptr<engine::EventSink> sink;
    if (args.json) {
        sink = std::make_shared<engine::JsonLinesEventSink>(std::cout);
    }
    else {
        sink = std::make_shared<swarmget::client::ConsoleReporter>();
    }

    auto handle = engine::start(
      std::move(*descriptor), args.output_dir, config, std::move(sources), sink
    );

    asio::io_context signals_io;
    asio::signal_set signals(signals_io, SIGINT, SIGTERM);

    signals.async_wait([&handle](const asio::error_code& error, int signal) {
        if (not error) {
            spdlog::info("Signal {} received, cancelling download", signal);
            engine::cancel(handle);
        }
    });

    std::thread signals_thread([&signals_io] { signals_io.run(); });

    const auto outcome = engine::wait(handle);

    asio::post(signals_io, [&signals] { signals.cancel(); });
    signals_thread.join();

    if (std::holds_alternative<engine::Failed>(outcome)) {
        const auto& failed = std::get<engine::Failed>(outcome);

        spdlog::error(
          "Download failed ({}), {} verified bytes kept in {}",
          magic_enum::enum_name(failed.reason), failed.bytes_retained,
          args.output_dir.string()
        );
        return ExitCode::Fail;
    }

    return ExitCode::Success;
}
