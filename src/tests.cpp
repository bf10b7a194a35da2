#include <spdlog/spdlog.h>

// bencode
void test_decoding();
void test_decoding_limits();
void test_encoding();

// proto
void test_pack_u32();
void test_pack_msg_id();
void test_message_roundtrip();
void test_framing_violations();
void test_handshake();
void test_bitfield();
void test_extension_messages();

// torrent
void test_url_and_base32();
void test_magnet_parsing();
void test_torrent_file();
void test_manifest_validation();
void test_manifest_geometry();
void test_map_range();

// storage
void test_piece_store_write_and_verify();
void test_piece_store_rejects_corruption();
void test_piece_store_multi_file();
void test_piece_store_recheck();
void test_piece_store_open_errors();
void test_piece_store_write_failure_keeps_buffer();
void test_piece_store_concurrent_verify();

// engine
void test_piece_selector();
void test_piece_selector_churn();
void test_peer_manager();
void test_metadata_assembler();
void test_announce_parsing();
void test_discovery_sources();
void test_http_tracker_announce();
void test_events();
void test_rate_meter();
void test_formatting();

// swarm over loopback
void test_swarm_single_seed();
void test_swarm_peer_churn();
void test_swarm_reassigns_partial_piece();
void test_swarm_corrupt_piece();
void test_swarm_magnet();
void test_swarm_hard_timeout_warning();
void test_swarm_hard_timeout_kill();
void test_swarm_no_peers();
void test_swarm_metadata_unavailable();
void test_swarm_cancel();
void test_swarm_resume_from_disk();

void tests()
{
    test_decoding();
    test_decoding_limits();
    test_encoding();

    test_pack_u32();
    test_pack_msg_id();
    test_message_roundtrip();
    test_framing_violations();
    test_handshake();
    test_bitfield();
    test_extension_messages();

    test_url_and_base32();
    test_magnet_parsing();
    test_torrent_file();
    test_manifest_validation();
    test_manifest_geometry();
    test_map_range();

    test_piece_store_write_and_verify();
    test_piece_store_rejects_corruption();
    test_piece_store_multi_file();
    test_piece_store_recheck();
    test_piece_store_open_errors();
    test_piece_store_write_failure_keeps_buffer();
    test_piece_store_concurrent_verify();

    test_piece_selector();
    test_piece_selector_churn();
    test_peer_manager();
    test_metadata_assembler();
    test_announce_parsing();
    test_discovery_sources();
    test_http_tracker_announce();
    test_events();
    test_rate_meter();
    test_formatting();
    spdlog::debug("Unit tests passed");

    test_swarm_single_seed();
    test_swarm_peer_churn();
    test_swarm_reassigns_partial_piece();
    test_swarm_corrupt_piece();
    test_swarm_magnet();
    test_swarm_hard_timeout_warning();
    test_swarm_hard_timeout_kill();
    test_swarm_no_peers();
    test_swarm_metadata_unavailable();
    test_swarm_cancel();
    test_swarm_resume_from_disk();

    spdlog::debug("All tests passed");
}
