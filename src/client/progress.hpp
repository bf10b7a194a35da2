#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <indicators/progress_bar.hpp>

#include "engine/events.hpp"

namespace swarmget::client {

/**
 * @brief Human readable size, 1024 based with two decimals ("1.50 MB")
 */
auto format_bytes(std::uint64_t bytes) -> std::string;

/**
 * @brief "1h 2m 3s", "2m 3s" or "3s"; "Unknown" for non-positive values
 */
auto format_time(long long ms) -> std::string;

/**
 * @brief Renders swarm events on the terminal
 *
 * Warnings and errors are left to the default logger, everything else is
 * printed to stdout with a progress bar while downloading.
 */
class ConsoleReporter : public engine::EventSink
{
 public:
    void on_event(const engine::SwarmEvent& event) override;

 private:
    void _on_init(const engine::SwarmEvent& event);
    void _on_found(const engine::SwarmEvent& event);
    void _on_progress(const engine::SwarmEvent& event);
    void _on_complete(const engine::SwarmEvent& event);
    void _finish_bar();

    std::unique_ptr<indicators::ProgressBar> _bar;
};

}  // namespace swarmget::client
