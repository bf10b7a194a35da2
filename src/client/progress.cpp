#include "client/progress.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

#include <fmt/core.h>
#include <indicators/color.hpp>
#include <indicators/setting.hpp>

namespace swarmget::client {

namespace ind = indicators;

namespace {

auto progress_bar() -> std::unique_ptr<ind::ProgressBar>
{
    using namespace indicators;

    return std::make_unique<ProgressBar>(
      option::BarWidth{50}, option::Start{"["}, option::Fill{"■"},
      option::Lead{"■"}, option::Remainder{"-"}, option::End{" ]"},
      option::PostfixText{"..."}, option::ForegroundColor{Color::green},
      option::ShowPercentage{true},
      option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
      option::ShowElapsedTime{true}
    );
}

}  // namespace

auto format_bytes(std::uint64_t bytes) -> std::string
{
    constexpr std::array UNITS{"B", "KB", "MB", "GB", "TB"};

    if (bytes == 0) {
        return "0 B";
    }

    double value = double(bytes);
    std::size_t unit = 0;

    while (value >= 1024.0 and unit + 1 < UNITS.size()) {
        value /= 1024.0;
        unit++;
    }

    return fmt::format("{:.2f} {}", value, UNITS[unit]);
}

auto format_time(long long ms) -> std::string
{
    if (ms <= 0) {
        return "Unknown";
    }

    const auto seconds = (ms / 1000) % 60;
    const auto minutes = (ms / (1000 * 60)) % 60;
    const auto hours = ms / (1000 * 60 * 60);

    if (hours > 0) {
        return fmt::format("{}h {}m {}s", hours, minutes, seconds);
    }
    else if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, seconds);
    }

    return fmt::format("{}s", seconds);
}

void ConsoleReporter::on_event(const engine::SwarmEvent& event)
{
    using engine::EventStatus;

    switch (event.status) {
        case EventStatus::Init:
            _on_init(event);
            break;

        case EventStatus::Found:
            _on_found(event);
            break;

        case EventStatus::Downloading:
            _on_progress(event);
            break;

        case EventStatus::Complete:
            _on_complete(event);
            break;

        case EventStatus::Error:
        case EventStatus::Cancelled:
            _finish_bar();
            break;

        case EventStatus::Warning:
            break;
    }
}

void ConsoleReporter::_on_init(const engine::SwarmEvent& event)
{
    fmt::print("=== swarmget ===\n");
    fmt::print("Output: {}\n", event.fields.value("outputDir", ""));
    fmt::print("Timeout: {}s\n\n", event.fields.value("timeoutSecs", 0LL));
}

void ConsoleReporter::_on_found(const engine::SwarmEvent& event)
{
    fmt::print("Torrent found: {}\n", event.fields.value("name", ""));
    fmt::print("  Size: {}\n", format_bytes(event.fields.value("size", std::uint64_t(0))));
    fmt::print("  Files: {}\n", event.fields.value("files", std::size_t(0)));
    fmt::print("  Peers: {}\n\n", event.fields.value("peers", std::size_t(0)));
    fmt::print("Downloading...\n");
}

void ConsoleReporter::_on_progress(const engine::SwarmEvent& event)
{
    if (not _bar) {
        _bar = progress_bar();
    }

    const auto speed = event.fields.value("speed", std::uint64_t(0));
    const auto eta = event.fields.value("eta", -1LL);

    _bar->set_option(ind::option::PostfixText{fmt::format(
      "{}/s | ETA: {} | Peers: {}", format_bytes(speed), format_time(eta),
      event.fields.value("peers", std::size_t(0))
    )});
    _bar->set_progress(event.fields.value("progress", std::size_t(0)));
}

void ConsoleReporter::_on_complete(const engine::SwarmEvent& event)
{
    _finish_bar();

    fmt::print(
      "\nDownload complete in {}\n\n",
      format_time(event.fields.value("elapsed", 0LL) * 1000)
    );

    fmt::print("Files:\n");

    for (const auto& file : event.fields.value("files", nlohmann::json::array())) {
        fmt::print(
          "  {}. {} ({})\n", file.value("index", std::size_t(0)) + 1,
          file.value("path", ""),
          format_bytes(file.value("size", std::uint64_t(0)))
        );
    }

    fmt::print(
      "\nTotal size: {}\n",
      format_bytes(event.fields.value("totalSize", std::uint64_t(0)))
    );
    fmt::print("Location: {}\n", event.fields.value("location", ""));
}

void ConsoleReporter::_finish_bar()
{
    if (_bar and not _bar->is_completed()) {
        _bar->mark_as_completed();
    }
}

}  // namespace swarmget::client
