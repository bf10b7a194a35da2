#include "engine/events.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <magic_enum.hpp>

namespace swarmget::engine {

auto SwarmEvent::status_tag() const -> std::string
{
    std::string tag{magic_enum::enum_name(status)};

    std::ranges::transform(tag, tag.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    return tag;
}

auto SwarmEvent::to_json() const -> nlohmann::json
{
    auto line = fields;

    line["status"] = status_tag();
    line["message"] = message;
    line["timestamp"] = timestamp.count();

    if (status == EventStatus::Error and not line.contains("error")) {
        line["error"] = message;
    }

    return line;
}

void JsonLinesEventSink::on_event(const SwarmEvent& event)
{
    const auto line =
      event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::scoped_lock lock(_mutex);
    _out << line << '\n';
    _out.flush();
}

auto progress_percent(std::uint64_t done, std::uint64_t total) -> unsigned
{
    if (total == 0) {
        return 0;
    }

    return static_cast<unsigned>(
      std::lround(double(std::min(done, total)) / double(total) * 100.0)
    );
}

}  // namespace swarmget::engine
