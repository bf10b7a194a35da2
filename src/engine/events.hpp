#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace swarmget::engine {

enum class EventStatus
{
    Init,
    Found,
    Downloading,
    Warning,
    Complete,
    Error,
    Cancelled,
};

/**
 * @brief One significant transition of a swarm
 *
 * `fields` carries the status specific values (sizes, progress, file list).
 * `timestamp` is monotonic, counted from swarm start.
 */
struct SwarmEvent
{
    EventStatus status;
    std::string message;
    std::chrono::milliseconds timestamp;
    nlohmann::json fields = nlohmann::json::object();

    /**
     * @brief Lowercase tag as written to the event stream ("downloading")
     */
    auto status_tag() const -> std::string;

    auto to_json() const -> nlohmann::json;
};

/**
 * @brief Receiver of swarm events
 *
 * Called on the swarm's I/O thread; implementations must not block for
 * long.
 */
class EventSink
{
 public:
    virtual ~EventSink() = default;
    virtual void on_event(const SwarmEvent& event) = 0;
};

/**
 * @brief Writes one JSON object per line
 */
class JsonLinesEventSink : public EventSink
{
 public:
    explicit JsonLinesEventSink(std::ostream& out) : _out(out) {}

    void on_event(const SwarmEvent& event) override;

 private:
    std::mutex _mutex;
    std::ostream& _out;
};

/**
 * @brief Whole percent of `done` in `total`, rounded to nearest
 */
auto progress_percent(std::uint64_t done, std::uint64_t total) -> unsigned;

}  // namespace swarmget::engine
