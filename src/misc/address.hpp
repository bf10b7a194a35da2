#pragma once

#include <charconv>
#include <compare>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace utils {

struct PeerAddress
{
    std::string ip;
    std::uint16_t port = 0;

    auto to_string() const -> std::string
    {
        if (ip.find(':') != std::string::npos) {
            return fmt::format("[{}]:{}", ip, port);
        }
        return fmt::format("{}:{}", ip, port);
    }

    auto operator<=>(const PeerAddress&) const = default;
};

/**
 * @brief Parse "<d.d.d.d>:<port>" or "[<ipv6>]:<port>"
 */
inline auto parse_ip_port(const std::string& ip_port_str)
  -> std::optional<PeerAddress>
{
    static const std::regex ipv4_regex(  //
      R"((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}):(\d{1,5}))"
    );
    static const std::regex ipv6_regex(  //
      R"(\[([0-9a-fA-F:.]+)\]:(\d{1,5}))"
    );

    std::smatch match;

    if (not std::regex_match(ip_port_str, match, ipv4_regex) and
        not std::regex_match(ip_port_str, match, ipv6_regex)) {
        return std::nullopt;
    }

    const auto port_str = match[2].str();

    unsigned port = 0;
    auto [_, ec] =
      std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);

    if (ec != std::errc{} or port == 0 or port > 65535) {
        return std::nullopt;
    }

    return PeerAddress{match[1].str(), static_cast<std::uint16_t>(port)};
}

}  // namespace utils

template<>
struct fmt::formatter<utils::PeerAddress> : fmt::formatter<std::string>
{
    template<typename FormatContext>
    auto format(const utils::PeerAddress& address, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(address.to_string(), ctx);
    }
};
