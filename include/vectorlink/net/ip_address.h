#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vectorlink::net {

enum class AddressFamily : std::uint8_t {
    V4,
    V6,
};

// Parsed IPv4 or IPv6 address, stored in network byte order.
class IpAddress {
public:
    // Accepts dotted-quad IPv4 or textual IPv6 (surrounding whitespace is ignored).
    static std::optional<IpAddress> parse(std::string_view text);

    static IpAddress v4(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d);

    AddressFamily family() const noexcept { return _family; }

    // 4 significant bytes for V4, 16 for V6.
    const std::array<std::uint8_t, 16>& bytes() const noexcept { return _bytes; }

    // Canonical text form ("192.168.1.20", "fe80::1").
    std::string to_string() const;

    bool operator==(const IpAddress& other) const noexcept
    {
        return _family == other._family && _bytes == other._bytes;
    }
    bool operator!=(const IpAddress& other) const noexcept { return !(*this == other); }

private:
    IpAddress() = default;

    AddressFamily                _family{AddressFamily::V4};
    std::array<std::uint8_t, 16> _bytes{};
};

} // namespace vectorlink::net
