#include "vectorlink/net/ip_address.h"

#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>

namespace vectorlink::net {

static std::string_view trim_ws(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<IpAddress> IpAddress::parse(std::string_view text)
{
    const std::string s(trim_ws(text));
    if (s.empty()) {
        return std::nullopt;
    }

    IpAddress out;
    if (s.find(':') == std::string::npos) {
        in_addr a4{};
        if (::inet_pton(AF_INET, s.c_str(), &a4) != 1) {
            return std::nullopt;
        }
        out._family = AddressFamily::V4;
        const auto* p = reinterpret_cast<const std::uint8_t*>(&a4.s_addr);
        for (std::size_t i = 0; i < 4; ++i) {
            out._bytes[i] = p[i];
        }
        return out;
    }

    in6_addr a6{};
    if (::inet_pton(AF_INET6, s.c_str(), &a6) != 1) {
        return std::nullopt;
    }
    out._family = AddressFamily::V6;
    for (std::size_t i = 0; i < 16; ++i) {
        out._bytes[i] = a6.s6_addr[i];
    }
    return out;
}

IpAddress IpAddress::v4(std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
{
    IpAddress out;
    out._family   = AddressFamily::V4;
    out._bytes[0] = a;
    out._bytes[1] = b;
    out._bytes[2] = c;
    out._bytes[3] = d;
    return out;
}

std::string IpAddress::to_string() const
{
    char buf[INET6_ADDRSTRLEN] = {};

    if (_family == AddressFamily::V4) {
        in_addr a4{};
        auto* p = reinterpret_cast<std::uint8_t*>(&a4.s_addr);
        for (std::size_t i = 0; i < 4; ++i) {
            p[i] = _bytes[i];
        }
        if (!::inet_ntop(AF_INET, &a4, buf, sizeof(buf))) {
            return std::string();
        }
        return buf;
    }

    in6_addr a6{};
    for (std::size_t i = 0; i < 16; ++i) {
        a6.s6_addr[i] = _bytes[i];
    }
    if (!::inet_ntop(AF_INET6, &a6, buf, sizeof(buf))) {
        return std::string();
    }
    return buf;
}

} // namespace vectorlink::net
