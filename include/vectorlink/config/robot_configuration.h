#pragma once

#include <optional>
#include <string>
#include <vector>

#include "vectorlink/core/observable.h"
#include "vectorlink/net/ip_address.h"

namespace vectorlink::config {

// Property names published on property_changed().
namespace property {
inline constexpr const char* IP_ADDRESS      = "ip_address";
inline constexpr const char* REMOTE_HOST     = "remote_host";
inline constexpr const char* HAS_REMOTE_HOST = "has_remote_host";
} // namespace property

/**
 * Connection profile of one robot: identity, network and credential material.
 *
 * ip_address and remote_host are observable so that a transport holding
 * the entry can follow address or routing changes. The identity fields are
 * plain values. Nothing is checked on mutation; validate() runs before a
 * store write.
 */
class RobotConfiguration : public core::ObservableObject {
public:
    RobotConfiguration() = default;

    RobotConfiguration(std::string serialNumber,
                       std::string robotName,
                       std::string guid,
                       std::string certificate);

    // Section key. Treated as immutable once the entry has been persisted.
    const std::string& serial_number() const noexcept { return _serialNumber; }
    void set_serial_number(std::string value) { _serialNumber = std::move(value); }

    // Human label, "Vector-XXXX".
    const std::string& robot_name() const noexcept { return _robotName; }
    void set_robot_name(std::string value) { _robotName = std::move(value); }

    // Authentication token assigned when the robot was registered.
    const std::string& guid() const noexcept { return _guid; }
    void set_guid(std::string value) { _guid = std::move(value); }

    // PEM text of the robot's TLS certificate.
    const std::string& certificate() const noexcept { return _certificate; }
    void set_certificate(std::string value) { _certificate = std::move(value); }

    const std::optional<net::IpAddress>& ip_address() const noexcept { return _ipAddress; }
    bool set_ip_address(std::optional<net::IpAddress> value);

    // "host[:port]" used instead of the LAN address when set.
    const std::optional<std::string>& remote_host() const noexcept { return _remoteHost; }
    bool set_remote_host(std::optional<std::string> value);

    // True when remote_host holds something other than whitespace.
    bool has_remote_host() const;

    // Names of required fields that are empty, in declaration order.
    std::vector<std::string> missing_fields() const;

    // Fields whose value cannot be stored as a single `key=value` line or
    // `[serial]` header and read back unchanged: line breaks, surrounding
    // whitespace, brackets in the serial number, '/' in the parts of the
    // certificate file name. One description per problem.
    std::vector<std::string> malformed_fields() const;

    // Throws ConfigurationValidationError naming every missing or malformed field.
    void validate() const;

    bool operator==(const RobotConfiguration& other) const;
    bool operator!=(const RobotConfiguration& other) const { return !(*this == other); }

private:
    std::string _serialNumber;
    std::string _robotName;
    std::string _guid;
    std::string _certificate;

    std::optional<net::IpAddress> _ipAddress;
    std::optional<std::string>    _remoteHost;
};

} // namespace vectorlink::config
