#include "vectorlink/config/robot_configuration.h"
#include "vectorlink/config/config_errors.h"

#include <cctype>
#include <utility>

namespace vectorlink::config {

static std::string join(const std::vector<std::string>& items, const char* sep)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

static bool has_line_break(const std::string& s)
{
    return s.find_first_of("\r\n") != std::string::npos;
}

static bool has_surrounding_space(const std::string& s)
{
    return !s.empty()
        && (std::isspace(static_cast<unsigned char>(s.front()))
            || std::isspace(static_cast<unsigned char>(s.back())));
}

static void check_line_value(std::vector<std::string>& out, const char* field, const std::string& value)
{
    if (has_line_break(value)) {
        out.push_back(std::string(field) + " contains a line break");
    } else if (has_surrounding_space(value)) {
        out.push_back(std::string(field) + " has leading or trailing whitespace");
    }
}

RobotConfiguration::RobotConfiguration(std::string serialNumber,
                                       std::string robotName,
                                       std::string guid,
                                       std::string certificate)
    : _serialNumber(std::move(serialNumber))
    , _robotName(std::move(robotName))
    , _guid(std::move(guid))
    , _certificate(std::move(certificate))
{
}

bool RobotConfiguration::set_ip_address(std::optional<net::IpAddress> value)
{
    return set_property(_ipAddress, std::move(value), property::IP_ADDRESS);
}

bool RobotConfiguration::set_remote_host(std::optional<std::string> value)
{
    if (!set_property(_remoteHost, std::move(value), property::REMOTE_HOST)) {
        return false;
    }
    raise_changed(property::HAS_REMOTE_HOST);
    return true;
}

bool RobotConfiguration::has_remote_host() const
{
    if (!_remoteHost) {
        return false;
    }
    for (char c : *_remoteHost) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> RobotConfiguration::missing_fields() const
{
    std::vector<std::string> missing;
    if (_serialNumber.empty()) missing.emplace_back("serial_number");
    if (_robotName.empty())    missing.emplace_back("robot_name");
    if (_guid.empty())         missing.emplace_back("guid");
    if (_certificate.empty())  missing.emplace_back("certificate");
    return missing;
}

std::vector<std::string> RobotConfiguration::malformed_fields() const
{
    std::vector<std::string> malformed;

    check_line_value(malformed, "serial_number", _serialNumber);
    if (_serialNumber.find_first_of("[]") != std::string::npos) {
        malformed.emplace_back("serial_number contains '[' or ']'");
    }
    if (_serialNumber.find('/') != std::string::npos) {
        malformed.emplace_back("serial_number contains '/'");
    }

    check_line_value(malformed, "robot_name", _robotName);
    if (_robotName.find('/') != std::string::npos) {
        malformed.emplace_back("robot_name contains '/'");
    }

    check_line_value(malformed, "guid", _guid);

    // A blank remote host is dropped on write, so only a real one must survive.
    if (has_remote_host()) {
        check_line_value(malformed, "remote_host", *_remoteHost);
    }

    return malformed;
}

void RobotConfiguration::validate() const
{
    const auto missing   = missing_fields();
    const auto malformed = malformed_fields();
    if (missing.empty() && malformed.empty()) {
        return;
    }

    std::string what = "robot configuration";
    if (!missing.empty()) {
        what += " is missing required field(s): " + join(missing, ", ");
    }
    if (!malformed.empty()) {
        what += missing.empty() ? ": " : "; ";
        what += join(malformed, ", ");
    }
    throw ConfigurationValidationError(what);
}

bool RobotConfiguration::operator==(const RobotConfiguration& other) const
{
    return _serialNumber == other._serialNumber
        && _robotName    == other._robotName
        && _guid         == other._guid
        && _certificate  == other._certificate
        && _ipAddress    == other._ipAddress
        && _remoteHost   == other._remoteHost;
}

} // namespace vectorlink::config
