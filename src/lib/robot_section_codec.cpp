#include "vectorlink/config/robot_section_codec.h"
#include "vectorlink/config/config_errors.h"
#include "vectorlink/core/logging.h"
#include "vectorlink/fs/file_text.h"

#include <exception>

namespace vectorlink::config {

static constexpr const char* TAG = "robot_config";

static std::string get_or(const IniSection& section, const char* k, const std::string& def)
{
    const std::string* v = section.find(k);
    return v ? *v : def;
}

static std::string read_certificate(fs::IFileSystem& fs, const std::string& path)
{
    std::string pem;
    if (!fs.exists(path) || !fs::read_text_file(fs, path, pem)) {
        throw ConfigurationIoError("cannot read certificate file '" + path + "'");
    }
    return pem;
}

static RobotConfiguration decode_fields(fs::IFileSystem& fs,
                                        const std::string& serialNumber,
                                        const IniSection& section)
{
    RobotConfiguration robot;
    robot.set_serial_number(serialNumber);
    robot.set_guid(get_or(section, key::GUID, ""));
    robot.set_robot_name(get_or(section, key::NAME, ""));

    if (const std::string* ip = section.find(key::IP)) {
        auto addr = net::IpAddress::parse(*ip);
        if (!addr) {
            throw ConfigurationLoadError("invalid ip address '" + *ip + "'");
        }
        robot.set_ip_address(*addr);
    }

    const std::string* certPath = section.find(key::CERT);
    if (!certPath || certPath->empty()) {
        throw ConfigurationLoadError("no certificate path ('cert' key)");
    }
    robot.set_certificate(read_certificate(fs, *certPath));

    if (const std::string* remote = section.find(key::REMOTE)) {
        robot.set_remote_host(*remote);
    }

    return robot;
}

std::string default_certificate_path(const std::string& baseDirectory,
                                     const RobotConfiguration& robot)
{
    return fs::join_path(baseDirectory,
                         robot.robot_name() + "-" + robot.serial_number() + ".cert");
}

RobotConfiguration decode_section(fs::IFileSystem& fs,
                                  const std::string& serialNumber,
                                  const IniSection& section)
{
    try {
        return decode_fields(fs, serialNumber, section);
    } catch (const std::exception& ex) {
        VL_LOGE(TAG, "Invalid robot configuration in section '%s': %s",
                serialNumber.c_str(), ex.what());
        std::throw_with_nested(ConfigurationLoadError(
            "invalid robot configuration in section '" + serialNumber + "'"));
    }
}

void encode_section(fs::IFileSystem& fs,
                    const RobotConfiguration& robot,
                    const std::string& baseDirectory,
                    IniSection& section,
                    CertificatePolicy policy)
{
    section.set(key::GUID, robot.guid());
    section.set(key::NAME, robot.robot_name());

    // The path is fixed the first time a section is written.
    if (!section.contains(key::CERT)) {
        section.set(key::CERT, default_certificate_path(baseDirectory, robot));
    }

    if (robot.ip_address()) {
        section.set(key::IP, robot.ip_address()->to_string());
    }

    if (robot.has_remote_host()) {
        section.set(key::REMOTE, *robot.remote_host());
    } else {
        section.remove(key::REMOTE);
    }

    const std::string certPath = *section.find(key::CERT);
    const bool present = fs.exists(certPath);

    if (present && policy == CertificatePolicy::KeepExisting) {
        VL_LOGD(TAG, "Keeping existing certificate '%s' for '%s'",
                certPath.c_str(), robot.serial_number().c_str());
        return;
    }

    if (!fs::write_text_file(fs, certPath, robot.certificate())) {
        VL_LOGE(TAG, "Failed to write certificate '%s' on '%s'",
                certPath.c_str(), fs.name().c_str());
        throw ConfigurationIoError("cannot write certificate file '" + certPath + "'");
    }

    VL_LOGI(TAG, "%s certificate '%s' for '%s'",
            present ? "Rewrote" : "Wrote",
            certPath.c_str(), robot.serial_number().c_str());
}

} // namespace vectorlink::config
