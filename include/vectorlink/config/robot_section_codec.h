#pragma once

#include <string>

#include "vectorlink/config/ini_document.h"
#include "vectorlink/config/robot_configuration.h"
#include "vectorlink/fs/filesystem.h"

namespace vectorlink::config {

// Keys understood in a robot section. Any other key is left alone.
namespace key {
inline constexpr const char* GUID   = "guid";
inline constexpr const char* NAME   = "name";
inline constexpr const char* IP     = "ip";
inline constexpr const char* CERT   = "cert";
inline constexpr const char* REMOTE = "remote";
} // namespace key

// What encode_section() does when the certificate file already exists.
enum class CertificatePolicy {
    KeepExisting, // never touch an existing file (protects rotated certificates)
    Overwrite,    // rewrite it from the entry's in-memory certificate
};

// "{baseDirectory}/{robotName}-{serialNumber}.cert"
std::string default_certificate_path(const std::string& baseDirectory,
                                     const RobotConfiguration& robot);

// Builds an entry from one section. The `cert` path is replaced by the
// file's contents. Any failure is thrown as ConfigurationLoadError with the
// underlying error nested inside it.
RobotConfiguration decode_section(fs::IFileSystem& fs,
                                  const std::string& serialNumber,
                                  const IniSection& section);

// Writes `robot` into `section` in place and materializes its certificate
// file when none exists yet at the section's `cert` path.
// A `cert` path already present in the section is kept as is.
// Throws ConfigurationIoError if the certificate cannot be written.
void encode_section(fs::IFileSystem& fs,
                    const RobotConfiguration& robot,
                    const std::string& baseDirectory,
                    IniSection& section,
                    CertificatePolicy policy = CertificatePolicy::KeepExisting);

} // namespace vectorlink::config
