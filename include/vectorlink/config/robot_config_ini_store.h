#pragma once

#include <memory>
#include <string>
#include <vector>

#include "vectorlink/config/robot_config_store.h"
#include "vectorlink/config/robot_section_codec.h"
#include "vectorlink/fs/filesystem.h"

namespace vectorlink::config {

struct StoreOptions {
    CertificatePolicy certificatePolicy{CertificatePolicy::KeepExisting};
};

// File-backed implementation of RobotConfigStore.
//
// Each call opens, reads and/or rewrites the file and keeps nothing between
// calls. Certificates are written beside the file. There is no locking: two
// processes saving at once race, and the last rename wins.
class IniRobotConfigStore : public RobotConfigStore {
public:
    // `fs` must outlive the store and every sequence load_all() hands out.
    // `path` must be absolute; a relative one throws ConfigurationIoError.
    IniRobotConfigStore(fs::IFileSystem& fs,
                        std::string      path,
                        StoreOptions     options = {});

    const std::string& path() const noexcept { return _path; }

    RobotConfigurationSequence        load_all() override;
    std::optional<RobotConfiguration> load_default() override;
    void add_or_update(const RobotConfiguration& robot) override;
    void save(const std::vector<RobotConfiguration>& robots) override;

private:
    enum class SaveMode {
        Merge,
        ReplaceAll,
    };

    void save_file(const std::vector<const RobotConfiguration*>& robots, SaveMode mode);
    void write_document(const IniDocument& doc);

    fs::IFileSystem& _fs;
    std::string      _path;       // e.g. "/home/me/.anki_vector/sdk_config.ini"
    std::string      _directory;  // where certificates go
    StoreOptions     _options;
};

} // namespace vectorlink::config
