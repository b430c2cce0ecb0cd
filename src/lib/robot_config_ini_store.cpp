#include "vectorlink/config/robot_config_ini_store.h"
#include "vectorlink/config/config_errors.h"
#include "vectorlink/core/logging.h"
#include "vectorlink/fs/file_text.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace vectorlink::config {

static constexpr const char* TAG = "robot_config";

// Collects every problem in the batch so one exception reports all of them.
static void validate_all(const std::vector<const RobotConfiguration*>& robots)
{
    std::string problems;
    std::size_t invalid = 0;
    std::vector<std::string> seen;

    for (std::size_t i = 0; i < robots.size(); ++i) {
        const RobotConfiguration& r = *robots[i];
        const std::string label = r.serial_number().empty()
            ? "#" + std::to_string(i)
            : "'" + r.serial_number() + "'";

        std::string what;
        for (const auto& f : r.missing_fields()) {
            what += what.empty() ? "missing " : ", ";
            what += f;
        }
        for (const auto& m : r.malformed_fields()) {
            what += what.empty() ? "" : "; ";
            what += m;
        }
        if (!r.serial_number().empty()) {
            if (std::find(seen.begin(), seen.end(), r.serial_number()) != seen.end()) {
                what += what.empty() ? "" : "; ";
                what += "duplicate serial number";
            }
            seen.push_back(r.serial_number());
        }

        if (!what.empty()) {
            ++invalid;
            problems += problems.empty() ? "" : "; ";
            problems += label + ": " + what;
        }
    }

    if (invalid > 0) {
        VL_LOGE(TAG, "Refusing to save: %s", problems.c_str());
        throw ConfigurationValidationError(
            std::to_string(invalid) + " invalid robot configuration(s): " + problems);
    }
}

static std::shared_ptr<const IniDocument> read_document(fs::IFileSystem& fs, const std::string& path)
{
    if (!fs.exists(path)) {
        VL_LOGD(TAG, "No robot configuration at '%s' on '%s'",
                path.c_str(), fs.name().c_str());
        return nullptr;
    }

    std::string text;
    if (!fs::read_text_file(fs, path, text)) {
        throw ConfigurationIoError("cannot read robot configuration file '" + path + "'");
    }

    try {
        return std::make_shared<const IniDocument>(IniDocument::parse(text));
    } catch (const ConfigurationLoadError& ex) {
        VL_LOGE(TAG, "Malformed robot configuration '%s': %s", path.c_str(), ex.what());
        std::throw_with_nested(ConfigurationLoadError(
            "malformed robot configuration file '" + path + "'"));
    }
}

IniRobotConfigStore::IniRobotConfigStore(fs::IFileSystem& fs,
                                         std::string      path,
                                         StoreOptions     options)
    : _fs(fs)
    , _path(std::move(path))
    , _directory(fs::parent_path(_path))
    , _options(options)
{
    // The host filesystem is rooted at "/"; a relative path would land there
    // instead of the working directory.
    if (_path.empty() || _path.front() != '/') {
        VL_LOGE(TAG, "Robot configuration path '%s' is not absolute", _path.c_str());
        throw ConfigurationIoError("robot configuration path must be absolute: '" + _path + "'");
    }
}

RobotConfigurationSequence IniRobotConfigStore::load_all()
{
    fs::IFileSystem& fs = _fs;
    const std::string path = _path;
    return RobotConfigurationSequence(
        [&fs, path]() { return read_document(fs, path); },
        [&fs](const IniSection& section) {
            return decode_section(fs, section.name(), section);
        });
}

std::optional<RobotConfiguration> IniRobotConfigStore::load_default()
{
    const auto robots = load_all();
    auto it = robots.begin();
    if (it == robots.end()) {
        return std::nullopt;
    }
    return *it;
}

void IniRobotConfigStore::add_or_update(const RobotConfiguration& robot)
{
    save_file({&robot}, SaveMode::Merge);
}

void IniRobotConfigStore::save(const std::vector<RobotConfiguration>& robots)
{
    std::vector<const RobotConfiguration*> ptrs;
    ptrs.reserve(robots.size());
    for (const auto& r : robots) {
        ptrs.push_back(&r);
    }
    save_file(ptrs, SaveMode::ReplaceAll);
}

void IniRobotConfigStore::save_file(const std::vector<const RobotConfiguration*>& robots,
                                    SaveMode mode)
{
    // Nothing touches the disk until the whole batch is known to be valid.
    validate_all(robots);

    if (!fs::create_directories(_fs, _directory)) {
        throw ConfigurationIoError("cannot create directory '" + _directory + "'");
    }

    const auto current = read_document(_fs, _path);
    IniDocument doc = current ? *current : IniDocument{};

    std::vector<std::string> serials;
    serials.reserve(robots.size());

    for (const RobotConfiguration* robot : robots) {
        IniSection& section = doc.get_or_add(robot->serial_number());
        encode_section(_fs, *robot, _directory, section, _options.certificatePolicy);
        serials.push_back(robot->serial_number());
    }

    if (mode == SaveMode::ReplaceAll) {
        const std::size_t removed = doc.retain_only(serials);
        if (removed > 0) {
            VL_LOGI(TAG, "Removed %zu robot configuration(s) from '%s'",
                    removed, _path.c_str());
        }
    }

    write_document(doc);

    VL_LOGI(TAG, "Saved %zu robot configuration(s) to '%s' on '%s'",
            doc.size(), _path.c_str(), _fs.name().c_str());
}

void IniRobotConfigStore::write_document(const IniDocument& doc)
{
    // Write beside the target and swap it in, so readers never see half a file.
    const std::string tmp = _path + ".tmp";

    if (!fs::write_text_file(_fs, tmp, doc.serialize())) {
        (void)_fs.removeFile(tmp);
        throw ConfigurationIoError("cannot write robot configuration file '" + tmp + "'");
    }

    if (!_fs.rename(tmp, _path)) {
        (void)_fs.removeFile(tmp);
        throw ConfigurationIoError("cannot replace robot configuration file '" + _path + "'");
    }
}

} // namespace vectorlink::config
