#include "doctest.h"

#include "vectorlink/config/robot_config_ini_store.h"
#include "vectorlink/fs/file_text.h"
#include "vectorlink/fs/fs_stdio.h"
#include "vectorlink/platform/robot_config_store_factory.h"
#include "vectorlink/platform/user_profile.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace vectorlink::tests {

using vectorlink::config::IniRobotConfigStore;
using vectorlink::config::RobotConfiguration;

namespace {

// Temporary directory removed on scope exit.
class TempDir {
public:
    TempDir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path() / "vectorlink-XXXXXX").string();
        if (::mkdtemp(tmpl.data())) {
            _path = tmpl;
        }
    }

    ~TempDir()
    {
        if (!_path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }
    }

    const std::string& path() const { return _path; }

private:
    std::string _path;
};

} // namespace

TEST_CASE("stdio store: save into an empty directory, then load it back")
{
    TempDir tmp;
    REQUIRE_FALSE(tmp.path().empty());

    auto host = platform::create_host_filesystem();
    const std::string dir  = tmp.path() + "/.anki_vector";
    const std::string path = dir + "/sdk_config.ini";

    IniRobotConfigStore store(*host, path);

    const RobotConfiguration robot("00e20142", "Vector-E5S6", "g1", "PEM...");
    store.save({robot});

    CHECK(host->isDirectory(dir));

    std::string text;
    REQUIRE(fs::read_text_file(*host, path, text));
    CHECK(text ==
          "[00e20142]\n"
          "guid=g1\n"
          "name=Vector-E5S6\n"
          "cert=" + dir + "/Vector-E5S6-00e20142.cert\n");

    std::string pem;
    REQUIRE(fs::read_text_file(*host, dir + "/Vector-E5S6-00e20142.cert", pem));
    CHECK(pem == "PEM...");
    CHECK_FALSE(host->exists(path + ".tmp"));

    const auto loaded = store.load_all().to_vector();
    REQUIRE(loaded.size() == 1);
    CHECK(loaded[0] == robot);
    CHECK_FALSE(loaded[0].ip_address().has_value());
    CHECK_FALSE(loaded[0].remote_host().has_value());
}

TEST_CASE("stdio filesystem: a rooted filesystem maps paths under its root")
{
    TempDir tmp;
    REQUIRE_FALSE(tmp.path().empty());

    auto rooted = fs::create_stdio_filesystem(tmp.path(), "tmp");
    CHECK(fs::create_directories(*rooted, "/a/b/c"));
    CHECK(rooted->isDirectory("/a/b"));
    CHECK(fs::write_text_file(*rooted, "/a/b/c/f.txt", "hello"));
    CHECK(std::filesystem::exists(tmp.path() + "/a/b/c/f.txt"));

    std::string back;
    CHECK(fs::read_text_file(*rooted, "/a/b/c/f.txt", back));
    CHECK(back == "hello");

    CHECK(rooted->rename("/a/b/c/f.txt", "/a/g.txt"));
    CHECK(rooted->exists("/a/g.txt"));
    CHECK(rooted->removeFile("/a/g.txt"));
    CHECK_FALSE(rooted->exists("/a/g.txt"));
}

TEST_CASE("platform: default path lives under the user profile")
{
    TempDir tmp;
    REQUIRE_FALSE(tmp.path().empty());

    const char* oldHome = std::getenv("HOME");
    const std::string saved = oldHome ? oldHome : "";
    ::setenv("HOME", tmp.path().c_str(), 1);

    CHECK(platform::user_profile_directory() == tmp.path());
    CHECK(platform::default_robot_config_path() == tmp.path() + "/.anki_vector/sdk_config.ini");

    auto host  = platform::create_host_filesystem();
    auto store = platform::create_default_robot_config_store(*host);
    store->add_or_update(RobotConfiguration("00e20142", "Vector-E5S6", "g1", "PEM..."));
    CHECK(std::filesystem::exists(tmp.path() + "/.anki_vector/Vector-E5S6-00e20142.cert"));

    auto first = store->load_default();
    REQUIRE(first.has_value());
    CHECK(first->robot_name() == "Vector-E5S6");

    if (oldHome) {
        ::setenv("HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("HOME");
    }
}

} // namespace vectorlink::tests
