#include "doctest.h"

#include "fake_fs.h"

#include "vectorlink/config/config_errors.h"
#include "vectorlink/config/ini_document.h"
#include "vectorlink/config/robot_section_codec.h"

#include <exception>
#include <string>

namespace vectorlink::tests {

using vectorlink::config::CertificatePolicy;
using vectorlink::config::ConfigurationIoError;
using vectorlink::config::ConfigurationLoadError;
using vectorlink::config::IniDocument;
using vectorlink::config::IniSection;
using vectorlink::config::RobotConfiguration;
using vectorlink::config::decode_section;
using vectorlink::config::default_certificate_path;
using vectorlink::config::encode_section;
using vectorlink::net::IpAddress;

namespace {

const std::string BASE = "/home/me/.anki_vector";

RobotConfiguration make_robot()
{
    return RobotConfiguration("00e20142", "Vector-E5S6", "g1", "PEM...");
}

MemoryFileSystem make_fs()
{
    MemoryFileSystem fs;
    fs.create_dirs(BASE);
    return fs;
}

// True if `ex` has a nested exception of type E somewhere below it.
template <typename E>
bool has_nested(const std::exception& ex)
{
    try {
        std::rethrow_if_nested(ex);
    } catch (const E&) {
        return true;
    } catch (const std::exception& inner) {
        return has_nested<E>(inner);
    }
    return false;
}

} // namespace

TEST_CASE("codec: default certificate path is <dir>/<name>-<serial>.cert")
{
    CHECK(default_certificate_path(BASE, make_robot()) ==
          "/home/me/.anki_vector/Vector-E5S6-00e20142.cert");
}

TEST_CASE("codec: encode writes the recognized keys and materializes the certificate")
{
    auto fs = make_fs();
    IniSection section("00e20142");

    auto robot = make_robot();
    robot.set_ip_address(IpAddress::v4(192, 168, 1, 20));
    robot.set_remote_host(std::string("relay.example.com:443"));

    encode_section(fs, robot, BASE, section);

    const std::string cert = BASE + "/Vector-E5S6-00e20142.cert";
    CHECK(*section.find("guid") == "g1");
    CHECK(*section.find("name") == "Vector-E5S6");
    CHECK(*section.find("cert") == cert);
    CHECK(*section.find("ip") == "192.168.1.20");
    CHECK(*section.find("remote") == "relay.example.com:443");
    CHECK(fs.file_text(cert) == "PEM...");
}

TEST_CASE("codec: decode(encode(e)) reproduces every field")
{
    auto fs = make_fs();
    IniSection section("00e20142");

    auto robot = make_robot();
    robot.set_ip_address(IpAddress::parse("fe80::1"));
    robot.set_remote_host(std::string("relay:443"));

    encode_section(fs, robot, BASE, section);
    const auto decoded = decode_section(fs, "00e20142", section);

    CHECK(decoded == robot);
}

TEST_CASE("codec: values starting with '=', ';' or '#' survive a trip through the file")
{
    auto fs = make_fs();
    IniDocument doc;

    RobotConfiguration robot("00e20142", "Vector-E5S6", "=g1", "PEM...");
    robot.set_remote_host(std::string(";relay#1:443"));

    encode_section(fs, robot, BASE, doc.get_or_add("00e20142"));
    const auto reparsed = IniDocument::parse(doc.serialize());
    const IniSection* section = reparsed.find("00e20142");
    REQUIRE(section != nullptr);

    CHECK(*section->find("guid") == "=g1");
    CHECK(*section->find("remote") == ";relay#1:443");
    CHECK(decode_section(fs, "00e20142", *section) == robot);
}

TEST_CASE("codec: an existing cert path is never moved")
{
    auto fs = make_fs();
    fs.create_dirs("/keys");
    auto doc = IniDocument::parse("[00e20142]\ncert=/keys/custom.cert\n");
    auto& section = doc.get_or_add("00e20142");

    auto robot = make_robot();
    robot.set_robot_name("Vector-Z9Z9"); // renamed robot

    encode_section(fs, robot, BASE, section);

    CHECK(*section.find("cert") == "/keys/custom.cert");
    CHECK(fs.file_text("/keys/custom.cert") == "PEM...");
    CHECK_FALSE(fs.has_file(BASE + "/Vector-Z9Z9-00e20142.cert"));
}

TEST_CASE("codec: an existing certificate file is not overwritten by default")
{
    auto fs = make_fs();
    const std::string cert = BASE + "/Vector-E5S6-00e20142.cert";
    fs.create_file(cert, "ROTATED");

    IniSection section("00e20142");
    encode_section(fs, make_robot(), BASE, section);

    CHECK(fs.file_text(cert) == "ROTATED");
}

TEST_CASE("codec: CertificatePolicy::Overwrite rewrites an existing certificate")
{
    auto fs = make_fs();
    const std::string cert = BASE + "/Vector-E5S6-00e20142.cert";
    fs.create_file(cert, "STALE");

    IniSection section("00e20142");
    encode_section(fs, make_robot(), BASE, section, CertificatePolicy::Overwrite);

    CHECK(fs.file_text(cert) == "PEM...");
}

TEST_CASE("codec: empty remote host removes the key; absent ip leaves the old one")
{
    auto fs = make_fs();
    auto doc = IniDocument::parse("[00e20142]\nip=10.0.0.9\nremote=relay:443\ncolour=blue\n");
    auto& section = doc.get_or_add("00e20142");

    auto robot = make_robot();
    robot.set_remote_host(std::string("  "));

    encode_section(fs, robot, BASE, section);

    CHECK_FALSE(section.contains("remote"));
    REQUIRE(section.contains("ip"));
    CHECK(*section.find("ip") == "10.0.0.9");
    CHECK(*section.find("colour") == "blue");
}

TEST_CASE("codec: certificate write failure is an I/O error")
{
    auto fs = make_fs();
    const std::string cert = BASE + "/Vector-E5S6-00e20142.cert";
    fs.make_unwritable(cert);

    IniSection section("00e20142");
    CHECK_THROWS_AS(encode_section(fs, make_robot(), BASE, section), ConfigurationIoError);
}

TEST_CASE("codec: decode reads optional keys only when present")
{
    auto fs = make_fs();
    fs.create_file(BASE + "/c.cert", "PEM...");
    auto doc = IniDocument::parse("[00e20142]\nguid=g1\nname=Vector-E5S6\ncert=" + BASE + "/c.cert\n");

    const auto robot = decode_section(fs, "00e20142", *doc.find("00e20142"));
    CHECK(robot.serial_number() == "00e20142");
    CHECK(robot.guid() == "g1");
    CHECK(robot.robot_name() == "Vector-E5S6");
    CHECK(robot.certificate() == "PEM...");
    CHECK_FALSE(robot.ip_address().has_value());
    CHECK_FALSE(robot.remote_host().has_value());
    CHECK_FALSE(robot.has_remote_host());
}

TEST_CASE("codec: missing certificate file fails the section with the I/O cause nested")
{
    auto fs = make_fs();
    auto doc = IniDocument::parse("[00e20142]\nguid=g1\nname=Vector-E5S6\ncert=/nowhere.cert\n");

    try {
        decode_section(fs, "00e20142", *doc.find("00e20142"));
        FAIL("expected ConfigurationLoadError");
    } catch (const ConfigurationLoadError& ex) {
        CHECK(std::string(ex.what()).find("00e20142") != std::string::npos);
        CHECK(has_nested<ConfigurationIoError>(ex));
    }
}

TEST_CASE("codec: unreadable certificate file fails the section")
{
    auto fs = make_fs();
    fs.create_file(BASE + "/c.cert", "PEM...");
    fs.make_unreadable(BASE + "/c.cert");
    auto doc = IniDocument::parse("[s]\nguid=g1\nname=n\ncert=" + BASE + "/c.cert\n");

    CHECK_THROWS_AS(decode_section(fs, "s", *doc.find("s")), ConfigurationLoadError);
}

TEST_CASE("codec: missing cert key or bad ip fails the section")
{
    auto fs = make_fs();
    fs.create_file(BASE + "/c.cert", "PEM...");

    auto noCert = IniDocument::parse("[s]\nguid=g1\nname=n\n");
    CHECK_THROWS_AS(decode_section(fs, "s", *noCert.find("s")), ConfigurationLoadError);

    auto badIp = IniDocument::parse("[s]\nguid=g1\nname=n\nip=vector.local\ncert=" + BASE + "/c.cert\n");
    CHECK_THROWS_AS(decode_section(fs, "s", *badIp.find("s")), ConfigurationLoadError);
}

} // namespace vectorlink::tests
