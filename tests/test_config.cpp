#include <doctest/doctest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "fmo/config.hpp"
using namespace fmo;
using json = nlohmann::json;
namespace fs = std::filesystem;

// Scratch directory removed at scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        path = fs::temp_directory_path() / ("fmo-config-test-" + std::to_string(::getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() { std::error_code ec; fs::remove_all(path, ec); }
    std::string file(const char* name) const { return (path / name).string(); }
    void write(const char* name, const std::string& text) const {
        std::ofstream(path / name) << text;
    }
};

TEST_CASE("defaults match the documented values") {
    AppConfig c;
    std::string err;
    REQUIRE(config_from_json(default_config_json(), c, err));
    CHECK(c.echo.timeout == doctest::Approx(5.0));
    CHECK(c.echo.echo_uid == 65535);
    CHECK(c.echo.callsign_prefix == "RE>");
    CHECK(c.echo.check_interval == doctest::Approx(0.1));
    CHECK(c.echo.max_buffered == 0);
    CHECK(c.link.device == "-");
    CHECK(c.link.baud == 115200);
    CHECK(c.logging.level == "INFO");
    CHECK(c.logging.console);
    CHECK(c.logging.file.empty());
}

TEST_CASE("missing file yields defaults") {
    TempDir d;
    AppConfig c;
    bool from_file = true;
    std::string err;
    REQUIRE(load_config(d.file("nope.json"), c, from_file, err));
    CHECK_FALSE(from_file);
    CHECK(c.echo.timeout == doctest::Approx(5.0));
}

TEST_CASE("partial file is deep-merged over defaults") {
    TempDir d;
    d.write("c.json", R"({ "echo": { "timeout": 2.5 }, "logging": { "level": "DEBUG" } })");
    AppConfig c;
    bool from_file = false;
    std::string err;
    REQUIRE(load_config(d.file("c.json"), c, from_file, err));
    CHECK(from_file);
    CHECK(c.echo.timeout == doctest::Approx(2.5));
    CHECK(c.echo.echo_uid == 65535);                 // untouched sibling keeps its default
    CHECK(c.echo.callsign_prefix == "RE>");
    CHECK(c.logging.level == "DEBUG");
    CHECK(c.logging.console);
}

TEST_CASE("deep_merge merges objects and replaces scalars and arrays") {
    const json base    = {{"a", {{"x", 1}, {"y", 2}}}, {"b", json::array({1, 2, 3})}, {"c", "keep"}};
    const json overlay = {{"a", {{"y", 20}, {"z", 30}}}, {"b", json::array({9})}};
    const json m = deep_merge(base, overlay);
    CHECK(m["a"]["x"] == 1);
    CHECK(m["a"]["y"] == 20);
    CHECK(m["a"]["z"] == 30);
    CHECK(m["b"] == json::array({9}));
    CHECK(m["c"] == "keep");
}

TEST_CASE("validation rejects out-of-range and mistyped values") {
    std::string err;
    auto with = [](const char* section, const char* key, const json& v) {
        json j = default_config_json();
        j[section][key] = v;
        return j;
    };

    CHECK(validate_config(default_config_json(), err));

    CHECK_FALSE(validate_config(with("echo", "timeout", 0), err));
    CHECK(err.find("echo.timeout") != std::string::npos);
    CHECK_FALSE(validate_config(with("echo", "timeout", -1.5), err));
    CHECK_FALSE(validate_config(with("echo", "timeout", "5"), err));

    CHECK(validate_config(with("echo", "uid", 0), err));
    CHECK(validate_config(with("echo", "uid", 65535), err));
    CHECK_FALSE(validate_config(with("echo", "uid", 65536), err));
    CHECK_FALSE(validate_config(with("echo", "uid", -1), err));
    CHECK_FALSE(validate_config(with("echo", "uid", 1.5), err));

    CHECK_FALSE(validate_config(with("echo", "callsign_prefix", 5), err));
    CHECK_FALSE(validate_config(with("echo", "check_interval", 10.0), err));   // > timeout
    CHECK_FALSE(validate_config(with("echo", "max_buffered", -3), err));

    CHECK_FALSE(validate_config(with("link", "device", ""), err));
    CHECK_FALSE(validate_config(with("link", "baud", 0), err));

    CHECK(validate_config(with("logging", "level", "warning"), err));
    CHECK_FALSE(validate_config(with("logging", "level", "LOUD"), err));
    CHECK_FALSE(validate_config(with("logging", "console", "yes"), err));

    json missing = default_config_json();
    missing.erase("echo");
    CHECK_FALSE(validate_config(missing, err));
    CHECK(err.find("missing_section") != std::string::npos);
}

TEST_CASE("periods over one day and ints past INT_MAX are rejected") {
    std::string err;
    auto with = [](const char* section, const char* key, const json& v) {
        json j = default_config_json();
        j[section][key] = v;
        return j;
    };

    CHECK_FALSE(validate_config(with("echo", "timeout", 1e10), err));
    CHECK(err.find("must_not_exceed_86400") != std::string::npos);
    CHECK(err.find("echo.timeout") != std::string::npos);

    json j = default_config_json();
    j["echo"]["timeout"] = 86400.0;
    CHECK(validate_config(j, err));
    j["echo"]["timeout"] = 86400.5;
    CHECK_FALSE(validate_config(j, err));

    // check_interval is bounded through timeout
    j = default_config_json();
    j["echo"]["check_interval"] = 1e10;
    CHECK_FALSE(validate_config(j, err));
    CHECK(err.find("echo.check_interval") != std::string::npos);

    CHECK_FALSE(validate_config(with("link", "boot_delay_ms", 4294967296LL), err));
    CHECK(err.find("link.boot_delay_ms") != std::string::npos);
    CHECK_FALSE(validate_config(with("link", "baud", 2147483648LL), err));
    CHECK(err.find("link.baud") != std::string::npos);
    CHECK(validate_config(with("link", "boot_delay_ms", 2147483647LL), err));

    AppConfig c;
    CHECK_FALSE(config_from_json(with("echo", "timeout", 1e10), c, err));
}

TEST_CASE("callsign prefix must be valid UTF-8") {
    std::string err;
    json j = default_config_json();
    j["echo"]["callsign_prefix"] = std::string("RE\xFF");
    CHECK_FALSE(validate_config(j, err));
    CHECK(err.find("must_be_utf8") != std::string::npos);
    CHECK(err.find("echo.callsign_prefix") != std::string::npos);

    j["echo"]["callsign_prefix"] = std::string("\xE5\x9B\x9E>");   // "回>"
    CHECK(validate_config(j, err));
}

TEST_CASE("unparsable or non-object files are errors, not defaults") {
    TempDir d;
    d.write("bad.json", "{ echo: ");
    d.write("arr.json", "[1, 2]");
    AppConfig c;
    bool from_file = false;
    std::string err;
    CHECK_FALSE(load_config(d.file("bad.json"), c, from_file, err));
    CHECK(err.find("config_parse_failed") != std::string::npos);
    CHECK_FALSE(load_config(d.file("arr.json"), c, from_file, err));
    CHECK(err.find("config_not_object") != std::string::npos);
}

TEST_CASE("generated config loads back to the defaults") {
    TempDir d;
    const std::string p = d.file("sub/generated.json");
    std::string err;
    REQUIRE(save_default_config(p, err));
    CHECK(fs::exists(p));
    CHECK_FALSE(fs::exists(p + ".tmp"));

    AppConfig c;
    bool from_file = false;
    REQUIRE(load_config(p, c, from_file, err));
    CHECK(from_file);
    CHECK(config_to_json(c) == default_config_json());
}
