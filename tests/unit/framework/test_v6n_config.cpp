#include "catch.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "config/v6n_config_file.hpp"
#include "config/v6n_config_utils.hpp"

using namespace v6net::config;
using namespace v6net::config::file;

static constexpr std::string_view test_config = R"(
core:
  log:
    level: debug
format:
  profiles:
    report: "l"
    compact: "st"
    broken: "sx"
  width: 39
)";

/* Write a config file that is removed when the test is done */
class temp_config_file
{
    std::string m_name;

public:
    explicit temp_config_file(std::string_view contents)
    {
        char name[] = "/tmp/v6net_config_XXXXXX";
        auto fd = mkstemp(name);
        REQUIRE(fd != -1);
        close(fd);
        m_name = name;

        std::ofstream out(m_name);
        out << contents;
    }

    ~temp_config_file() { unlink(m_name.c_str()); }

    const std::string& name() const { return (m_name); }
};

TEST_CASE("check configuration file loading", "[config]")
{
    v6n_config_reset();

    SECTION("missing file")
    {
        auto result = v6n_config_file_load("/nonexistent/v6net.yaml");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().find("/nonexistent/v6net.yaml")
                != std::string::npos);
        REQUIRE(v6n_config_get_file_name().empty());
    }

    SECTION("invalid yaml")
    {
        temp_config_file file("core: [unterminated");
        REQUIRE_FALSE(v6n_config_file_load(file.name()));
    }

    SECTION("top level must be a map")
    {
        temp_config_file file("- one\n- two\n");
        REQUIRE_FALSE(v6n_config_file_load(file.name()));
    }

    SECTION("valid file")
    {
        temp_config_file file(test_config);
        REQUIRE(v6n_config_file_load(file.name()));
        REQUIRE(v6n_config_get_file_name() == file.name());
        REQUIRE(v6n_config_get_param<std::string>("core.log.level") == "debug");
    }

    SECTION("file name outlives a reload")
    {
        temp_config_file file(test_config);
        REQUIRE(v6n_config_file_load(file.name()));
        auto name = v6n_config_get_file_name();

        REQUIRE(v6n_config_load_string("core: {}"));
        REQUIRE(v6n_config_get_file_name().empty());
        REQUIRE(name == file.name());
    }

    SECTION("file from the command line")
    {
        temp_config_file file(test_config);
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("--config"),
                                   const_cast<char*>(file.name().c_str()),
                                   nullptr};
        REQUIRE(v6n_config_file_find(args.size() - 1, args.data()));
        REQUIRE(v6n_config_get_file_name() == file.name());
    }

    SECTION("no file on the command line")
    {
        std::vector<char*> args = {const_cast<char*>("test_program"),
                                   const_cast<char*>("-l"),
                                   const_cast<char*>("info"),
                                   nullptr};
        REQUIRE(v6n_config_file_find(args.size() - 1, args.data()));
        REQUIRE_FALSE(v6n_config_get_param("core"));
    }

    v6n_config_reset();
}

TEST_CASE("check configuration parameter lookup", "[config]")
{
    REQUIRE(v6n_config_load_string(test_config));

    SECTION("nodes by path")
    {
        auto profiles = v6n_config_get_param("format.profiles");
        REQUIRE(profiles);
        REQUIRE(profiles->IsMap());
        REQUIRE(profiles->size() == 3);
    }

    SECTION("typed values")
    {
        REQUIRE(v6n_config_get_param<int>("format.width") == 39);
        REQUIRE(v6n_config_get_param<std::string>("format.profiles.compact")
                == "st");
        REQUIRE_THROWS_AS(v6n_config_get_param<int>("format.profiles"),
                          YAML::BadConversion);
    }

    SECTION("missing values")
    {
        REQUIRE_FALSE(v6n_config_get_param("format.colors"));
        REQUIRE_FALSE(v6n_config_get_param("core.log.level.deeper"));
        REQUIRE_FALSE(v6n_config_get_param<std::string>("nope"));
    }

    SECTION("lookups return copies")
    {
        auto level = v6n_config_get_param("core.log");
        REQUIRE(level);
        (*level)["level"] = "trace";
        REQUIRE(v6n_config_get_param<std::string>("core.log.level") == "debug");
    }

    v6n_config_reset();
}

struct file_closer
{
    void operator()(FILE* f) const { fclose(f); }
};

/* Send log output to a file for the lifetime of the guard */
class log_stream_guard
{
public:
    explicit log_stream_guard(FILE* stream) { v6n_log_stream_set(stream); }
    ~log_stream_guard() { v6n_log_stream_set(nullptr); }
};

TEST_CASE("check configuration utility functions", "[config]")
{
    /* Applying a debug level logs at debug; keep that out of test output */
    std::unique_ptr<FILE, file_closer> sink(tmpfile());
    REQUIRE(sink);
    log_stream_guard guard(sink.get());

    auto original = v6n_log_level_get();

    SECTION("log level")
    {
        REQUIRE(v6n_config_load_string(test_config));
        auto level = v6n_config_log_level();
        REQUIRE(level);
        REQUIRE(*level == V6N_LOG_DEBUG);
        REQUIRE(v6n_log_level_get() == V6N_LOG_DEBUG);

        rewind(sink.get());
        char line[256] = {};
        REQUIRE(fgets(line, sizeof(line), sink.get()) != nullptr);
        REQUIRE(std::string(line).find("Log level set to debug")
                != std::string::npos);
    }

    SECTION("numeric log level")
    {
        REQUIRE(v6n_config_load_string("core:\n  log:\n    level: 2\n"));
        REQUIRE(v6n_config_log_level() == V6N_LOG_ERROR);
    }

    SECTION("invalid log level")
    {
        REQUIRE(v6n_config_load_string("core:\n  log:\n    level: loud\n"));
        REQUIRE_FALSE(v6n_config_log_level());
        REQUIRE(v6n_log_level_get() == original);
    }

    SECTION("no log level keeps the current one")
    {
        v6n_config_reset();
        REQUIRE(v6n_config_log_level() == original);
    }

    SECTION("format profiles")
    {
        REQUIRE(v6n_config_load_string(test_config));
        REQUIRE(v6n_config_format_profile("report") == v6net::format_long);
        REQUIRE(v6n_config_format_profile("compact")
                == v6net::format_options{v6net::compression_mode::compress,
                                         v6net::padding_mode::trim});

        auto broken = v6n_config_format_profile("broken");
        REQUIRE_FALSE(broken);
        REQUIRE(broken.error().find("broken") != std::string::npos);

        REQUIRE_FALSE(v6n_config_format_profile("missing"));
    }

    v6n_log_level_set(original);
    v6n_config_reset();
}
