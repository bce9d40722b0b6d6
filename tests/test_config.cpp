/**
 * Service configuration tests
 *
 * Covers:
 *   - Defaults
 *   - Environment and JSON loading, and their precedence
 *   - Validation and derived settings
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <map>
#include <string>

#include "../server/config.hpp"
#include "../server/ingestion_loop.hpp"
#include "../server/logger.hpp"

using std::chrono::milliseconds;

namespace {

ServiceConfig::EnvLookup env_of(const std::map<std::string, std::string>& vars) {
    return [vars](const char* key) -> const char* {
        auto it = vars.find(key);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

bool mentions(const std::vector<std::string>& problems, const std::string& needle) {
    for (const auto& p : problems) {
        if (p.find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

TEST(ServiceConfigTest, DefaultsAreValid) {
    ServiceConfig config;
    EXPECT_EQ(config.udp.port, 12345);
    EXPECT_EQ(config.udp.buffer_size, 1024u);
    EXPECT_EQ(config.influx.url, "http://localhost:8086");
    EXPECT_EQ(config.influx.org, "smartgrid-org");
    EXPECT_EQ(config.influx.bucket, "grid-data");
    EXPECT_EQ(config.buffer.max_size, 100u);
    EXPECT_EQ(config.buffer.retry_attempts, 3u);
    EXPECT_EQ(config.grid.measurement_name, "grid_measurements");
    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.flush_interval(), milliseconds(1000));
    EXPECT_EQ(config.data_format(), DataFormat::Binary);
}

TEST(ServiceConfigTest, LoadsFromEnvironment) {
    ServiceConfig config;
    config.load_from_env(env_of({
        {"UDP_PORT", "23456"},
        {"DATA_FORMAT", "json"},
        {"INFLUX_TOKEN", "abc"},
        {"INFLUX_VERIFY_TLS", "false"},
        {"BUFFER_MAX_SIZE", "250"},
        {"BUFFER_FLUSH_INTERVAL", "0.5"},
        {"BUFFER_RETRY_ATTEMPTS", "5"},
        {"STORAGE_BACKEND", "file"},
        {"GRID_SECTION_TAG", "feeder_7"},
    }));

    EXPECT_EQ(config.udp.port, 23456);
    EXPECT_EQ(config.data_format(), DataFormat::Json);
    EXPECT_EQ(config.influx.token, "abc");
    EXPECT_FALSE(config.influx.verify_tls);
    EXPECT_EQ(config.buffer.max_size, 250u);
    EXPECT_EQ(config.flush_interval(), milliseconds(500));
    EXPECT_EQ(config.retry_policy().retries(), 5u);
    EXPECT_EQ(config.storage.backend, "file");
    EXPECT_EQ(config.grid.grid_section_tag, "feeder_7");
    EXPECT_TRUE(config.validate().empty());
}

TEST(ServiceConfigTest, MalformedEnvironmentValuesThrow) {
    ServiceConfig config;
    EXPECT_THROW(config.load_from_env(env_of({{"UDP_PORT", "12x"}})), ConfigError);
    EXPECT_THROW(config.load_from_env(env_of({{"BUFFER_MAX_SIZE", "-4"}})), ConfigError);
    EXPECT_THROW(config.load_from_env(env_of({{"BUFFER_FLUSH_INTERVAL", "soon"}})), ConfigError);
    EXPECT_THROW(config.load_from_env(env_of({{"INFLUX_VERIFY_TLS", "maybe"}})), ConfigError);
}

TEST(ServiceConfigTest, OutOfRangePortsAreRejectedBeforeNarrowing) {
    ServiceConfig config;
    // 4294979641 wraps to 12345 in a 32-bit int.
    EXPECT_THROW(config.load_from_env(env_of({{"UDP_PORT", "4294979641"}})), ConfigError);
    EXPECT_THROW(config.load_from_env(env_of({{"UDP_PORT", "65536"}})), ConfigError);
    EXPECT_THROW(config.load_from_env(env_of({{"UDP_PORT", "-1"}})), ConfigError);
    EXPECT_THROW(config.load_from_json(nlohmann::json::parse(R"({"udp": {"port": 4294979641}})")), ConfigError);
    EXPECT_EQ(config.udp.port, 12345);

    config.load_from_env(env_of({{"UDP_PORT", "65535"}}));
    EXPECT_EQ(config.udp.port, 65535);
}

TEST(ServiceConfigTest, NonFiniteAndHugeDurationsFailValidation) {
    ServiceConfig config;
    config.load_from_env(env_of({
        {"BUFFER_FLUSH_INTERVAL", "inf"},
        {"BUFFER_RETRY_DELAY", "nan"},
        {"UDP_TIMEOUT", "1e300"},
    }));

    auto problems = config.validate();
    EXPECT_TRUE(mentions(problems, "flush interval"));
    EXPECT_TRUE(mentions(problems, "retry delay"));
    EXPECT_TRUE(mentions(problems, "UDP timeout"));

    ServiceConfig negative;
    negative.buffer.retry_max_delay = -1.0;
    EXPECT_TRUE(mentions(negative.validate(), "retry max delay"));

    ServiceConfig zero_delay;
    zero_delay.buffer.retry_delay = 0.0;
    EXPECT_TRUE(zero_delay.validate().empty());
}

TEST(ServiceConfigTest, JsonSectionsAndEnvPrecedence) {
    ServiceConfig config;
    config.load_from_json(nlohmann::json::parse(R"({
        "udp": {"port": 5000, "data_format": "json"},
        "influx": {"bucket": "lab", "timeout": 2500},
        "buffer": {"max_size": 20, "retry_delay": 0.25},
        "grid": {"data_source_tag": "hil_rig"}
    })"));
    EXPECT_EQ(config.udp.port, 5000);
    EXPECT_EQ(config.influx.bucket, "lab");
    EXPECT_EQ(config.influx.timeout_ms, 2500);
    EXPECT_EQ(config.buffer.max_size, 20u);
    EXPECT_EQ(config.grid.data_source_tag, "hil_rig");
    EXPECT_EQ(config.retry_policy().decide(1, WriteErrorKind::Timeout).delay, milliseconds(250));

    config.load_from_env(env_of({{"UDP_PORT", "6000"}}));
    EXPECT_EQ(config.udp.port, 6000);
    EXPECT_EQ(config.influx.bucket, "lab");
}

TEST(ServiceConfigTest, JsonTypeErrorsBecomeConfigErrors) {
    ServiceConfig config;
    EXPECT_THROW(config.load_from_json(nlohmann::json::parse(R"({"udp": {"port": "high"}})")), ConfigError);
    EXPECT_THROW(config.load_from_json(nlohmann::json::parse(R"({"buffer": {"max_size": -1}})")), ConfigError);
    EXPECT_THROW(config.load_from_json(nlohmann::json::parse("[1, 2]")), ConfigError);
}

TEST(ServiceConfigTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "gridstream_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"storage": {"backend": "file", "file": "/tmp/points.lp"}, "logging": {"level": "debug"}})";
    }
    ServiceConfig config;
    config.load_from_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.storage.backend, "file");
    EXPECT_EQ(config.storage.file, "/tmp/points.lp");
    EXPECT_TRUE(config.validate().empty());

    EXPECT_THROW(config.load_from_file(path), ConfigError);
}

TEST(ServiceConfigTest, ValidationReportsEveryProblem) {
    ServiceConfig config;
    config.udp.port = 70000;
    config.udp.buffer_size = 64;
    config.udp.data_format = "xml";
    config.buffer.max_size = 0;
    config.buffer.flush_interval = 0;
    config.storage.backend = "s3";
    config.logging.level = "LOUD";

    auto problems = config.validate();
    EXPECT_TRUE(mentions(problems, "UDP port"));
    EXPECT_TRUE(mentions(problems, "buffer size"));
    EXPECT_TRUE(mentions(problems, "xml"));
    EXPECT_TRUE(mentions(problems, "max size"));
    EXPECT_TRUE(mentions(problems, "flush interval"));
    EXPECT_TRUE(mentions(problems, "s3"));
    EXPECT_TRUE(mentions(problems, "LOUD"));
}

TEST(ServiceConfigTest, InfluxBackendNeedsBucket) {
    ServiceConfig config;
    config.influx.bucket.clear();
    EXPECT_TRUE(mentions(config.validate(), "bucket"));
}

TEST(ServiceConfigTest, SerializationOmitsToken) {
    ServiceConfig config;
    config.influx.token = "do-not-print";
    EXPECT_EQ(config.to_json().dump().find("do-not-print"), std::string::npos);
}

TEST(ServiceConfigTest, PipelineSettingsFollowConfig) {
    ServiceConfig config;
    config.udp.port = 0;
    config.udp.timeout = 0.2;
    config.buffer.max_size = 7;
    config.buffer.flush_interval = 2.5;

    PipelineSettings s = PipelineSettings::from_config(config);
    EXPECT_EQ(s.port, 0);
    EXPECT_EQ(s.receive_timeout, milliseconds(200));
    EXPECT_EQ(s.max_size, 7u);
    EXPECT_EQ(s.flush_interval, milliseconds(2500));
    EXPECT_EQ(s.retry.max_attempts(), 4u);
}

TEST(LoggerTest, ParsesLevels) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("Error"), LogLevel::Error);
    EXPECT_THROW(Logger::parse_level("verbose"), ConfigError);
}
