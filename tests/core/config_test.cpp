// vodlink - Tests for configuration loading
//
// Tests cover:
// - Defaults when nothing is given
// - Command line, INI file and VODLINK_* environment sources
// - Rejection of unusable streaming settings

#include <gtest/gtest.h>
#include <stdlib.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "config.hpp"

namespace vodlink {
namespace test {

namespace {

po::variables_map parse(std::vector<std::string> args,
						const po::options_description &desc) {
	std::vector<const char *> argv{"vodlinkctl"};
	for (const auto &a : args) { argv.push_back(a.c_str()); }

	po::options_description all;
	all.add(desc);
	all.add_options()("config", po::value<std::string>());

	po::variables_map vm;
	po::store(po::parse_command_line(static_cast<int>(argv.size()),
									 argv.data(), all),
			  vm);
	return vm;
}

}  // namespace

class ConfigTest : public ::testing::Test {
   protected:
	void TearDown() override {
		::unsetenv("VODLINK_KEY_PREFIX");
		::unsetenv("VODLINK_CHUNK_SIZE");
		if (!config_file_.empty()) { std::filesystem::remove(config_file_); }
	}

	std::string write_config(const std::string &contents) {
		config_file_ = (std::filesystem::temp_directory_path() /
						"vodlink_config_test.ini")
						   .string();
		std::ofstream(config_file_) << contents;
		return config_file_;
	}

	std::string config_file_;
};

// =============================================================================
// Sources
// =============================================================================

TEST_F(ConfigTest, DefaultsMatchConfigStruct) {
	auto desc = config_options();
	auto vm = parse({}, desc);
	load_config_sources(vm, desc);

	Config config;
	apply_config(vm, config);

	const Config defaults;
	EXPECT_EQ(config.redis_uri, defaults.redis_uri);
	EXPECT_EQ(config.key_prefix, "vodlink:");
	EXPECT_EQ(config.session_ttl, std::chrono::seconds(3600));
	EXPECT_EQ(config.lock_ttl, std::chrono::milliseconds(10000));
	EXPECT_EQ(config.chunk_size, 8192u);
	EXPECT_EQ(config.stop_check_interval, 100);
	EXPECT_EQ(config.cleanup_delay, std::chrono::milliseconds(1000));
	EXPECT_EQ(config.stale_max_age, std::chrono::seconds(1800));
	EXPECT_EQ(config.match.threshold, 13);
	EXPECT_FALSE(config.worker_id.empty());
}

TEST_F(ConfigTest, CommandLineOverridesDefaults) {
	auto desc = config_options();
	auto vm = parse({"--redis-uri", "tcp://redis:6380", "--match-threshold",
					 "20", "--worker-id", "w-1"},
					desc);
	load_config_sources(vm, desc);

	Config config;
	apply_config(vm, config);
	EXPECT_EQ(config.redis_uri, "tcp://redis:6380");
	EXPECT_EQ(config.match.threshold, 20);
	EXPECT_EQ(config.worker_id, "w-1");
}

TEST_F(ConfigTest, ReadsIniFileAndEnvironment) {
	auto path = write_config("session-ttl = 600\nlock-wait-ms = 250\n");
	::setenv("VODLINK_KEY_PREFIX", "staging:", 1);

	auto desc = config_options();
	auto vm = parse({"--config", path}, desc);
	load_config_sources(vm, desc);

	Config config;
	apply_config(vm, config);
	EXPECT_EQ(config.session_ttl, std::chrono::seconds(600));
	EXPECT_EQ(config.lock_wait, std::chrono::milliseconds(250));
	EXPECT_EQ(config.key_prefix, "staging:");
}

TEST_F(ConfigTest, CommandLineWinsOverEnvironment) {
	::setenv("VODLINK_KEY_PREFIX", "env:", 1);

	auto desc = config_options();
	auto vm = parse({"--key-prefix", "cli:"}, desc);
	load_config_sources(vm, desc);

	Config config;
	apply_config(vm, config);
	EXPECT_EQ(config.key_prefix, "cli:");
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigTest, MissingConfigFileIsAnError) {
	auto desc = config_options();
	auto vm = parse({"--config", "/nonexistent/vodlink.ini"}, desc);
	EXPECT_THROW(load_config_sources(vm, desc), po::error);
}

TEST_F(ConfigTest, RejectsZeroChunkSize) {
	::setenv("VODLINK_CHUNK_SIZE", "0", 1);

	auto desc = config_options();
	auto vm = parse({}, desc);
	load_config_sources(vm, desc);

	Config config;
	EXPECT_THROW(apply_config(vm, config), po::error);
}

TEST_F(ConfigTest, RejectsNonPositiveStopCheckInterval) {
	auto desc = config_options();
	auto vm = parse({"--stop-check-interval", "0"}, desc);
	load_config_sources(vm, desc);

	Config config;
	EXPECT_THROW(apply_config(vm, config), po::error);
}

}  // namespace test
}  // namespace vodlink
