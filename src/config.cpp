#include "config.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <fstream>

namespace vodlink {

std::string default_worker_id() {
	boost::system::error_code ec;
	auto host = boost::asio::ip::host_name(ec);
	if (ec || host.empty()) { host = "worker"; }
	return fmt::format("{}-{}", host, ::getpid());
}

po::options_description config_options() {
	const Config d;
	po::options_description desc("Configuration");
	// clang-format off
	desc.add_options()
		// Redis
		("redis-uri", po::value<std::string>()->default_value(d.redis_uri),
		 "Redis URI (tcp://host:port/db)")
		("key-prefix", po::value<std::string>()->default_value(d.key_prefix),
		 "Prefix for every Redis key")
		("redis-pool-size", po::value<std::size_t>()->default_value(d.redis_pool_size),
		 "Redis connection pool size")
		// Records and locking
		("session-ttl", po::value<long long>()->default_value(d.session_ttl.count()),
		 "Session record TTL in seconds")
		("lock-ttl-ms", po::value<long long>()->default_value(d.lock_ttl.count()),
		 "Session lock expiry in milliseconds")
		("lock-wait-ms", po::value<long long>()->default_value(d.lock_wait.count()),
		 "Maximum wait for a session lock in milliseconds")
		// Upstream
		("connect-timeout-ms", po::value<long long>()->default_value(d.connect_timeout.count()),
		 "Upstream connect timeout in milliseconds")
		("read-timeout-ms", po::value<long long>()->default_value(d.read_timeout.count()),
		 "Upstream read timeout in milliseconds")
		("user-agent", po::value<std::string>()->default_value(d.upstream_user_agent),
		 "User-Agent sent upstream when neither account nor client has one")
		// Streaming
		("chunk-size", po::value<std::size_t>()->default_value(d.chunk_size),
		 "Bytes per streamed chunk")
		("stop-check-interval", po::value<int>()->default_value(d.stop_check_interval),
		 "Chunks between stop-signal checks and activity updates")
		("cleanup-delay-ms", po::value<long long>()->default_value(d.cleanup_delay.count()),
		 "Grace period before an idle session is removed")
		// Stale sweep
		("stale-max-age", po::value<long long>()->default_value(d.stale_max_age.count()),
		 "Idle seconds after which a session is swept")
		("sweep-interval", po::value<long long>()->default_value(d.sweep_interval.count()),
		 "Seconds between periodic sweeps")
		// Matching
		("match-content", po::value<int>()->default_value(d.match.content),
		 "Score for same content")
		("match-client-ip", po::value<int>()->default_value(d.match.client_ip),
		 "Score for same client IP")
		("match-user-agent", po::value<int>()->default_value(d.match.user_agent),
		 "Score for same user agent")
		("match-timeshift", po::value<int>()->default_value(d.match.timeshift),
		 "Score for identical timeshift parameters")
		("match-threshold", po::value<int>()->default_value(d.match.threshold),
		 "Minimum score for reusing an idle session")
		("worker-id", po::value<std::string>(),
		 "Worker identity (default: hostname-pid)");
	// clang-format on
	return desc;
}

void apply_config(const po::variables_map &vm, Config &config) {
	config.redis_uri = vm["redis-uri"].as<std::string>();
	config.key_prefix = vm["key-prefix"].as<std::string>();
	config.redis_pool_size = vm["redis-pool-size"].as<std::size_t>();

	config.session_ttl = std::chrono::seconds(vm["session-ttl"].as<long long>());
	config.lock_ttl =
		std::chrono::milliseconds(vm["lock-ttl-ms"].as<long long>());
	config.lock_wait =
		std::chrono::milliseconds(vm["lock-wait-ms"].as<long long>());

	config.connect_timeout =
		std::chrono::milliseconds(vm["connect-timeout-ms"].as<long long>());
	config.read_timeout =
		std::chrono::milliseconds(vm["read-timeout-ms"].as<long long>());
	config.upstream_user_agent = vm["user-agent"].as<std::string>();

	config.chunk_size = vm["chunk-size"].as<std::size_t>();
	config.stop_check_interval = vm["stop-check-interval"].as<int>();
	config.cleanup_delay =
		std::chrono::milliseconds(vm["cleanup-delay-ms"].as<long long>());

	config.stale_max_age =
		std::chrono::seconds(vm["stale-max-age"].as<long long>());
	config.sweep_interval =
		std::chrono::seconds(vm["sweep-interval"].as<long long>());

	config.match.content = vm["match-content"].as<int>();
	config.match.client_ip = vm["match-client-ip"].as<int>();
	config.match.user_agent = vm["match-user-agent"].as<int>();
	config.match.timeshift = vm["match-timeshift"].as<int>();
	config.match.threshold = vm["match-threshold"].as<int>();

	if (vm.count("worker-id")) {
		config.worker_id = vm["worker-id"].as<std::string>();
	}
	if (config.worker_id.empty()) { config.worker_id = default_worker_id(); }

	if (config.chunk_size == 0) {
		throw po::error("chunk-size must be greater than zero");
	}
	if (config.stop_check_interval <= 0) {
		throw po::error("stop-check-interval must be greater than zero");
	}
}

void load_config_sources(po::variables_map &vm,
						 const po::options_description &desc) {
	if (vm.count("config")) {
		const auto path = vm["config"].as<std::string>();
		std::ifstream file(path);
		if (!file) {
			throw po::error(fmt::format("cannot open config file {}", path));
		}
		po::store(po::parse_config_file(file, desc), vm);
		spdlog::debug("Loaded configuration from {}", path);
	}

	// VODLINK_REDIS_URI -> redis-uri
	po::store(po::parse_environment(
				  desc,
				  [&desc](const std::string &env) -> std::string {
					  constexpr std::string_view kPrefix = "VODLINK_";
					  if (env.rfind(kPrefix, 0) != 0) { return {}; }
					  auto name = boost::algorithm::to_lower_copy(
						  env.substr(kPrefix.size()));
					  boost::algorithm::replace_all(name, "_", "-");
					  return desc.find_nothrow(name, false) ? name
															: std::string{};
				  }),
			  vm);
	po::notify(vm);
}

}  // namespace vodlink
