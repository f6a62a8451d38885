#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>
#include <vodlink/stream_orchestrator.hpp>

#include "capacity/capacity_reservation.hpp"
#include "config.hpp"
#include "net/http_client.hpp"
#include "scheduler/asio_task_scheduler.hpp"
#include "session/session_store.hpp"
#include "session/stale_sweeper.hpp"
#include "store/keys.hpp"
#include "utils.hpp"

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

constexpr std::string_view kUsage =
	"Usage: vodlinkctl [options] <command> [args]\n"
	"\n"
	"Commands:\n"
	"  sessions          List session records\n"
	"  show <id>         Print one session record as JSON\n"
	"  stop <id>         Ask the worker serving <id> to end its stream\n"
	"  sweep             Remove stale sessions once\n"
	"  gc                Run the periodic stale sweep until interrupted\n"
	"  profile <id>      Show a provider profile's connection counter\n"
	"  play              Stream one request through the orchestrator\n";

struct Runtime {
	vodlink::Config config;
	vodlink::store::KeySchema keys;
	std::shared_ptr<vodlink::store::KeyValueStore> kv;

	[[nodiscard]] vodlink::session::SessionStoreOptions store_options() const {
		vodlink::session::SessionStoreOptions options;
		options.keys = keys;
		options.session_ttl = config.session_ttl;
		options.lock.ttl = config.lock_ttl;
		options.lock.wait = config.lock_wait;
		options.connect_timeout = config.connect_timeout;
		options.read_timeout = config.read_timeout;
		return options;
	}
};

std::string require_arg(const std::vector<std::string> &args,
						std::string_view command) {
	if (args.empty()) {
		throw po::error(fmt::format("{} requires an id argument", command));
	}
	return args.front();
}

// =============================================================================
// Inspection
// =============================================================================

int cmd_sessions(Runtime &rt) {
	auto keys = rt.kv->scan(rt.keys.session_pattern());
	if (!keys) {
		spdlog::error("Scan failed: {}", keys.error().message());
		return 1;
	}

	std::vector<vodlink::ConnectionState> sessions;
	for (const auto &key : keys.value()) {
		auto id = rt.keys.session_id_from_key(key);
		if (id.empty()) { continue; }
		vodlink::session::SessionStore store(id, rt.kv, nullptr,
											 rt.store_options());
		auto state = store.fetch();
		if (state && state.value()) {
			sessions.push_back(std::move(*state.value()));
		}
	}
	std::sort(sessions.begin(), sessions.end(),
			  [](const auto &a, const auto &b) {
				  return a.last_activity > b.last_activity;
			  });

	const auto now = vodlink::utils::now_seconds();
	fmt::println("{:<38} {:<8} {:<24} {:>6} {:>8} {:<20} {}", "SESSION",
				 "KIND", "CONTENT", "ACTIVE", "IDLE", "WORKER", "CLIENT");
	for (const auto &s : sessions) {
		fmt::println("{:<38} {:<8} {:<24} {:>6} {:>7.0f}s {:<20} {}",
					 s.session_id, vodlink::to_string(s.content_kind),
					 s.content_name.substr(0, 24), s.active_streams,
					 now - s.last_activity, s.worker_id, s.client_ip);
	}
	fmt::println(stderr, "{} session(s)", sessions.size());
	return 0;
}

int cmd_show(Runtime &rt, const std::string &id) {
	vodlink::session::SessionStore store(id, rt.kv, nullptr,
										 rt.store_options());
	auto info = store.session_info();
	if (!info) {
		spdlog::error("[{}] {}", id, info.error().message());
		return 1;
	}
	if (!info.value()) {
		spdlog::error("[{}] No such session", id);
		return 1;
	}
	std::cout << info.value()->dump(2) << "\n";
	return 0;
}

int cmd_stop(Runtime &rt, const std::string &id) {
	auto res = rt.kv->set(rt.keys.client_stop(id), "1", rt.config.session_ttl);
	if (!res) {
		spdlog::error("[{}] Could not set stop signal: {}", id,
					  res.error().message());
		return 1;
	}
	spdlog::info("[{}] Stop signal set", id);
	return 0;
}

int cmd_profile(Runtime &rt, const std::string &arg) {
	auto id = vodlink::utils::to_long(arg);
	if (!id) { throw po::error(fmt::format("invalid profile id {}", arg)); }
	vodlink::capacity::CapacityReservation capacity(rt.kv, rt.keys);
	auto current = capacity.current(id.value());
	if (!current) {
		spdlog::error("Could not read counter for profile {}", id.value());
		return 1;
	}
	fmt::println("profile {}: {} active connection(s)", id.value(), *current);
	return 0;
}

// =============================================================================
// Garbage collection
// =============================================================================

std::shared_ptr<vodlink::session::StaleSweeper> make_sweeper(Runtime &rt) {
	return std::make_shared<vodlink::session::StaleSweeper>(
		rt.kv,
		std::make_shared<vodlink::capacity::CapacityReservation>(rt.kv,
																 rt.keys),
		rt.store_options(), rt.config.worker_id);
}

int cmd_sweep(Runtime &rt) {
	auto report = make_sweeper(rt)->sweep(rt.config.stale_max_age);
	fmt::println("scanned {} stale {} removed {} errors {}", report.scanned,
				 report.stale, report.removed, report.errors);
	return report.errors == 0 ? 0 : 1;
}

int cmd_gc(Runtime &rt) {
	asio::io_context ioc;
	auto sweeper = make_sweeper(rt);

	asio::signal_set signals(ioc, SIGINT, SIGTERM);
	signals.async_wait([&](const boost::system::error_code &ec, int sig) {
		if (!ec) {
			spdlog::info("Received signal {}, stopping sweeper", sig);
			sweeper->stop();
		}
	});

	sweeper->start(ioc.get_executor(), rt.config.sweep_interval,
				   rt.config.stale_max_age);
	ioc.run();
	return 0;
}

// =============================================================================
// Streaming
// =============================================================================

vodlink::StreamRequest build_request(const po::variables_map &vm) {
	vodlink::StreamRequest request;
	if (!vm.count("url")) { throw po::error("play requires --url"); }
	request.stream_url = vm["url"].as<std::string>();

	const auto kind = vm["content-kind"].as<std::string>();
	auto parsed = vodlink::parse_content_kind(kind);
	if (!parsed) {
		throw po::error(fmt::format("unknown content kind {}", kind));
	}
	request.content.kind = *parsed;
	request.content.id = vm["content-id"].as<std::string>();
	request.content.name = vm.count("content-name")
							   ? vm["content-name"].as<std::string>()
							   : request.content.id;

	request.profile.id = vm["profile-id"].as<long long>();
	request.profile.max_connections = vm["max-connections"].as<int>();
	if (vm.count("account-agent")) {
		request.profile.user_agent = vm["account-agent"].as<std::string>();
	}

	if (vm.count("session")) {
		request.session_id = vm["session"].as<std::string>();
	}
	if (vm.count("range")) {
		request.range_header = vm["range"].as<std::string>();
	}
	if (vm.count("client-ip")) {
		request.client.ip = vm["client-ip"].as<std::string>();
	}
	if (vm.count("client-agent")) {
		request.client.user_agent = vm["client-agent"].as<std::string>();
	}
	if (vm.count("utc-start")) {
		request.timeshift.utc_start = vm["utc-start"].as<std::string>();
	}
	if (vm.count("utc-end")) {
		request.timeshift.utc_end = vm["utc-end"].as<std::string>();
	}
	if (vm.count("offset")) {
		request.timeshift.offset = vm["offset"].as<std::string>();
	}
	if (vm.count("header")) {
		for (const auto &h : vm["header"].as<std::vector<std::string>>()) {
			auto colon = h.find(':');
			if (colon == std::string::npos) {
				throw po::error(fmt::format("malformed header {}", h));
			}
			auto value = h.substr(colon + 1);
			value.erase(0, value.find_first_not_of(' '));
			request.client_headers[h.substr(0, colon)] = value;
		}
	}
	return request;
}

int cmd_play(Runtime &rt, const po::variables_map &vm) {
	auto request = build_request(vm);
	const auto output = vm["output"].as<std::string>();

	std::FILE *out = stdout;
	if (output != "-") {
		out = std::fopen(output.c_str(), "wb");
		if (!out) {
			spdlog::error("Cannot open {} for writing", output);
			return 1;
		}
	}

	auto scheduler =
		std::make_shared<vodlink::scheduler::AsioTaskScheduler>();
	vodlink::StreamOrchestrator orchestrator(
		rt.kv,
		std::make_shared<vodlink::net::HttpClient>(
			rt.config.upstream_user_agent),
		scheduler, rt.config);

	auto response = orchestrator.stream(request);
	fmt::println(stderr, "HTTP {} session {}", response.status,
				 response.session_id);
	for (const auto &[name, value] : response.headers) {
		fmt::println(stderr, "{}: {}", name, value);
	}

	int rc = 0;
	if (!response.stream) {
		fmt::println(stderr, "{}", response.body);
		rc = 1;
	} else {
		auto &stream = *response.stream;

		// Ctrl-C cancels the stream; its teardown still runs
		asio::io_context ioc;
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				fmt::println(stderr, "\nReceived signal {}, cancelling.", sig);
				stream.cancel();
			}
		});
		std::thread signal_thread([&ioc] { ioc.run(); });

		while (true) {
			auto chunk = stream.read();
			if (!chunk) {
				if (chunk.error() != vodlink::errc::stream_cancelled) {
					spdlog::error("Stream failed: {}",
								  chunk.error().message());
					rc = 1;
				}
				break;
			}
			if (chunk.value().empty()) { break; }
			if (std::fwrite(chunk.value().data(), 1, chunk.value().size(),
							out) != chunk.value().size()) {
				spdlog::error("Write to {} failed", output);
				stream.cancel();
				rc = 1;
			}
		}
		fmt::println(stderr, "{} bytes written", stream.bytes_sent());

		signals.cancel();
		ioc.stop();
		signal_thread.join();

		// Run the teardown before the scheduler goes away
		response.stream.reset();
	}

	if (out != stdout) { std::fclose(out); }
	// Let the delayed cleanup run before exiting
	scheduler->shutdown(vodlink::scheduler::ShutdownMode::run_pending);
	return rc;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

		po::options_description general("General");
		// clang-format off
		general.add_options()
			("help,h", "Print help message")
			("config,c", po::value<std::string>(), "INI configuration file")
			("verbose,v", "Enable verbose logging")
			("quiet,q", "Only log warnings and errors");

		po::options_description play("Play options");
		play.add_options()
			("url", po::value<std::string>(), "Provider URL of the content")
			("content-kind", po::value<std::string>()->default_value("movie"),
			 "movie or episode")
			("content-id", po::value<std::string>()->default_value(""),
			 "Catalog id of the content")
			("content-name", po::value<std::string>(), "Display name")
			("profile-id", po::value<long long>()->default_value(0),
			 "Provider profile id")
			("max-connections", po::value<int>()->default_value(0),
			 "Profile connection limit (0 = unlimited)")
			("account-agent", po::value<std::string>(),
			 "Account-level User-Agent")
			("session", po::value<std::string>(), "Session id to use")
			("range", po::value<std::string>(), "Range header, e.g. bytes=0-")
			("client-ip", po::value<std::string>(), "Client address")
			("client-agent", po::value<std::string>(), "Client User-Agent")
			("utc-start", po::value<std::string>(), "Timeshift start")
			("utc-end", po::value<std::string>(), "Timeshift end")
			("offset", po::value<std::string>(), "Timeshift offset")
			("header,H", po::value<std::vector<std::string>>()->composing(),
			 "Client header \"Name: value\" (repeatable)")
			("output,o", po::value<std::string>()->default_value("-"),
			 "Output file, - for stdout");

		po::options_description hidden;
		hidden.add_options()
			("command", po::value<std::string>())
			("args", po::value<std::vector<std::string>>());
		// clang-format on

		auto settings = vodlink::config_options();

		po::options_description visible;
		visible.add(general).add(settings).add(play);
		po::options_description all;
		all.add(visible).add(hidden);

		po::positional_options_description p;
		p.add("command", 1).add("args", -1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(all)
					  .positional(p)
					  .run(),
				  vm);

		if (vm.count("help") || !vm.count("command")) {
			std::cout << kUsage << "\n" << visible << "\n";
			return vm.count("help") ? 0 : 1;
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else if (vm.count("quiet")) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		vodlink::load_config_sources(vm, settings);

		Runtime rt{{}, vodlink::store::KeySchema{}, nullptr};
		vodlink::apply_config(vm, rt.config);
		rt.keys = vodlink::store::KeySchema(rt.config.key_prefix);

		vodlink::store::RedisOptions redis;
		redis.uri = rt.config.redis_uri;
		redis.pool_size = rt.config.redis_pool_size;
		auto kv = vodlink::store::make_redis_store(redis);
		if (!kv) {
			fmt::println(stderr, "ERROR: {}", kv.error().message());
			return 1;
		}
		rt.kv = kv.value();

		const auto command = vm["command"].as<std::string>();
		const auto args = vm.count("args")
							  ? vm["args"].as<std::vector<std::string>>()
							  : std::vector<std::string>{};

		if (command == "sessions") { return cmd_sessions(rt); }
		if (command == "show") { return cmd_show(rt, require_arg(args, command)); }
		if (command == "stop") { return cmd_stop(rt, require_arg(args, command)); }
		if (command == "sweep") { return cmd_sweep(rt); }
		if (command == "gc") { return cmd_gc(rt); }
		if (command == "profile") {
			return cmd_profile(rt, require_arg(args, command));
		}
		if (command == "play") { return cmd_play(rt, vm); }

		fmt::println(stderr, "ERROR: unknown command {}\n\n{}", command, kUsage);
		return 1;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
