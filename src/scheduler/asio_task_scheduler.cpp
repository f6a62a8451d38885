#include "scheduler/asio_task_scheduler.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace asio = boost::asio;

namespace vodlink::scheduler {

struct AsioTaskScheduler::Impl {
	asio::io_context ioc;
	asio::executor_work_guard<asio::io_context::executor_type> guard;
	std::thread thread;

	std::mutex mutex;
	bool stopping = false;
	std::once_flag join_once;
	std::atomic<ShutdownMode> mode{ShutdownMode::run_pending};
	std::atomic<std::size_t> dropped{0};

	// Only touched on the io thread
	std::unordered_map<std::uint64_t, std::shared_ptr<asio::steady_timer>>
		pending;
	std::uint64_t next_id = 0;

	// Set on the io thread when the owner was destroyed by one of our own
	// tasks; the thread then frees this Impl once run() returns
	bool orphaned = false;

	Impl() : guard(asio::make_work_guard(ioc)) {
		thread = std::thread([this] {
			ioc.run();
			if (orphaned) { delete this; }
		});
	}

	// Queued behind every arm() posted before `stopping` was set
	void cancel_pending() {
		asio::post(ioc, [this] {
			for (auto &[id, timer] : pending) { timer->cancel(); }
		});
	}

	// Shutdown from the io thread itself, which cannot join itself
	void abandon() {
		{
			std::lock_guard lock(mutex);
			stopping = true;
		}
		cancel_pending();
		guard.reset();
		if (thread.joinable()) { thread.detach(); }
		orphaned = true;
	}

	void run_task(const Task &task) {
		try {
			task();
		} catch (const std::exception &e) {
			spdlog::error("Scheduled task failed: {}", e.what());
		}
	}

	void arm(std::chrono::milliseconds delay, Task task) {
		auto id = next_id++;
		auto timer = std::make_shared<asio::steady_timer>(ioc, delay);
		pending.emplace(id, timer);
		timer->async_wait([this, id, timer, task = std::move(task)](
							  const boost::system::error_code &ec) {
			pending.erase(id);
			if (ec == asio::error::operation_aborted &&
				mode.load() == ShutdownMode::drop_pending) {
				dropped++;
				spdlog::warn("Dropped scheduled task at shutdown");
				return;
			}
			run_task(task);
		});
	}
};

AsioTaskScheduler::AsioTaskScheduler() : m_impl(std::make_unique<Impl>()) {}

AsioTaskScheduler::~AsioTaskScheduler() {
	if (std::this_thread::get_id() == m_impl->thread.get_id()) {
		spdlog::debug("Scheduler released by a scheduled task, detaching");
		m_impl->abandon();
		m_impl.release();
		return;
	}
	shutdown();
}

bool AsioTaskScheduler::schedule_after(std::chrono::milliseconds delay,
									   Task task) {
	std::lock_guard lock(m_impl->mutex);
	if (m_impl->stopping) {
		spdlog::warn("Scheduler is shut down, task rejected");
		return false;
	}
	asio::post(m_impl->ioc, [impl = m_impl.get(), delay,
							 task = std::move(task)]() mutable {
		impl->arm(delay, std::move(task));
	});
	return true;
}

std::size_t AsioTaskScheduler::shutdown(ShutdownMode mode) {
	{
		std::lock_guard lock(m_impl->mutex);
		if (!m_impl->stopping) {
			m_impl->stopping = true;
			m_impl->mode.store(mode);
		}
	}

	if (std::this_thread::get_id() == m_impl->thread.get_id()) {
		spdlog::warn("Scheduler shutdown requested from a scheduled task, "
					 "not joining");
		return m_impl->dropped.load();
	}

	std::call_once(m_impl->join_once, [impl = m_impl.get()] {
		impl->cancel_pending();
		impl->guard.reset();
		if (impl->thread.joinable()) { impl->thread.join(); }
	});
	return m_impl->dropped.load();
}

}  // namespace vodlink::scheduler
