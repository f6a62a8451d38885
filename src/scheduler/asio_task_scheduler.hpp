#pragma once

#include <cstddef>
#include <memory>
#include <vodlink/task_scheduler.hpp>

namespace vodlink::scheduler {

enum class ShutdownMode {
	run_pending,   // fire pending tasks immediately
	drop_pending,  // discard them, counted in the return value
};

/// TaskScheduler backed by an io_context and one steady_timer per task,
/// served by a private thread.
class AsioTaskScheduler final : public TaskScheduler {
   public:
	AsioTaskScheduler();
	~AsioTaskScheduler() override;

	AsioTaskScheduler(const AsioTaskScheduler &) = delete;
	AsioTaskScheduler &operator=(const AsioTaskScheduler &) = delete;

	bool schedule_after(std::chrono::milliseconds delay, Task task) override;

	/// Stop accepting work, settle pending tasks per `mode` and join the
	/// thread. Returns the number of dropped tasks. Idempotent; the
	/// destructor calls shutdown(ShutdownMode::run_pending). Destroying the
	/// scheduler from one of its own tasks settles pending tasks the same
	/// way, then lets the thread exit on its own.
	std::size_t shutdown(ShutdownMode mode = ShutdownMode::run_pending);

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace vodlink::scheduler
