#pragma once

#include <vodlink/vodlink_export.h>

#include <chrono>
#include <functional>

namespace vodlink {

/// Runs deferred work, such as the grace-period cleanup of an idle session.
///
/// Each accepted task runs at most once. Implementations define what happens
/// to tasks still pending at shutdown.
class VODLINK_EXPORT TaskScheduler {
   public:
	using Task = std::function<void()>;

	virtual ~TaskScheduler() = default;

	/// Returns false when the scheduler no longer accepts work.
	virtual bool schedule_after(std::chrono::milliseconds delay, Task task) = 0;
};

}  // namespace vodlink
