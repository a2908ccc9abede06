#include "response_queue.h"

#include <stdexcept>
#include <thread>

#include <glog/logging.h>

namespace Replibench {

namespace {
	size_t CheckedCapacity(size_t capacity) {
		if (capacity == 0) {
			throw std::invalid_argument("ResponseQueue capacity must be at least 1");
		}
		return capacity;
	}
}

ResponseQueue::ResponseQueue(size_t capacity)
	: capacity_(CheckedCapacity(capacity)),
	  queue_(static_cast<uint32_t>(capacity + 1)) {}

bool ResponseQueue::Push(DecodeEvent&& event) {
	bool logged = false;
	while (!queue_.write(std::move(event))) {
		if (closed()) {
			return false;
		}
		if (!logged) {
			VLOG(1) << "ResponseQueue: full (" << capacity_ << " events), decoder waiting for collector";
			logged = true;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(kQueueFullSleepMs));
	}
	absl::MutexLock lock(&mu_);
	data_ready_cv_.Signal();
	return true;
}

std::optional<DecodeEvent> ResponseQueue::Pop(const RunDeadline& deadline) {
	DecodeEvent event;
	if (queue_.read(event)) {
		return event;
	}
	const absl::Time abs_deadline = deadline.AbslDeadline();
	absl::MutexLock lock(&mu_);
	while (queue_.isEmpty()) {
		// Push signals under mu_, so checking isEmpty under the lock cannot miss a wakeup.
		if (data_ready_cv_.WaitWithDeadline(&mu_, abs_deadline) && queue_.isEmpty()) {
			return std::nullopt;
		}
	}
	if (!queue_.read(event)) {
		return std::nullopt;
	}
	return event;
}

void ResponseQueue::Close() {
	closed_.store(true, std::memory_order_release);
	absl::MutexLock lock(&mu_);
	data_ready_cv_.SignalAll();
}

} // namespace Replibench
