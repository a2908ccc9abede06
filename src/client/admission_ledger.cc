#include "admission_ledger.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <glog/logging.h>

namespace Replibench {

absl::Time RunDeadline::AbslDeadline() const {
	auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(at_ - Clock::now());
	if (remaining.count() <= 0) {
		return absl::Now();
	}
	return absl::Now() + absl::FromChrono(remaining);
}

std::chrono::nanoseconds PacingTimer::BatchInterval(const RunParameters& params) {
	const int64_t batch_size = std::max(1, params.batch_size);
	const int64_t batch_count = params.request_count / batch_size + 1;
	const int64_t interval_ns = static_cast<int64_t>(params.duration_s) * 1000000000LL / batch_count;
	return std::max(std::chrono::nanoseconds(interval_ns), kMinInterval);
}

PacingTimer::PacingTimer(std::chrono::nanoseconds interval, RunDeadline::Clock::time_point start)
	: interval_(std::max(interval, kMinInterval)),
	  next_tick_(start + interval_) {}

bool PacingTimer::WaitForTick(const RunDeadline& deadline) {
	auto now = RunDeadline::Clock::now();
	if (next_tick_ <= now) {
		// One tick was buffered while we were busy; skip the rest of the missed ones.
		auto missed = (now - next_tick_) / interval_ + 1;
		next_tick_ += missed * interval_;
		return !deadline.Expired();
	}
	if (next_tick_ >= deadline.at()) {
		std::this_thread::sleep_until(deadline.at());
		return false;
	}
	std::this_thread::sleep_until(next_tick_);
	next_tick_ += interval_;
	return true;
}

PermitLedger::PermitLedger(size_t capacity) : capacity_(capacity) {
	if (capacity == 0) {
		throw std::invalid_argument("PermitLedger capacity must be at least 1");
	}
}

bool PermitLedger::Reserve(size_t n, const RunDeadline& deadline) {
	if (n > capacity_) {
		throw std::invalid_argument("Cannot reserve more permits than the ledger holds");
	}
	const absl::Time abs_deadline = deadline.AbslDeadline();
	absl::MutexLock lock(&mu_);
	while (outstanding_ + n > capacity_) {
		if (released_cv_.WaitWithDeadline(&mu_, abs_deadline) && outstanding_ + n > capacity_) {
			return false;
		}
	}
	outstanding_ += n;
	return true;
}

void PermitLedger::Release(size_t n) {
	absl::MutexLock lock(&mu_);
	if (n > outstanding_) {
		LOG(WARNING) << "PermitLedger: releasing " << n << " permits with only "
			<< outstanding_ << " outstanding";
		n = outstanding_;
	}
	outstanding_ -= n;
	released_cv_.SignalAll();
}

size_t PermitLedger::Outstanding() const {
	absl::MutexLock lock(&mu_);
	return outstanding_;
}

CountLedger::CountLedger(size_t max_pending) : max_pending_(max_pending) {
	if (max_pending == 0) {
		throw std::invalid_argument("CountLedger needs room for at least one announcement");
	}
}

bool CountLedger::Reserve(size_t n, const RunDeadline& deadline) {
	const absl::Time abs_deadline = deadline.AbslDeadline();
	absl::MutexLock lock(&mu_);
	while (pending_.size() >= max_pending_) {
		if (changed_cv_.WaitWithDeadline(&mu_, abs_deadline) && pending_.size() >= max_pending_) {
			return false;
		}
	}
	pending_.push_back(n);
	outstanding_ += n;
	changed_cv_.SignalAll();
	return true;
}

std::optional<size_t> CountLedger::Claim(const RunDeadline& deadline) {
	const absl::Time abs_deadline = deadline.AbslDeadline();
	absl::MutexLock lock(&mu_);
	while (pending_.empty()) {
		if (changed_cv_.WaitWithDeadline(&mu_, abs_deadline) && pending_.empty()) {
			return std::nullopt;
		}
	}
	size_t n = pending_.front();
	pending_.pop_front();
	changed_cv_.SignalAll();
	return n;
}

void CountLedger::Release(size_t n) {
	absl::MutexLock lock(&mu_);
	if (n > outstanding_) {
		LOG(WARNING) << "CountLedger: releasing " << n << " operations with only "
			<< outstanding_ << " outstanding";
		n = outstanding_;
	}
	outstanding_ -= n;
}

size_t CountLedger::Outstanding() const {
	absl::MutexLock lock(&mu_);
	return outstanding_;
}

size_t CountLedger::PendingAnnouncements() const {
	absl::MutexLock lock(&mu_);
	return pending_.size();
}

} // namespace Replibench
