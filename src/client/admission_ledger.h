#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "common/configuration.h"

namespace Replibench {

/**
 * One-shot run deadline shared by the issuer and the collector.
 * Firing is not an error: both sides stop and report what they have.
 */
class RunDeadline {
	public:
		using Clock = std::chrono::steady_clock;

		RunDeadline(Clock::time_point start, Clock::duration duration)
			: start_(start), at_(start + duration) {}

		static RunDeadline StartingNow(Clock::duration duration) {
			return RunDeadline(Clock::now(), duration);
		}

		Clock::time_point start() const { return start_; }
		Clock::time_point at() const { return at_; }
		Clock::duration duration() const { return at_ - start_; }

		bool Expired() const { return Clock::now() >= at_; }

		/// The same instant on absl's clock, for CondVar waits.
		absl::Time AbslDeadline() const;

	private:
		Clock::time_point start_;
		Clock::time_point at_;
};

/**
 * Periodic pacing tick. The issuer emits at most one batch per tick; ticks
 * that were missed while the issuer was blocked are dropped, except one.
 */
class PacingTimer {
	public:
		static constexpr std::chrono::nanoseconds kMinInterval{1000};

		/**
		 * duration / (request_count / batch_size + 1), never below kMinInterval.
		 */
		static std::chrono::nanoseconds BatchInterval(const RunParameters& params);

		PacingTimer(std::chrono::nanoseconds interval, RunDeadline::Clock::time_point start);

		/// Sleeps until the next tick. Returns false if the deadline fires first.
		bool WaitForTick(const RunDeadline& deadline);

		std::chrono::nanoseconds interval() const { return interval_; }

	private:
		std::chrono::nanoseconds interval_;
		RunDeadline::Clock::time_point next_tick_;
};

/**
 * Bounds the work a client keeps in flight.
 *
 * Units are protocol specific: the ABD issuer reserves one permit per
 * transaction, the fast-path issuer reserves the operation count of each batch.
 */
class AdmissionLedger {
	public:
		virtual ~AdmissionLedger() = default;

		/**
		 * Blocks until `n` units are admitted or the deadline fires.
		 * @return false if the deadline fired first; nothing is reserved then
		 */
		virtual bool Reserve(size_t n, const RunDeadline& deadline) = 0;

		/// Returns `n` units. Never blocks.
		virtual void Release(size_t n) = 0;

		/// Units reserved and not yet released.
		virtual size_t Outstanding() const = 0;
};

/**
 * Counting semaphore with `capacity` permits.
 */
class PermitLedger : public AdmissionLedger {
	public:
		explicit PermitLedger(size_t capacity);

		bool Reserve(size_t n, const RunDeadline& deadline) override;
		void Release(size_t n) override;
		size_t Outstanding() const override;

		size_t capacity() const { return capacity_; }

	private:
		const size_t capacity_;
		mutable absl::Mutex mu_;
		absl::CondVar released_cv_;
		size_t outstanding_ ABSL_GUARDED_BY(mu_) = 0;
};

/**
 * Reserved counts are announced to the collector in FIFO order. At most
 * `max_pending` announcements wait unclaimed; Reserve blocks beyond that.
 */
class CountLedger : public AdmissionLedger {
	public:
		explicit CountLedger(size_t max_pending);

		bool Reserve(size_t n, const RunDeadline& deadline) override;
		void Release(size_t n) override;
		size_t Outstanding() const override;

		/**
		 * Takes the oldest announced count, waiting until the deadline.
		 * @return std::nullopt if the deadline fired with nothing announced
		 */
		std::optional<size_t> Claim(const RunDeadline& deadline);

		size_t PendingAnnouncements() const;

	private:
		const size_t max_pending_;
		mutable absl::Mutex mu_;
		absl::CondVar changed_cv_;
		std::deque<size_t> pending_ ABSL_GUARDED_BY(mu_);
		size_t outstanding_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Replibench
