#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

#include "absl/synchronization/mutex.h"
#include "folly/ProducerConsumerQueue.h"

#include "admission_ledger.h"
#include "common/wire_formats.h"

namespace Replibench {

/**
 * Outcome of one decode attempt on the inbound ABD stream.
 */
struct DecodeEvent {
	enum class Kind {
		kDecoded,
		kDecodeFailed,
	};

	Kind kind = Kind::kDecoded;
	wire::Response response;  // valid for kDecoded only

	static DecodeEvent Decoded(wire::Response response) {
		DecodeEvent ev;
		ev.kind = Kind::kDecoded;
		ev.response = std::move(response);
		return ev;
	}

	static DecodeEvent Failed() {
		DecodeEvent ev;
		ev.kind = Kind::kDecodeFailed;
		return ev;
	}
};

/**
 * Bounded single-producer single-consumer queue between the response decoder
 * and the ABD collector.
 *
 * Storage is a folly SPSC ring. A full ring stalls the decoder; an empty ring
 * parks the collector on a CondVar until the next event or the deadline.
 */
class ResponseQueue {
	public:
		explicit ResponseQueue(size_t capacity);

		/**
		 * Producer side. Blocks while the queue is full.
		 * @return false if the queue was closed before the event fit
		 */
		bool Push(DecodeEvent&& event);

		/// Consumer side. std::nullopt once the deadline fires with nothing queued.
		std::optional<DecodeEvent> Pop(const RunDeadline& deadline);

		/// Marks the consumer gone; a blocked producer gives up.
		void Close();
		bool closed() const { return closed_.load(std::memory_order_acquire); }

		size_t capacity() const { return capacity_; }
		size_t SizeGuess() const { return queue_.sizeGuess(); }

	private:
		static constexpr int kQueueFullSleepMs = 1;

		const size_t capacity_;
		// folly keeps one slot empty, so the ring is one larger than capacity_.
		folly::ProducerConsumerQueue<DecodeEvent> queue_;
		std::atomic<bool> closed_{false};

		absl::Mutex mu_;
		absl::CondVar data_ready_cv_;
};

} // namespace Replibench
