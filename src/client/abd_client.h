#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "absl/container/flat_hash_map.h"

#include "admission_ledger.h"
#include "connection.h"
#include "linearizability_trace.h"
#include "protocol_client.h"
#include "response_queue.h"
#include "workload_generator.h"
#include "common/configuration.h"
#include "common/wire_formats.h"

namespace Replibench {

/**
 * ABD issuer: one Transaction per batch, at most `concurrency` of them
 * unacknowledged at a time (one permit each).
 */
class AbdIssuer : public Issuer {
	public:
		AbdIssuer(const RunParameters& params,
				WorkloadGenerator* workload,
				AdmissionLedger* ledger,
				const RunDeadline& deadline,
				Connection* conn,
				LinearizabilityTrace* trace = nullptr);

		void Run() override;

		int64_t issued_operations() const override { return issued_ops_.load(std::memory_order_relaxed); }
		int64_t issued_transactions() const { return issued_txns_.load(std::memory_order_relaxed); }

		/**
		 * Commands [begin, end) of the workload, sorted by key. PUT values are
		 * drawn from the workload; the transaction is read-only iff every
		 * command is a GET. Timestamp and id are left for the caller.
		 */
		static wire::Transaction BuildTransaction(WorkloadGenerator* workload, size_t begin, size_t end);

	private:
		const RunParameters& params_;
		WorkloadGenerator* workload_;
		AdmissionLedger* ledger_;
		const RunDeadline& deadline_;
		Connection* conn_;
		LinearizabilityTrace* trace_;

		std::atomic<int64_t> issued_ops_{0};
		std::atomic<int64_t> issued_txns_{0};
};

/**
 * Decodes the inbound ABD stream on a dedicated thread and forwards every
 * attempt to the collector as a DecodeEvent. A malformed message is logged
 * and reported; the loop then moves on to the next message.
 */
class ResponseDecoder {
	public:
		ResponseDecoder(google::protobuf::io::ZeroCopyInputStream* in, ResponseQueue* queue);

		/// Returns at end of stream, on a socket error, or once the queue is closed.
		void Run();

		int64_t decoded() const { return decoded_.load(std::memory_order_relaxed); }
		int64_t failed() const { return failed_.load(std::memory_order_relaxed); }

	private:
		google::protobuf::io::ZeroCopyInputStream* in_;
		ResponseQueue* queue_;
		std::atomic<int64_t> decoded_{0};
		std::atomic<int64_t> failed_{0};
};

/**
 * Matches Responses to transactions by id.
 *
 * A transaction may be acknowledged in fragments. Its running count is
 * clamped at batch_size and its permit is released exactly once, when the
 * count first reaches batch_size. A response claiming more than batch_size
 * operations is clamped to batch_size.
 */
class AbdResponseCollector : public ResponseCollector {
	public:
		AbdResponseCollector(const RunParameters& params,
				ResponseQueue* queue,
				AdmissionLedger* ledger,
				const RunDeadline& deadline,
				LinearizabilityTrace* trace = nullptr);

		Summary Run() override;

		/// Folds one event into the Summary.
		void Handle(const DecodeEvent& event);

		int64_t acknowledged(int64_t tid) const;
		const Summary& summary() const { return summary_; }

		/**
		 * Number of operations in transaction `tid`. Ids are cumulative, so
		 * every transaction carries batch_size commands except a short last one.
		 */
		static int64_t TransactionSize(int64_t tid, int64_t batch_size);

	private:
		/// Short transactions fully acknowledged whose permit stays reserved.
		size_t CompleteUnreleased() const;

		const RunParameters& params_;
		ResponseQueue* queue_;
		AdmissionLedger* ledger_;
		const RunDeadline& deadline_;
		LinearizabilityTrace* trace_;

		Summary summary_;
		absl::flat_hash_map<int64_t, int64_t> acked_by_tid_;
};

} // namespace Replibench
