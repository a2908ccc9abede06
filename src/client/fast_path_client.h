#pragma once

#include <atomic>
#include <cstdint>

#include "admission_ledger.h"
#include "connection.h"
#include "linearizability_trace.h"
#include "protocol_client.h"
#include "workload_generator.h"
#include "common/configuration.h"
#include "common/wire_formats.h"

namespace Replibench {

/**
 * Fast-path issuer: every operation is an individually tagged Propose record.
 * All operations of a batch share one timestamp, and the batch's operation
 * count is announced to the collector once the batch is written.
 */
class FastPathIssuer : public Issuer {
	public:
		FastPathIssuer(const RunParameters& params,
				WorkloadGenerator* workload,
				CountLedger* ledger,
				const RunDeadline& deadline,
				Connection* conn,
				LinearizabilityTrace* trace = nullptr);

		void Run() override;

		int64_t issued_operations() const override { return issued_ops_.load(std::memory_order_relaxed); }

	private:
		bool RunTimeElapsed() const;

		const RunParameters& params_;
		WorkloadGenerator* workload_;
		CountLedger* ledger_;
		const RunDeadline& deadline_;
		Connection* conn_;
		LinearizabilityTrace* trace_;

		std::atomic<int64_t> issued_ops_{0};
};

/**
 * Claims each announced batch count and reads exactly that many replies,
 * one latency sample per reply. Replies carry no transaction id; they are
 * matched by count alone.
 */
class FastPathResponseCollector : public ResponseCollector {
	public:
		FastPathResponseCollector(const RunParameters& params,
				CountLedger* ledger,
				const RunDeadline& deadline,
				Connection* conn,
				LinearizabilityTrace* trace = nullptr);

		Summary Run() override;

	private:
		/// Reads one announced batch. Returns false once the inbound stream is closed.
		bool CollectBatch(size_t count);

		const RunParameters& params_;
		CountLedger* ledger_;
		const RunDeadline& deadline_;
		Connection* conn_;
		LinearizabilityTrace* trace_;

		Summary summary_;
};

} // namespace Replibench
