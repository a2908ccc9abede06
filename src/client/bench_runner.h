#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "connection.h"
#include "summary.h"
#include "summary_aggregator.h"
#include "common/configuration.h"

namespace Replibench {

/**
 * Wires one benchmark run: workload, admission ledger, issuer and collector
 * threads (plus the response decoder in ABD mode), the run deadline, and the
 * final report.
 */
class BenchRunner {
	public:
		/// Collector threads get this long past the deadline before the socket is shut down.
		static constexpr std::chrono::milliseconds kShutdownGrace{200};

		explicit BenchRunner(const RunParameters& params);

		/// Dials the configured replica and runs. Throws std::runtime_error if the dial fails.
		RunReport Run();

		/// Runs over an already connected stream.
		RunReport Run(std::unique_ptr<Connection> conn);

		const Summary& summary() const { return summary_; }
		int64_t issued_operations() const { return issued_operations_; }

	private:
		const RunParameters& params_;
		Summary summary_;
		int64_t issued_operations_ = 0;
};

} // namespace Replibench
