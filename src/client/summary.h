#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Replibench {

/**
 * Per-run accumulation, owned by the collector thread and moved out once the
 * run ends. Latencies are in milliseconds.
 */
struct Summary {
	int64_t ack_num = 0;
	int64_t total_latency = 0;
	std::vector<int64_t> latencies;  // one entry per acknowledged operation
	int64_t max_latency = 0;
	int64_t slow_num = 0;
	int64_t read_num = 0;
	int64_t decode_failures = 0;
	size_t outstanding_batches = 0;  // admission units never released

	void Reserve(int64_t request_count) {
		if (request_count > 0) {
			latencies.reserve(static_cast<size_t>(request_count));
		}
	}

	/// Records `count` operations acknowledged with the same latency.
	void RecordAcks(int64_t latency, int64_t count) {
		for (int64_t i = 0; i < count; i++) {
			latencies.push_back(latency);
		}
		ack_num += count;
		total_latency += latency * count;
		if (latency > max_latency) {
			max_latency = latency;
		}
	}
};

} // namespace Replibench
