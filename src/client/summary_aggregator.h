#pragma once

#include <string>

#include "latency_stats.h"
#include "summary.h"
#include "common/configuration.h"

namespace Replibench {

/**
 * Final figures of one run.
 */
struct RunReport {
	int client_id = 0;
	Protocol protocol = Protocol::kAbd;
	int duration_s = 0;

	int64_t ack_num = 0;
	int64_t throughput = 0;       // ack_num / duration_s, integer division
	int64_t mean_latency_ms = 0;  // 0 when nothing was acknowledged
	int64_t max_latency_ms = 0;
	LatencyStats::Summary latency;

	int64_t read_num = 0;
	int64_t non_read_num = 0;
	int64_t slow_num = 0;
	double slow_rate = 0.0;       // slow / read, 0 when nothing was read

	int64_t decode_failures = 0;
	size_t outstanding_batches = 0;
};

RunReport Aggregate(const Summary& summary, const RunParameters& params);

void LogReport(const RunReport& report);

std::string LatencyDumpFileName(int client_id);

/**
 * Writes one latency per line, in acknowledgement order.
 * Returns false (and logs) if the file cannot be written.
 */
bool DumpLatencies(const Summary& summary, const std::string& path);

} // namespace Replibench
