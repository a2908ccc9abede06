#include "summary_aggregator.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>

#include <glog/logging.h>

namespace Replibench {

RunReport Aggregate(const Summary& summary, const RunParameters& params) {
	RunReport r;
	r.client_id = params.client_id;
	r.protocol = params.protocol;
	r.duration_s = params.duration_s;

	r.ack_num = summary.ack_num;
	r.throughput = params.duration_s > 0 ? summary.ack_num / params.duration_s : 0;
	r.mean_latency_ms = summary.ack_num > 0 ? summary.total_latency / summary.ack_num : 0;
	r.max_latency_ms = summary.max_latency;
	r.latency = LatencyStats::ComputeSummary(summary.latencies);

	// Fast-path replies do not say whether an operation was a read.
	r.read_num = params.protocol == Protocol::kFastPath ? summary.ack_num : summary.read_num;
	r.non_read_num = r.ack_num - r.read_num;
	r.slow_num = summary.slow_num;
	r.slow_rate = r.read_num > 0 ? static_cast<double>(r.slow_num) / static_cast<double>(r.read_num) : 0.0;

	r.decode_failures = summary.decode_failures;
	r.outstanding_batches = summary.outstanding_batches;
	return r;
}

void LogReport(const RunReport& r) {
	LOG(INFO) << "========== Client " << r.client_id << " (" << ProtocolName(r.protocol) << ") ==========";
	LOG(INFO) << "Acknowledged: " << r.ack_num << " in " << r.duration_s << " s, throughput "
		<< r.throughput << " ops/s";
	LOG(INFO) << "Latency (ms): mean " << r.mean_latency_ms
		<< ", p50 " << r.latency.p50_ms
		<< ", p90 " << r.latency.p90_ms
		<< ", p95 " << r.latency.p95_ms
		<< ", p99 " << r.latency.p99_ms
		<< ", p99.9 " << r.latency.p999_ms
		<< ", max " << r.max_latency_ms;
	LOG(INFO) << "Reads: " << r.read_num << ", non-reads: " << r.non_read_num
		<< ", slow path: " << r.slow_num << " (" << std::fixed << std::setprecision(2)
		<< r.slow_rate * 100.0 << "% of reads)";
	if (r.decode_failures > 0) {
		LOG(WARNING) << "Decode failures: " << r.decode_failures;
	}
	if (r.outstanding_batches > 0) {
		LOG(WARNING) << "Unreleased admission units at the deadline: " << r.outstanding_batches;
	}
}

std::string LatencyDumpFileName(int client_id) {
	return "latency." + std::to_string(client_id) + ".out";
}

bool DumpLatencies(const Summary& summary, const std::string& path) {
	std::ofstream file(path, std::ios::out | std::ios::trunc);
	if (!file.is_open()) {
		LOG(ERROR) << "Failed to open latency dump " << path << ": " << strerror(errno);
		return false;
	}
	for (int64_t latency : summary.latencies) {
		file << latency << "\n";
	}
	file.close();
	if (file.fail()) {
		LOG(ERROR) << "Failed to write latency dump " << path;
		return false;
	}
	LOG(INFO) << "Wrote " << summary.latencies.size() << " latencies to " << path;
	return true;
}

} // namespace Replibench
