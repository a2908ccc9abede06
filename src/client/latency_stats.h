#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <vector>

namespace Replibench {

/**
 * Nearest-rank latency percentiles over one run's samples (milliseconds).
 */
class LatencyStats {
public:
	struct Summary {
		int64_t min_ms = 0;
		int64_t p50_ms = 0;
		int64_t p90_ms = 0;
		int64_t p95_ms = 0;
		int64_t p99_ms = 0;
		int64_t p999_ms = 0;
		int64_t max_ms = 0;
		double average_ms = 0.0;
		size_t count = 0;
	};

	// Takes a copy: the collector's sample order is kept for the latency dump.
	static Summary ComputeSummary(std::vector<int64_t> latencies_ms) {
		Summary s{};
		if (latencies_ms.empty()) {
			return s;
		}
		std::sort(latencies_ms.begin(), latencies_ms.end());

		s.count = latencies_ms.size();
		s.min_ms = latencies_ms.front();
		s.max_ms = latencies_ms.back();
		const long double sum = std::accumulate(
			latencies_ms.begin(), latencies_ms.end(), static_cast<long double>(0.0L));
		s.average_ms = static_cast<double>(sum / static_cast<long double>(s.count));

		s.p50_ms = Percentile(latencies_ms, 0.50);
		s.p90_ms = Percentile(latencies_ms, 0.90);
		s.p95_ms = Percentile(latencies_ms, 0.95);
		s.p99_ms = Percentile(latencies_ms, 0.99);
		s.p999_ms = Percentile(latencies_ms, 0.999);
		return s;
	}

	/// Smallest sample with at least p of all samples at or below it. Input must be sorted.
	static int64_t Percentile(const std::vector<int64_t>& sorted, double p) {
		if (sorted.empty()) return 0;
		const double rank = std::ceil(p * static_cast<double>(sorted.size()));
		size_t idx = (rank <= 1.0) ? 0 : static_cast<size_t>(rank - 1.0);
		if (idx >= sorted.size()) idx = sorted.size() - 1;
		return sorted[idx];
	}
};

} // namespace Replibench
