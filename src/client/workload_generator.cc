#include "workload_generator.h"

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

#include "zipfian.h"

namespace Replibench {

namespace {
	// Keeps the read/write draws independent of the key draws.
	constexpr uint64_t kMixSeedSalt = 0x9e3779b97f4a7c15ULL;
}

WorkloadGenerator::WorkloadGenerator(const RunParameters& params)
	: key_rng_(static_cast<uint64_t>(params.client_id)),
	  mix_rng_(static_cast<uint64_t>(params.client_id) ^ kMixSeedSalt) {
	if (params.conflicts < 0 || params.conflicts > 100) {
		throw std::invalid_argument("Conflicts percentage must be between 0 and 100.");
	}
	if (params.request_count < 0) {
		throw std::invalid_argument("Request count must not be negative");
	}
	GenerateKeys(params);
	GenerateReadMix(params);

	LOG(INFO) << "Client " << params.client_id << ": generated " << keys_.size()
		<< " operations, distribution=" << params.distribution
		<< " theta=" << params.zipfian_theta
		<< " read_ratio=" << params.read_ratio()
		<< " conflicts=" << params.conflicts
		<< " separate=" << params.separate;
}

bool WorkloadGenerator::IsZipfian(const std::string& distribution) {
	return distribution == "zipfan" || distribution == "zipfian";
}

void WorkloadGenerator::GenerateKeys(const RunParameters& params) {
	const size_t n = static_cast<size_t>(params.request_count);
	keys_.resize(n);

	if (IsZipfian(params.distribution)) {
		ZipfianGenerator zipf(params.key_space, params.zipfian_theta);
		for (size_t i = 0; i < n; i++) {
			keys_[i] = zipf.Next(key_rng_);
		}
		return;
	}

	std::uniform_int_distribution<int> percent(0, 99);
	for (size_t i = 0; i < n; i++) {
		if (percent(key_rng_) < params.conflicts) {
			keys_[i] = kHotKey;
		} else {
			// Unique per client and per operation: no artificial conflicts
			keys_[i] = params.start_range + kUniqueKeyBase + static_cast<Key>(i);
		}
	}
}

void WorkloadGenerator::GenerateReadMix(const RunParameters& params) {
	const size_t n = keys_.size();
	const size_t batch_size = static_cast<size_t>(std::max(1, params.batch_size));
	const double read_ratio = params.read_ratio();
	std::uniform_real_distribution<double> coin(0.0, 1.0);
	reads_.assign(n, 0);

	for (size_t i = 0; i < n;) {
		if (params.separate) {
			// One draw per batch: the whole batch is either reads or writes.
			const uint8_t is_read = coin(mix_rng_) < read_ratio ? 1 : 0;
			const size_t end = std::min(n, i + batch_size);
			for (; i < end; i++) {
				reads_[i] = is_read;
			}
		} else {
			reads_[i] = coin(mix_rng_) < read_ratio ? 1 : 0;
			i++;
		}
	}
}

Value WorkloadGenerator::NextValue() {
	return value_dist_(mix_rng_);
}

} // namespace Replibench
