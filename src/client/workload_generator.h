#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "common/configuration.h"
#include "common/kv_types.h"

namespace Replibench {

/**
 * Pre-generates the key and the read/write class of every operation of a run.
 *
 * Keys follow either a zipfian distribution over the key space ("zipfan")
 * or a conflict-rate mix: a single hot key with probability conflicts/100,
 * otherwise a key unique to this client. Generation is seeded with the client
 * id, so the same client identity replays the same workload.
 */
class WorkloadGenerator {
	public:
		static constexpr Key kHotKey = 42;
		static constexpr Key kUniqueKeyBase = 43;
		static constexpr Value kMaxPutValue = 10000000;

		/// Throws std::invalid_argument if the conflict percentage is outside [0, 100].
		explicit WorkloadGenerator(const RunParameters& params);

		size_t size() const { return keys_.size(); }
		Key key(size_t i) const { return keys_[i]; }
		bool is_read(size_t i) const { return reads_[i] != 0; }

		const std::vector<Key>& keys() const { return keys_; }

		/// Value for the next PUT, uniform in [0, kMaxPutValue).
		Value NextValue();

		static bool IsZipfian(const std::string& distribution);

	private:
		void GenerateKeys(const RunParameters& params);
		void GenerateReadMix(const RunParameters& params);

		std::vector<Key> keys_;
		std::vector<uint8_t> reads_;
		std::mt19937_64 key_rng_;
		std::mt19937_64 mix_rng_;
		std::uniform_int_distribution<Value> value_dist_{0, kMaxPutValue - 1};
};

} // namespace Replibench
