#pragma once

#include <cstdint>
#include <random>

namespace Replibench {

/**
 * YCSB zipfian generator (Gray et al., "Quickly Generating Billion-Record
 * Synthetic Databases") over [0, items). Item 0 is the most popular.
 */
class ZipfianGenerator {
	public:
		/**
		 * @param items Number of keys, at least 1
		 * @param theta Skew in (0, 1)
		 * Throws std::invalid_argument for values outside those ranges.
		 */
		ZipfianGenerator(int64_t items, double theta);

		int64_t Next(std::mt19937_64& rng);

		int64_t items() const { return items_; }
		double theta() const { return theta_; }

	private:
		static double Zeta(int64_t n, double theta);

		int64_t items_;
		double theta_;
		double zeta2theta_;
		double zetan_;
		double alpha_;
		double eta_;
		std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

} // namespace Replibench
