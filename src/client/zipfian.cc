#include "zipfian.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace Replibench {

ZipfianGenerator::ZipfianGenerator(int64_t items, double theta)
	: items_(items), theta_(theta) {
	if (items < 1) {
		throw std::invalid_argument("Zipfian generator needs at least one item");
	}
	if (!(theta > 0.0 && theta < 1.0)) {
		throw std::invalid_argument("Zipfian theta must be in (0, 1), got " + std::to_string(theta));
	}
	zeta2theta_ = Zeta(2, theta_);
	zetan_ = Zeta(items_, theta_);
	alpha_ = 1.0 / (1.0 - theta_);
	eta_ = (1.0 - std::pow(2.0 / static_cast<double>(items_), 1.0 - theta_)) /
		(1.0 - zeta2theta_ / zetan_);
}

double ZipfianGenerator::Zeta(int64_t n, double theta) {
	double sum = 0.0;
	for (int64_t i = 1; i <= n; i++) {
		sum += 1.0 / std::pow(static_cast<double>(i), theta);
	}
	return sum;
}

int64_t ZipfianGenerator::Next(std::mt19937_64& rng) {
	const double u = uniform_(rng);
	const double uz = u * zetan_;
	if (uz < 1.0) {
		return 0;
	}
	if (items_ > 1 && uz < 1.0 + std::pow(0.5, theta_)) {
		return 1;
	}
	int64_t key = static_cast<int64_t>(
		static_cast<double>(items_) * std::pow(eta_ * u - eta_ + 1.0, alpha_));
	if (key >= items_) {
		key = items_ - 1;
	}
	return key < 0 ? 0 : key;
}

} // namespace Replibench
