#pragma once

#include "summary.h"

namespace Replibench {

/**
 * Sends the pre-generated workload to the replica. Runs on its own thread
 * until the workload is exhausted or the run deadline fires.
 */
class Issuer {
	public:
		virtual ~Issuer() = default;
		virtual void Run() = 0;

		virtual int64_t issued_operations() const = 0;
};

/**
 * Matches replies against issued work and accumulates the run's Summary.
 * Runs on its own thread; the Summary is moved out when Run returns.
 */
class ResponseCollector {
	public:
		virtual ~ResponseCollector() = default;
		virtual Summary Run() = 0;
};

} // namespace Replibench
