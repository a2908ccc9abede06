#pragma once

#include <fstream>
#include <string>

#include "absl/synchronization/mutex.h"

#include "common/kv_types.h"
#include "common/wire_formats.h"

namespace Replibench {

/**
 * History of invocations and responses for an offline linearizability check.
 *
 * Lines are comma separated:
 *   INV,<id>,<op>,<key>,<value>,<ts>
 *   RES,<id>,<size>,<fast>,<v1;v2;...>,<ts>
 * Fast-path replies are recorded as RES,<command_id>,1,<ok>,<value>,<ts>.
 * Issuer and collector record from different threads.
 */
class LinearizabilityTrace {
	public:
		static std::string FileName(int client_id);

		/// Opens (truncates) the trace file. Throws std::runtime_error on failure.
		explicit LinearizabilityTrace(const std::string& path);

		void RecordInvocation(int64_t id, const Command& command, int64_t ts);
		void RecordResponse(const wire::Response& response, int64_t ts);
		void RecordReply(const wire::ProposeReply& reply, int64_t ts);

		void Flush();
		const std::string& path() const { return path_; }

	private:
		const std::string path_;
		absl::Mutex mu_;
		std::ofstream out_ ABSL_GUARDED_BY(mu_);
};

} // namespace Replibench
