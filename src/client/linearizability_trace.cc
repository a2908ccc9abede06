#include "linearizability_trace.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <glog/logging.h>

namespace Replibench {

std::string LinearizabilityTrace::FileName(int client_id) {
	return "linearizability." + std::to_string(client_id) + ".out";
}

LinearizabilityTrace::LinearizabilityTrace(const std::string& path) : path_(path) {
	out_.open(path_, std::ios::out | std::ios::trunc);
	if (!out_.is_open()) {
		throw std::runtime_error("Failed to open linearizability trace " + path_ + ": " + strerror(errno));
	}
	LOG(INFO) << "Recording linearizability trace to " << path_;
}

void LinearizabilityTrace::RecordInvocation(int64_t id, const Command& command, int64_t ts) {
	absl::MutexLock lock(&mu_);
	out_ << "INV," << id << "," << OperationName(command.op) << ","
		<< command.key << "," << command.value << "," << ts << "\n";
}

void LinearizabilityTrace::RecordResponse(const wire::Response& response, int64_t ts) {
	absl::MutexLock lock(&mu_);
	out_ << "RES," << response.tid << "," << response.size << ","
		<< static_cast<int>(response.is_fast) << ",";
	for (size_t i = 0; i < response.vals.size(); i++) {
		if (i > 0) out_ << ";";
		out_ << response.vals[i];
	}
	out_ << "," << ts << "\n";
}

void LinearizabilityTrace::RecordReply(const wire::ProposeReply& reply, int64_t ts) {
	absl::MutexLock lock(&mu_);
	out_ << "RES," << reply.command_id << ",1," << static_cast<int>(reply.ok) << ","
		<< reply.value << "," << ts << "\n";
}

void LinearizabilityTrace::Flush() {
	absl::MutexLock lock(&mu_);
	out_.flush();
	if (!out_) {
		LOG(ERROR) << "Failed to flush linearizability trace " << path_;
	}
}

} // namespace Replibench
