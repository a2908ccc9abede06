#include "fast_path_client.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include <glog/logging.h>

namespace Replibench {

FastPathIssuer::FastPathIssuer(const RunParameters& params,
		WorkloadGenerator* workload,
		CountLedger* ledger,
		const RunDeadline& deadline,
		Connection* conn,
		LinearizabilityTrace* trace)
	: params_(params),
	  workload_(workload),
	  ledger_(ledger),
	  deadline_(deadline),
	  conn_(conn),
	  trace_(trace) {}

bool FastPathIssuer::RunTimeElapsed() const {
	return RunDeadline::Clock::now() - deadline_.start() > deadline_.duration() || deadline_.Expired();
}

void FastPathIssuer::Run() {
	std::this_thread::sleep_for(std::chrono::milliseconds(params_.client_id));

	const size_t n = workload_->size();
	const size_t batch_size = static_cast<size_t>(std::max(1, params_.batch_size));
	PacingTimer timer(PacingTimer::BatchInterval(params_), RunDeadline::Clock::now());
	VLOG(1) << "FastPathIssuer: " << n << " operations, batch " << batch_size
		<< ", pacing interval " << timer.interval().count() << " ns";

	size_t i = 0;
	while (i < n) {
		if (RunTimeElapsed()) {
			break;
		}

		const size_t end = std::min(n, i + batch_size);
		const size_t count = end - i;
		const int64_t ts = MakeTimestamp();
		bool write_ok = true;
		for (; i < end; i++) {
			wire::ProposeMessage msg;
			msg.command_id = static_cast<int32_t>(i);
			msg.command.key = workload_->key(i);
			if (workload_->is_read(i)) {
				msg.command.op = GET;
			} else {
				msg.command.op = PUT;
				msg.command.value = workload_->NextValue();
			}
			msg.timestamp = ts;
			if (trace_ != nullptr) {
				trace_->RecordInvocation(msg.command_id, msg.command, ts);
			}
			if (!wire::WritePropose(msg, conn_->output())) {
				write_ok = false;
				break;
			}
		}
		if (!write_ok) {
			LOG(ERROR) << "FastPathIssuer: failed to write propose " << i << ", stopping issuance";
			break;
		}

		if (!ledger_->Reserve(count, deadline_)) {
			VLOG(1) << "FastPathIssuer: deadline fired while announcing a batch";
			break;
		}
		if (!conn_->Flush()) {
			LOG(ERROR) << "FastPathIssuer: failed to flush batch ending at " << i << ", stopping issuance";
			break;
		}
		issued_ops_.fetch_add(static_cast<int64_t>(count), std::memory_order_relaxed);

		if (i < n && !timer.WaitForTick(deadline_)) {
			break;
		}
	}

	LOG(INFO) << "FastPathIssuer: issued " << issued_operations() << " operations";
}

FastPathResponseCollector::FastPathResponseCollector(const RunParameters& params,
		CountLedger* ledger,
		const RunDeadline& deadline,
		Connection* conn,
		LinearizabilityTrace* trace)
	: params_(params),
	  ledger_(ledger),
	  deadline_(deadline),
	  conn_(conn),
	  trace_(trace) {
	summary_.Reserve(params_.request_count);
}

Summary FastPathResponseCollector::Run() {
	while (summary_.ack_num < params_.request_count) {
		std::optional<size_t> count = ledger_->Claim(deadline_);
		if (!count) {
			break;
		}
		if (!CollectBatch(*count)) {
			LOG(WARNING) << "FastPathResponseCollector: inbound stream closed, stopping";
			break;
		}
		if (deadline_.Expired()) {
			break;
		}
	}
	summary_.outstanding_batches = ledger_->Outstanding();
	if (summary_.outstanding_batches > 0) {
		LOG(WARNING) << "FastPathResponseCollector: " << summary_.outstanding_batches
			<< " operations still unacknowledged at the end of the run";
	}
	return std::move(summary_);
}

bool FastPathResponseCollector::CollectBatch(size_t count) {
	bool open = true;
	for (size_t k = 0; k < count; k++) {
		if (deadline_.Expired()) {
			break;
		}
		wire::ProposeReply reply;
		wire::ReadStatus status = wire::ReadProposeReply(conn_->input(), &reply);
		if (status == wire::ReadStatus::kClosed) {
			open = false;
			break;
		}
		if (status == wire::ReadStatus::kMalformed) {
			summary_.decode_failures++;
			LOG(WARNING) << "FastPathResponseCollector: failed to decode reply " << k
				<< " of " << count << ", skipping";
			continue;
		}
		const int64_t now = MakeTimestamp();
		summary_.RecordAcks(std::max<int64_t>(0, now - reply.timestamp), 1);
		if (trace_ != nullptr) {
			trace_->RecordReply(reply, now);
		}
	}
	ledger_->Release(count);
	return open;
}

} // namespace Replibench
