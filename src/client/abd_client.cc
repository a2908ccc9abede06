#include "abd_client.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include <glog/logging.h>

namespace Replibench {

// ============================================================================
// AbdIssuer
// ============================================================================

AbdIssuer::AbdIssuer(const RunParameters& params,
		WorkloadGenerator* workload,
		AdmissionLedger* ledger,
		const RunDeadline& deadline,
		Connection* conn,
		LinearizabilityTrace* trace)
	: params_(params),
	  workload_(workload),
	  ledger_(ledger),
	  deadline_(deadline),
	  conn_(conn),
	  trace_(trace) {}

wire::Transaction AbdIssuer::BuildTransaction(WorkloadGenerator* workload, size_t begin, size_t end) {
	wire::Transaction txn;
	txn.commands.reserve(end - begin);
	bool all_reads = true;
	for (size_t i = begin; i < end; i++) {
		Command cmd;
		cmd.key = workload->key(i);
		if (workload->is_read(i)) {
			cmd.op = GET;
		} else {
			cmd.op = PUT;
			cmd.value = workload->NextValue();
			all_reads = false;
		}
		txn.commands.push_back(cmd);
	}
	// Replicas expect the commands of a transaction in key order.
	std::stable_sort(txn.commands.begin(), txn.commands.end(),
		[](const Command& a, const Command& b) { return a.key < b.key; });
	txn.read_only = all_reads && !txn.commands.empty();
	return txn;
}

void AbdIssuer::Run() {
	// Start-up stagger: client_id milliseconds.
	std::this_thread::sleep_for(std::chrono::milliseconds(params_.client_id));

	const size_t n = workload_->size();
	const size_t batch_size = static_cast<size_t>(std::max(1, params_.batch_size));
	PacingTimer timer(PacingTimer::BatchInterval(params_), RunDeadline::Clock::now());
	VLOG(1) << "AbdIssuer: " << n << " operations, batch " << batch_size
		<< ", pacing interval " << timer.interval().count() << " ns";

	size_t i = 0;
	while (i < n && !deadline_.Expired()) {
		const size_t end = std::min(n, i + batch_size);
		wire::Transaction txn = BuildTransaction(workload_, i, end);

		if (!timer.WaitForTick(deadline_)) {
			break;
		}
		if (!ledger_->Reserve(1, deadline_)) {
			VLOG(1) << "AbdIssuer: deadline fired while waiting for a permit";
			break;
		}

		i = end;
		txn.ts = MakeTimestamp();
		txn.tid = static_cast<int64_t>(i);
		if (trace_ != nullptr) {
			for (const Command& cmd : txn.commands) {
				trace_->RecordInvocation(txn.tid, cmd, txn.ts);
			}
		}

		if (!wire::WriteTransaction(txn, conn_->output()) || !conn_->Flush()) {
			LOG(ERROR) << "AbdIssuer: failed to send transaction " << txn.tid << ", stopping issuance";
			ledger_->Release(1);
			break;
		}
		issued_txns_.fetch_add(1, std::memory_order_relaxed);
		issued_ops_.fetch_add(static_cast<int64_t>(txn.commands.size()), std::memory_order_relaxed);
	}

	LOG(INFO) << "AbdIssuer: issued " << issued_transactions() << " transactions ("
		<< issued_operations() << " operations)";
}

// ============================================================================
// ResponseDecoder
// ============================================================================

ResponseDecoder::ResponseDecoder(google::protobuf::io::ZeroCopyInputStream* in, ResponseQueue* queue)
	: in_(in), queue_(queue) {}

void ResponseDecoder::Run() {
	while (!queue_->closed()) {
		wire::Response resp;
		switch (wire::ReadResponse(in_, &resp)) {
			case wire::ReadStatus::kOk:
				decoded_.fetch_add(1, std::memory_order_relaxed);
				if (!queue_->Push(DecodeEvent::Decoded(std::move(resp)))) {
					return;
				}
				break;
			case wire::ReadStatus::kMalformed:
				failed_.fetch_add(1, std::memory_order_relaxed);
				LOG(WARNING) << "ResponseDecoder: failed to decode response #"
					<< (decoded() + failed()) << ", skipping";
				if (!queue_->Push(DecodeEvent::Failed())) {
					return;
				}
				break;
			case wire::ReadStatus::kClosed:
				VLOG(1) << "ResponseDecoder: inbound stream closed after " << decoded() << " responses";
				return;
		}
	}
}

// ============================================================================
// AbdResponseCollector
// ============================================================================

AbdResponseCollector::AbdResponseCollector(const RunParameters& params,
		ResponseQueue* queue,
		AdmissionLedger* ledger,
		const RunDeadline& deadline,
		LinearizabilityTrace* trace)
	: params_(params),
	  queue_(queue),
	  ledger_(ledger),
	  deadline_(deadline),
	  trace_(trace) {
	summary_.Reserve(params_.request_count);
}

Summary AbdResponseCollector::Run() {
	while (summary_.ack_num < params_.request_count) {
		std::optional<DecodeEvent> event = queue_->Pop(deadline_);
		if (!event) {
			break;
		}
		Handle(*event);
	}
	const size_t outstanding = ledger_->Outstanding();
	const size_t complete = CompleteUnreleased();
	summary_.outstanding_batches = outstanding > complete ? outstanding - complete : 0;
	queue_->Close();

	if (summary_.outstanding_batches > 0) {
		LOG(WARNING) << "AbdResponseCollector: " << summary_.outstanding_batches
			<< " transactions still unacknowledged at the end of the run";
	}
	return std::move(summary_);
}

void AbdResponseCollector::Handle(const DecodeEvent& event) {
	if (event.kind == DecodeEvent::Kind::kDecodeFailed) {
		summary_.decode_failures++;
		return;
	}

	const wire::Response& resp = event.response;
	if (resp.size <= 0) {
		LOG(WARNING) << "AbdResponseCollector: ignoring response for tid " << resp.tid
			<< " with size " << resp.size;
		return;
	}

	const int64_t batch_size = std::max(1, params_.batch_size);
	int64_t size = resp.size;
	if (size > batch_size) {
		LOG(WARNING) << "AbdResponseCollector: response for tid " << resp.tid << " claims " << size
			<< " operations, clamping to batch size " << batch_size;
		size = batch_size;
	}

	const int64_t now = MakeTimestamp();
	summary_.RecordAcks(std::max<int64_t>(0, now - resp.ts), size);

	int64_t& acked = acked_by_tid_[resp.tid];
	if (acked < batch_size) {
		acked = std::min(batch_size, acked + size);
		if (acked == batch_size) {
			ledger_->Release(1);
		}
	}

	if (!resp.vals.empty()) {
		summary_.read_num += size;
		if (resp.is_fast == 0) {
			summary_.slow_num += size;
		}
	}

	if (trace_ != nullptr) {
		trace_->RecordResponse(resp, now);
	}
}

int64_t AbdResponseCollector::TransactionSize(int64_t tid, int64_t batch_size) {
	if (tid <= 0 || batch_size <= 0) {
		return batch_size;
	}
	return tid - batch_size * ((tid - 1) / batch_size);
}

size_t AbdResponseCollector::CompleteUnreleased() const {
	const int64_t batch_size = std::max(1, params_.batch_size);
	size_t n = 0;
	for (const auto& [tid, acked] : acked_by_tid_) {
		if (acked < batch_size && acked >= TransactionSize(tid, batch_size)) {
			n++;
		}
	}
	return n;
}

int64_t AbdResponseCollector::acknowledged(int64_t tid) const {
	auto it = acked_by_tid_.find(tid);
	return it == acked_by_tid_.end() ? 0 : it->second;
}

} // namespace Replibench
