#include "bench_runner.h"

#include <algorithm>
#include <future>
#include <thread>

#include <glog/logging.h>

#include "abd_client.h"
#include "admission_ledger.h"
#include "fast_path_client.h"
#include "linearizability_trace.h"
#include "response_queue.h"
#include "result_writer.h"
#include "workload_generator.h"

namespace Replibench {

BenchRunner::BenchRunner(const RunParameters& params) : params_(params) {}

RunReport BenchRunner::Run() {
	LOG(INFO) << "Client " << params_.client_id << ": connecting to "
		<< params_.server_address << ":" << params_.server_port;
	std::unique_ptr<Connection> conn = Connection::Dial(
		params_.server_address, params_.server_port, params_.connect_timeout_ms);
	return Run(std::move(conn));
}

RunReport BenchRunner::Run(std::unique_ptr<Connection> conn) {
	WorkloadGenerator workload(params_);

	std::unique_ptr<LinearizabilityTrace> trace;
	if (params_.linearizability_check) {
		trace = std::make_unique<LinearizabilityTrace>(LinearizabilityTrace::FileName(params_.client_id));
	}

	const RunDeadline deadline = RunDeadline::StartingNow(std::chrono::seconds(params_.duration_s));
	const size_t concurrency = static_cast<size_t>(std::max(1, params_.concurrency));

	std::unique_ptr<AdmissionLedger> ledger;
	std::unique_ptr<ResponseQueue> queue;
	std::unique_ptr<ResponseDecoder> decoder;
	std::unique_ptr<Issuer> issuer;
	std::unique_ptr<ResponseCollector> collector;

	if (params_.protocol == Protocol::kAbd) {
		ledger = std::make_unique<PermitLedger>(concurrency);
		queue = std::make_unique<ResponseQueue>(params_.buffer_size);
		decoder = std::make_unique<ResponseDecoder>(conn->input(), queue.get());
		issuer = std::make_unique<AbdIssuer>(params_, &workload, ledger.get(), deadline, conn.get(), trace.get());
		collector = std::make_unique<AbdResponseCollector>(params_, queue.get(), ledger.get(), deadline, trace.get());
	} else {
		auto count_ledger = std::make_unique<CountLedger>(concurrency);
		issuer = std::make_unique<FastPathIssuer>(params_, &workload, count_ledger.get(), deadline, conn.get(), trace.get());
		collector = std::make_unique<FastPathResponseCollector>(params_, count_ledger.get(), deadline, conn.get(), trace.get());
		ledger = std::move(count_ledger);
	}

	LOG(INFO) << "Client " << params_.client_id << ": starting " << ProtocolName(params_.protocol)
		<< " run for " << params_.duration_s << " s, " << workload.size() << " operations, batch "
		<< params_.batch_size << ", concurrency " << concurrency;

	std::promise<Summary> summary_promise;
	std::future<Summary> summary_future = summary_promise.get_future();

	std::thread decoder_thread;
	if (decoder) {
		decoder_thread = std::thread([&decoder]() { decoder->Run(); });
	}
	std::thread collector_thread([&collector, &summary_promise]() {
		try {
			summary_promise.set_value(collector->Run());
		} catch (const std::exception& e) {
			LOG(ERROR) << "Collector failed: " << e.what();
			summary_promise.set_exception(std::current_exception());
		}
	});
	std::thread issuer_thread([&issuer]() { issuer->Run(); });

	// A fast-path collector can sit in a blocking read past the deadline.
	if (summary_future.wait_until(deadline.at() + kShutdownGrace) != std::future_status::ready) {
		LOG(WARNING) << "Collector still busy after the deadline, shutting the connection down";
	}
	conn->Shutdown();
	if (queue) {
		queue->Close();
	}

	issuer_thread.join();
	collector_thread.join();
	if (decoder_thread.joinable()) {
		decoder_thread.join();
	}

	issued_operations_ = issuer->issued_operations();
	summary_ = summary_future.get();
	if (decoder) {
		VLOG(1) << "Decoder: " << decoder->decoded() << " responses decoded, " << decoder->failed() << " failed";
	}
	if (trace) {
		trace->Flush();
	}

	RunReport report = Aggregate(summary_, params_);
	LogReport(report);
	if (params_.dump_latency) {
		if (!DumpLatencies(summary_, LatencyDumpFileName(params_.client_id))) {
			LOG(WARNING) << "Client " << params_.client_id << ": latency dump incomplete";
		}
	}
	if (params_.record_results) {
		ResultWriter writer(params_);
		writer.SetReport(report);
	}
	return report;
}

} // namespace Replibench
