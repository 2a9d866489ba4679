#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include "common/exceptions.hpp"

namespace verifier {
using namespace std;

static const auto POLL_INTERVAL = chrono::milliseconds(10);

verification_service::verification_service(verification_orchestrator &orchestrator, size_t workers)
    : orchestrator(orchestrator) {
    if (workers == 0) throw invalid_request("verification service needs at least one worker");
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Verification service started with " << workers << " workers";
}

verification_service::~verification_service() {
    stop();
}

void verification_service::submit(verification_job job) {
    scoped_lock lock(submit_mutex);
    if (stopping) throw internal_error("verification service has been stopped");
    DLOG(INFO) << "Task " << job.task.meta.task_id << " queued, " << queue.size() << " tasks waiting";
    queue.push(move(job));
}

size_t verification_service::pending() const {
    return queue.size();
}

void verification_service::stop() {
    {
        scoped_lock lock(submit_mutex);
        if (stopping) return;
        stopping = true;
    }
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
    LOG(INFO) << "Verification service stopped";
}

void verification_service::worker_loop(size_t worker_id) {
    while (true) {
        verification_job job;
        if (!queue.pop_for(job, POLL_INTERVAL)) {
            if (!stopping) continue;
            // stopping 置位之后不会再有新任务，队列为空时自然退出
            if (!queue.try_pop(job)) break;
        }

        const string task_id = job.task.meta.task_id;
        DLOG(INFO) << "Worker " << worker_id << " picked up task " << task_id;

        verification_report report;
        exception_ptr error;
        try {
            report = orchestrator.run_verification(job.task, job.token);
        } catch (verification_cancelled &) {
            LOG(WARNING) << "Worker " << worker_id << ": verification of task " << task_id << " cancelled";
            error = current_exception();
        } catch (invalid_request &ex) {
            LOG(WARNING) << "Worker " << worker_id << ": rejected task " << task_id << ", " << ex.what();
            error = current_exception();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " failed to verify task " << task_id << endl
                       << boost::diagnostic_information(ex);
            error = current_exception();
        }

        try {
            if (error) {
                if (job.on_failed) job.on_failed(error);
            } else if (job.on_completed) {
                job.on_completed(move(report));
            }
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting task " << task_id << ", " << ex.what();
        }
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace verifier
