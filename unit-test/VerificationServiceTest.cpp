#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_collaborators.hpp"
#include "worker.hpp"

using namespace std;
using namespace verifier;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class VerificationServiceTest : public ::testing::Test {
protected:
    NiceMock<mock::sandbox_executor> executor;
    NiceMock<mock::dependency_vetter> vetter;
    NiceMock<mock::contract_validator> validator;
    unique_ptr<verification_orchestrator> orchestrator;

    mutex mut;
    vector<verification_report> reports;
    vector<exception_ptr> errors;

    void SetUp() override {
        ON_CALL(executor, execute(_, _)).WillByDefault(Return(mock::passing_execution()));
        ON_CALL(vetter, vet(_, _)).WillByDefault(Return(vector<dependency_vet>{}));
        ON_CALL(validator, validate(_, _)).WillByDefault(Return(mock::passing_contract()));

        orchestrator_options options;
        options.dependency_vetting_sla_ms = 1000;
        options.static_analysis_sla_ms = 1000;
        options.test_execution_sla_ms = 1000;
        options.contract_validation_sla_ms = 1000;
        options.finalization_sla_ms = 1000;
        orchestrator = make_unique<verification_orchestrator>(executor, vetter, validator, options);
    }

    verification_job make_job(const task_schema &task, cancellation_token token = cancellation_token()) {
        verification_job job;
        job.task = task;
        job.token = token;
        job.on_completed = [this](verification_report report) {
            scoped_lock lock(mut);
            reports.push_back(move(report));
        };
        job.on_failed = [this](exception_ptr error) {
            scoped_lock lock(mut);
            errors.push_back(error);
        };
        return job;
    }
};

TEST_F(VerificationServiceTest, CompletesAllSubmittedTasksTest) {
    verification_service service(*orchestrator, 2);
    for (int i = 0; i < 5; ++i)
        service.submit(make_job(mock::python_task("task-" + to_string(i))));
    service.stop();

    EXPECT_TRUE(errors.empty());
    ASSERT_EQ(reports.size(), 5u);
    set<string> task_ids;
    for (auto &report : reports) {
        task_ids.insert(report.task_id);
        EXPECT_EQ(report.output.verdict, verdict::PASS);
    }
    EXPECT_EQ(task_ids.size(), 5u);
    EXPECT_EQ(service.pending(), 0u);
}

TEST_F(VerificationServiceTest, WorkersBoundConcurrencyTest) {
    atomic<int> running{0}, peak{0};
    ON_CALL(executor, execute(_, _)).WillByDefault(Invoke([&](const execution_request &, const cancellation_token &) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        this_thread::sleep_for(chrono::milliseconds(100));
        --running;
        return mock::passing_execution();
    }));

    verification_service service(*orchestrator, 2);
    for (int i = 0; i < 6; ++i)
        service.submit(make_job(mock::python_task("task-" + to_string(i))));
    service.stop();

    EXPECT_EQ(reports.size(), 6u);
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST_F(VerificationServiceTest, InvalidTaskIsReportedAsFailureTest) {
    task_schema task = mock::python_task();
    task.submit.artifacts.clear();

    verification_service service(*orchestrator, 1);
    service.submit(make_job(task));
    service.stop();

    EXPECT_TRUE(reports.empty());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_THROW(rethrow_exception(errors[0]), invalid_request);
}

TEST_F(VerificationServiceTest, CancelledJobIsReportedAsFailureTest) {
    cancellation_token token;
    token.cancel();

    verification_service service(*orchestrator, 1);
    service.submit(make_job(mock::python_task(), token));
    service.submit(make_job(mock::python_task("task-2")));
    service.stop();

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_THROW(rethrow_exception(errors[0]), verification_cancelled);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].task_id, "task-2");
}

TEST_F(VerificationServiceTest, CallbackErrorDoesNotStopWorkerTest) {
    verification_service service(*orchestrator, 1);
    verification_job failing = make_job(mock::python_task("task-1"));
    failing.on_completed = [](verification_report) { throw runtime_error("consumer went away"); };
    service.submit(move(failing));
    service.submit(make_job(mock::python_task("task-2")));
    service.stop();

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].task_id, "task-2");
}

TEST_F(VerificationServiceTest, RejectsSubmitAfterStopTest) {
    verification_service service(*orchestrator, 1);
    service.stop();
    EXPECT_THROW(service.submit(make_job(mock::python_task())), internal_error);
    service.stop();
}

TEST_F(VerificationServiceTest, NeedsAtLeastOneWorkerTest) {
    EXPECT_THROW({ verification_service service(*orchestrator, 0); }, invalid_request);
}
