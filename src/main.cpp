#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/cancellation.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"
#include "monitor/log_monitor.hpp"
#include "sandbox/local_executor.hpp"
#include "verify/contract_validator.hpp"
#include "verify/dependency_vetter.hpp"
#include "verify/orchestrator.hpp"
#include "verify/serialization.hpp"
#include "verify/verdict.hpp"
#include "worker.hpp"
using namespace std;
using namespace verifier;

static cancellation_token interrupt;

void sigintHandler(int /* signum */) {
    interrupt.cancel();
}

static task_schema load_task(const string &path) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(read_file_content(path));
    } catch (nlohmann::json::exception &e) {
        throw invalid_request("Task file " + path + " is not valid JSON: " + e.what());
    } catch (system_error &e) {
        throw invalid_request("Unable to read task file " + path + ": " + e.what());
    }
    return parse_task(j);
}

/**
 * @brief 只运行沙箱，输出执行结果与判定映射
 */
static int execute_only(sandbox_executor &executor, const orchestrator_options &options, const string &path) {
    task_schema task = load_task(path);
    execution_request request = build_request(task.meta.task_id, task.submit.subtask_id, task.submit.agent_role,
                                               task.submit.artifacts, task.submit.runtime);
    if (options.customize_config) options.customize_config(request.config);
    validate_request(request);

    execution_result result = executor.execute(request, interrupt);
    verdict_mapping mapping = map_to_verdict(result);
    nlohmann::json output = {{"execution_result", result}, {"verdict", mapping}};
    cout << output.dump(2) << endl;
    return mapping.verdict == verdict::PASS ? E_SUCCESS : E_VERIFICATION_FAILED;
}

static int verify_tasks(verification_orchestrator &orchestrator, const vector<string> &paths, size_t jobs, const string &output_dir) {
    vector<task_schema> tasks;
    for (auto &path : paths) tasks.push_back(load_task(path));

    mutex results_mutex;
    vector<optional<verification_report>> reports(tasks.size());
    bool has_error = false;
    {
        verification_service service(orchestrator, min(jobs, tasks.size()));
        for (size_t i = 0; i < tasks.size(); ++i) {
            verification_job job;
            job.task = tasks[i];
            job.token = interrupt.child();
            job.on_completed = [&, i](verification_report report) {
                scoped_lock lock(results_mutex);
                reports[i] = move(report);
            };
            job.on_failed = [&](exception_ptr) {
                scoped_lock lock(results_mutex);
                has_error = true;
            };
            service.submit(move(job));
        }
        service.stop();
    }

    bool has_failure = false;
    nlohmann::json combined = nlohmann::json::array();
    for (auto &report : reports) {
        if (!report) continue;
        if (report->output.verdict == verdict::FAIL) has_failure = true;

        nlohmann::json j = *report;
        if (output_dir.empty()) {
            combined.push_back(j);
        } else {
            filesystem::path file = filesystem::path(output_dir) / (report->task_id + ".json");
            write_file_content(file, j.dump(2));
            LOG(INFO) << "Report " << report->report_id << " written to " << file;
        }
    }
    if (output_dir.empty())
        cout << (combined.size() == 1 ? combined[0] : combined).dump(2) << endl;

    if (has_error) return E_INTERNAL_ERROR;
    return has_failure ? E_VERIFICATION_FAILED : E_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("verifier options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("task", po::value<vector<string>>(), "verify the task described by the given JSON file, can be given multiple times")
        ("execute", po::value<string>(), "run only the sandbox for the task in the given JSON file and print the execution result with its verdict")
        ("config", po::value<string>(), "set the JSON configuration file with sandbox overrides, phase SLAs and dependency policy. You can either pass it from environ VERIFIER_CONFIG")
        ("output", po::value<string>(), "set the directory to write reports to as <task_id>.json, reports are printed to stdout if not given")
        ("sandbox-dir", po::value<string>(), "set the directory to create sandboxes in. You can either pass it from environ SANDBOX_DIR")
        ("jobs", po::value<size_t>(), "set the maximum number of concurrent sandboxes. You can either pass it from environ VERIFIER_JOBS")
        ("no-cgroup", "do not create cgroups for sandboxes even if running in privileged mode")
        ("allow-unisolated", "run sandboxes even if cgroup or seccomp isolation is unavailable")
        ("keep-sandbox", "do not delete sandbox directories after execution")
        ("debug", "turn on the debug mode to enable verbose logging and keep sandbox directories")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_INTERNAL_ERROR;
    }

    if (vm.count("help")) {
        cout << "verifier: Verify generated code in an isolated sandbox and route failures to repair agents" << endl
             << "cgroup resource limits require privileged mode" << endl
             << "Usage: " << argv[0] << " --task <task.json> [options]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "verifier 1.0" << endl;
        return E_SUCCESS;
    }

    if (!vm.count("task") && !vm.count("execute")) {
        cerr << "Either --task or --execute should be specified" << endl
             << endl;
        cerr << desc << endl;
        return E_INTERNAL_ERROR;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        DEBUG = true;
        KEEP_SANDBOX = true;
    }
    if (vm.count("keep-sandbox")) KEEP_SANDBOX = true;
    if (vm.count("allow-unisolated")) REQUIRE_ISOLATION = false;

    USE_CGROUP = getuid() == 0 && !vm.count("no-cgroup");
    if (!USE_CGROUP) {
        LOG(WARNING) << "Sandboxes run without cgroup, memory and CPU limits fall back to rlimits";
    }

    if (vm.count("sandbox-dir")) {
        SANDBOX_DIR = filesystem::path(vm.at("sandbox-dir").as<string>());
    } else if (getenv("SANDBOX_DIR")) {
        SANDBOX_DIR = filesystem::path(getenv("SANDBOX_DIR"));
    }
    filesystem::create_directories(SANDBOX_DIR);
    CHECK(filesystem::is_directory(SANDBOX_DIR))
        << "Sandbox directory " << SANDBOX_DIR << " does not exist";

    // 沙箱中的文件只允许当前用户写入
    umask(0022);

    nlohmann::json config = nlohmann::json::object();
    string config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else if (getenv("VERIFIER_CONFIG")) {
        config_path = getenv("VERIFIER_CONFIG");
    }
    dependency_policy policy;
    try {
        if (!config_path.empty()) {
            CHECK(filesystem::is_regular_file(config_path))
                << "Configuration file " << config_path << " does not exist";
            config = nlohmann::json::parse(read_file_content(config_path));
        }
        apply_global_config(config);
        if (nlohmann::exists(config, "dependency_policy"))
            config.at("dependency_policy").get_to(policy);
    } catch (std::exception &e) {
        LOG(ERROR) << "Configuration file " << config_path << " is malformed: " << e.what();
        return E_INTERNAL_ERROR;
    }

    size_t jobs = MAX_CONCURRENT_SANDBOXES;
    if (vm.count("jobs")) {
        jobs = vm.at("jobs").as<size_t>();
    } else if (getenv("VERIFIER_JOBS")) {
        jobs = boost::lexical_cast<size_t>(getenv("VERIFIER_JOBS"));
    }
    CHECK(jobs > 0) << "At least one concurrent sandbox is required";

    orchestrator_options options = orchestrator_options::from_globals();
    if (nlohmann::exists(config, "sandbox")) {
        nlohmann::json overrides = config.at("sandbox");
        options.customize_config = [overrides](sandbox_config &sandbox) {
            apply_sandbox_overrides(sandbox, overrides);
        };
    }

    local_sandbox_executor executor;
    manifest_dependency_vetter vetter(policy);
    route_contract_validator validator;

    try {
        if (vm.count("execute"))
            return execute_only(executor, options, vm.at("execute").as<string>());

        verification_orchestrator orchestrator(executor, vetter, validator, options);
        orchestrator.add_monitor(make_unique<log_monitor>());
        orchestrator.on_repair_request([](agent_role target, const string &suggestion) {
            LOG(INFO) << "Repair request routed to " << get_display_message(target) << ": " << suggestion;
        });

        string output_dir;
        if (vm.count("output")) {
            output_dir = vm.at("output").as<string>();
            filesystem::create_directories(output_dir);
        }
        return verify_tasks(orchestrator, vm.at("task").as<vector<string>>(), jobs, output_dir);
    } catch (invalid_request &e) {
        LOG(ERROR) << e.what();
        return E_INTERNAL_ERROR;
    } catch (verifier_exception &e) {
        LOG(ERROR) << e;
        return E_INTERNAL_ERROR;
    } catch (std::exception &e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        return E_INTERNAL_ERROR;
    }
}
