

#include <iostream>
#include <atomic>
#include <chrono>
#include <thread>

#include "common.h"

#include "diskprov/StepPlanner.h"
#include "diskprov/StepExecutor.h"


using namespace std;
using namespace diskprov;


Environment
test_environment(unsigned retries)
{
    Environment env;
    env.workers = 1;
    env.retries = retries;
    env.retry_backoff_ms = 10;
    env.lock = false;
    return env;
}


void
mount_fails_once()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("mount", 1, 32);

    Environment env = test_environment(1);
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    const StepResult& mount = find_result(results, "Mount(/mnt/efi)");
    check(mount.status == STEP_SUCCEEDED);
    check(mount.retries == 1);
    check(mount.attempts == 2);
    check(mount.error == ERR_NONE);

    check(runner.numCalls("mount") == 2);
}


void
mount_fails_twice()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("mount", 2, 32);

    Environment env = test_environment(1);
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    const StepResult& mount = find_result(results, "Mount(/mnt/efi)");
    check(mount.status == STEP_FAILED);
    check(mount.error == ERR_COMMAND_NON_ZERO_EXIT);
    check(mount.retries == 1);
    check(mount.attempts == 2);

    check(runner.numCalls("mount") == 2);
}


void
no_retries()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("fatlabel", 1);

    Environment env = test_environment(0);
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    const StepResult& label = find_result(results, "Label(efi)");
    check(label.status == STEP_FAILED);
    check(label.retries == 0);

    check(find_result(results, "Mount(/mnt/efi)").skip_reason == SKIP_DEPENDENCY_FAILED);
}


void
destructive_never_retried()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("parted", 1);

    Environment env = test_environment(3);
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    const StepResult& partition = find_result(results, "Partition(/dev/test-a)");
    check(partition.status == STEP_FAILED);
    check(partition.attempts == 1);
    check(partition.retries == 0);

    check(runner.numCalls("parted") == 1);
}


void
cancel_during_backoff()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();

    atomic<bool> cancel(false);
    thread canceller;

    StubRunner runner;
    runner.failProgram("mount", 1, 32);
    runner.setHook([&cancel, &canceller](const Command& command) {
	if (command.args.front() == "mount" && !canceller.joinable())
	    canceller = thread([&cancel]() {
		this_thread::sleep_for(chrono::milliseconds(200));
		cancel = true;
	    });
    });

    Environment env = test_environment(1);
    env.retry_backoff_ms = 10000;
    StepExecutor executor(runner, env);

    chrono::steady_clock::time_point start = chrono::steady_clock::now();
    vector<StepResult> results = executor.execute(plan, &cancel);
    chrono::steady_clock::duration elapsed = chrono::steady_clock::now() - start;

    if (canceller.joinable())
	canceller.join();

    const StepResult& mount = find_result(results, "Mount(/mnt/efi)");
    check(mount.status == STEP_FAILED);
    check(mount.error == ERR_CANCELLED);
    check(mount.retries == 0);
    check(mount.attempts == 1);

    check(runner.numCalls("mount") == 1);
    check(elapsed < chrono::seconds(5));
}


int
main()
{
    setup_logger();

    mount_fails_once();
    mount_fails_twice();
    no_retries();
    destructive_never_retried();
    cancel_during_backoff();

    cout << "executor-retry ok" << endl;
}
