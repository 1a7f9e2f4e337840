

#include <iostream>

#include "common.h"

#include "diskprov/StepPlanner.h"
#include "diskprov/StepExecutor.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


Environment
test_environment()
{
    Environment env;
    env.workers = 1;
    env.retry_backoff_ms = 0;
    env.lock = false;
    return env;
}


void
third_step_fails()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();
    check(plan.getStep(3).text() == "Format(efi)");

    StubRunner runner;
    runner.failProgram("mkfs.fat", 1);

    Environment env = test_environment();
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    check(results.size() == 5);

    check(results[0].status == STEP_SUCCEEDED);
    check(results[1].status == STEP_SUCCEEDED);

    check(results[2].status == STEP_FAILED);
    check(results[2].error == ERR_COMMAND_NON_ZERO_EXIT);
    check(results[2].attempts == 1);
    check(results[2].retries == 0);
    check(results[2].detail.find("mkfs.fat") != string::npos);

    check(results[3].status == STEP_SKIPPED);
    check(results[3].skip_reason == SKIP_DEPENDENCY_FAILED);
    check(results[4].status == STEP_SKIPPED);
    check(results[4].skip_reason == SKIP_DEPENDENCY_FAILED);

    check(runner.numCalls("mkfs.fat") == 1);
    check(runner.numCalls("fatlabel") == 0);
    check(runner.numCalls("mkdir") == 0);
    check(runner.numCalls("mount") == 0);
}


void
other_disk_halted()
{
    Layout layout = simple_layout();

    layout.addDisk(Disk("/dev/test-b"));
    layout.addPartition(Partition("/dev/test-b", 1, 1 * MiB, 1024 * MiB, "btrfs"));
    Filesystem data("data", BTRFS);
    data.devices.push_back("/dev/test-b1");
    layout.addFilesystem(data);
    layout.addMount(Mount("data", "/mnt/data"));

    layout.validate();

    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("mkfs.fat", 1);

    Environment env = test_environment();
    check(env.stop_on_any_failure);

    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    check(find_result(results, "Format(efi)").status == STEP_FAILED);
    check(find_result(results, "Label(efi)").skip_reason == SKIP_DEPENDENCY_FAILED);

    // nothing is started after the first failure
    check(find_result(results, "Wipe(/dev/test-b)").status == STEP_SKIPPED);
    check(find_result(results, "Wipe(/dev/test-b)").skip_reason == SKIP_RUN_HALTED);
    check(find_result(results, "Format(data)").skip_reason == SKIP_RUN_HALTED);
    check(find_result(results, "Mount(/mnt/data)").skip_reason == SKIP_RUN_HALTED);

    check(runner.numCalls("mkfs.btrfs") == 0);

    for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	check(it->status != STEP_PENDING);
}


void
all_succeed()
{
    Layout layout = simple_layout();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;

    Environment env = test_environment();
    env.workers = 4;

    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
    {
	check(it->status == STEP_SUCCEEDED);
	check(it->attempts == 1);
    }

    // steps on one disk never run at the same time, so the order is the plan order
    vector<string> lines = runner.getLines();
    check(lines.front() == "blockdev --getsize64 /dev/test-a");
    check(lines.back() == "mount -t vfat /dev/test-a1 /mnt/efi");
}


int
main()
{
    setup_logger();

    third_step_fails();
    other_disk_halted();
    all_succeed();

    cout << "executor-failfast ok" << endl;
}
