

#include <iostream>

#include "common.h"

#include "diskprov/Orchestrator.h"


using namespace std;
using namespace diskprov;


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
cancel_during_destructive_command()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    runner.setHook([&orchestrator](const Command& command) {
	if (command.args.front() == "wipefs" && command.destructive)
	    orchestrator.cancel();
    });

    RunReport report = orchestrator.run(simple_layout());

    check(report.getState() == HALTED);
    check(report.getError() == ERR_CANCELLED);

    // the running wipe is not interrupted
    const vector<StepResult>& results = report.getResults();
    check(results[0].status == STEP_SUCCEEDED);
    check(runner.numCalls("dd") == 2);

    for (unsigned i = 1; i < results.size(); ++i)
    {
	check(results[i].status == STEP_SKIPPED);
	check(results[i].skip_reason == SKIP_CANCELLED);
    }

    check(runner.numCalls("parted") == 0);
}


void
cancel_during_partition_settle()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    runner.setHook([&orchestrator](const Command& command) {
	if (command.args.front() == "udevadm")
	    orchestrator.cancel();
    });

    RunReport report = orchestrator.run(simple_layout());

    check(report.getState() == HALTED);
    check(report.getError() == ERR_CANCELLED);

    // the partitioning runs to the end including the wipe of the new partition
    const StepResult& partition = find_result(report.getResults(), "Partition(/dev/test-a)");
    check(partition.status == STEP_SUCCEEDED);

    vector<string> lines = runner.getLines();
    check(lines.back() == "wipefs --all --force /dev/test-a1");

    const StepResult& format = find_result(report.getResults(), "Format(efi)");
    check(format.status == STEP_SKIPPED);
    check(format.skip_reason == SKIP_CANCELLED);
    check(runner.numCalls("mkfs.fat") == 0);
}


void
cancel_during_non_destructive_command()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    runner.setHook([&orchestrator](const Command& command) {
	if (command.args.front() == "fatlabel")
	    orchestrator.cancel();
    });

    RunReport report = orchestrator.run(simple_layout());

    check(report.getState() == HALTED);
    check(report.getError() == ERR_CANCELLED);

    const StepResult& label = find_result(report.getResults(), "Label(efi)");
    check(label.status == STEP_FAILED);
    check(label.error == ERR_CANCELLED);
    check(label.retries == 0);

    check(find_result(report.getResults(), "Format(efi)").status == STEP_SUCCEEDED);
    check(find_result(report.getResults(), "Mount(/mnt/efi)").status == STEP_SKIPPED);
    check(runner.numCalls("mount") == 0);
}


void
cancel_before_run()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    orchestrator.cancel();

    RunReport report = orchestrator.run(simple_layout());

    check(report.getState() == HALTED);
    check(report.getError() == ERR_CANCELLED);
    check(report.getResults().empty());
    check(runner.getCommands().empty());
}


int
main()
{
    setup_logger();

    cancel_during_destructive_command();
    cancel_during_partition_settle();
    cancel_during_non_destructive_command();
    cancel_before_run();

    cout << "executor-cancel ok" << endl;
}
