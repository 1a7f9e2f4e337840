

#include <iostream>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <stdlib.h>
#include <unistd.h>
#include <sys/wait.h>

#include "common.h"

#include "diskprov/Orchestrator.h"
#include "diskprov/Utils/XmlFile.h"
#include "diskprov/Utils/Lock.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Exception.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


Environment
test_environment()
{
    Environment env;
    env.retry_backoff_ms = 0;
    env.lock = false;
    return env;
}


void
completed()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    check(orchestrator.getState() == IDLE);

    vector<string> disks = { "/dev/test-a", "/dev/test-b", "/dev/test-c", "/dev/test-d" };
    Layout layout = raid_layout(disks);

    RunReport report = orchestrator.run(layout);

    check(orchestrator.getState() == COMPLETED);
    check(report.getState() == COMPLETED);
    check(report.getError() == ERR_NONE);
    check(report.getResults().size() == 10);
    check(report.count(STEP_SUCCEEDED) == 10);
    check(report.firstFailures().empty());

    vector<string> lines = runner.getLines();
    check(find(lines.begin(), lines.end(), "mkfs.btrfs -f -d raid0 -m raid0 /dev/test-a1 "
	       "/dev/test-b1 /dev/test-c1 /dev/test-d1") != lines.end());

    ostringstream tmp;
    tmp << report;
    check(tmp.str().find("state: Completed") != string::npos);

    check(report.save("orchestrator-report.xml"));

    XmlFile xml("orchestrator-report.xml");
    const xmlNode* root = xml.getRootElement();
    string state;
    check(getChildValue(root, "state", state));
    check(state == "Completed");
    check(getChildNodes(root, "step").size() == 10);
}


void
invalid_layout()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));
    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB));
    layout.addPartition(Partition("/dev/test-a", 2, 256 * MiB, 1024 * MiB));

    RunReport report = orchestrator.run(layout);

    check(report.getState() == HALTED);
    check(report.getError() == ERR_INVALID_LAYOUT);
    check(report.getErrorDetail().find("overlap") != string::npos);
    check(report.getResults().empty());
    check(runner.getCommands().empty());
}


void
unsupported()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));
    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB));
    Filesystem efi("efi", FAT32);
    efi.devices.push_back("/dev/test-a1");
    efi.uuid = "66696c65-7379-7374-656d-000000000001";
    layout.addFilesystem(efi);

    check_throw(orchestrator.plan(layout), UnsupportedOperationException);

    RunReport report = orchestrator.run(layout);

    check(report.getState() == HALTED);
    check(report.getError() == ERR_UNSUPPORTED_OPERATION);
    check(runner.getCommands().empty());
}


void
halted()
{
    StubRunner runner;
    runner.failProgram("mkfs.fat", 1);

    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    RunReport report = orchestrator.run(simple_layout());

    check(report.getState() == HALTED);
    check(orchestrator.getState() == HALTED);

    // the failure is reported with the step, not as error of the run
    check(report.getError() == ERR_NONE);
    check(report.count(STEP_SUCCEEDED) == 2);
    check(report.count(STEP_FAILED) == 1);
    check(report.count(STEP_SKIPPED) == 2);

    vector<const StepResult*> failures = report.firstFailures();
    check(failures.size() == 1);
    check(failures.front()->id == 3);

    const StepResult* result = report.getResult(3);
    check(result && result->status == STEP_FAILED);
    check(result->error == ERR_COMMAND_NON_ZERO_EXIT);
    check(report.getResult(4)->skip_reason == SKIP_DEPENDENCY_FAILED);
    check(!report.getResult(42));

    ostringstream tmp;
    tmp << report;
    check(tmp.str().find("FAILED: step 3 Format(efi)") != string::npos);
    check(tmp.str().find("HALTED") != string::npos);
}


void
dry_run()
{
    StubRunner runner;
    Environment env = test_environment();
    Orchestrator orchestrator(runner, env);

    Layout layout = simple_layout();

    Plan plan1 = orchestrator.plan(layout);
    Plan plan2 = orchestrator.plan(layout);

    ostringstream s1, s2;
    s1 << plan1;
    s2 << plan2;
    check(s1.str() == s2.str());

    check(runner.getCommands().empty());
    check(orchestrator.getState() == IDLE);
}


void
environment()
{
    {
	ofstream file("orchestrator-sysconfig");
	file << "# test" << endl
	     << "WORKERS=\"3\"" << endl
	     << "RETRIES='2'" << endl
	     << "STOP_ON_ANY_FAILURE=\"no\"" << endl
	     << "TIMEOUT=\"abc\"" << endl;
    }

    Environment env;
    env.readSysconfig("orchestrator-sysconfig");

    check(env.workers == 3);
    check(env.retries == 2);
    check(!env.stop_on_any_failure);
    check(env.timeout == 60);
    check(env.numWorkers(10) == 3);

    Environment defaults;
    defaults.readSysconfig("orchestrator-does-not-exist");
    check(defaults.workers == 0);
    check(defaults.numWorkers(4) == 4);
    check(defaults.numWorkers(12) == 8);
    check(defaults.numWorkers(0) == 1);
}


void
lock_files()
{
    unsetenv("DISKPROV_NO_LOCKING");

    // without a directory the lock file is created right here
    {
	Lock lock(false, "orchestrator-plain.lock");
    }
    check(checkNormalFile("orchestrator-plain.lock"));

    {
	Lock lock(false, "orchestrator-locks/sub/lock");
    }
    check(checkNormalFile("orchestrator-locks/sub/lock"));

    setenv("DISKPROV_NO_LOCKING", "1", 1);
}


void
locked()
{
    const string lock_file = "orchestrator.lock";

    int ready[2], done[2];
    check(pipe(ready) == 0 && pipe(done) == 0);

    // fcntl locks do not conflict within one process
    pid_t child = fork();
    check(child >= 0);

    if (child == 0)
    {
	unsetenv("DISKPROV_NO_LOCKING");
	Lock lock(false, lock_file);

	char c = 'x';
	if (write(ready[1], &c, 1) != 1 || read(done[0], &c, 1) != 1)
	    _exit(EXIT_FAILURE);
	_exit(EXIT_SUCCESS);
    }

    char c;
    check(read(ready[0], &c, 1) == 1);

    unsetenv("DISKPROV_NO_LOCKING");

    try
    {
	Lock lock(false, lock_file);
	check(false);
    }
    catch (const LockException& e)
    {
	check(e.getLockerPid() == child);
	check(e.errorKind() == ERR_LOCKED);
    }

    StubRunner runner;
    Environment env = test_environment();
    env.lock = true;
    env.lock_file = lock_file;
    Orchestrator orchestrator(runner, env);

    RunReport report = orchestrator.run(simple_layout());

    check(report.getState() == HALTED);
    check(report.getError() == ERR_LOCKED);
    check(report.getErrorDetail() == "locked by process " + decString(child));
    check(runner.getCommands().empty());

    setenv("DISKPROV_NO_LOCKING", "1", 1);

    check(write(done[1], &c, 1) == 1);

    int status = 0;
    check(waitpid(child, &status, 0) == child);
    check(WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS);
}


int
main()
{
    setup_logger();

    completed();
    invalid_layout();
    unsupported();
    halted();
    dry_run();
    environment();
    lock_files();
    locked();

    cout << "orchestrator ok" << endl;
}
