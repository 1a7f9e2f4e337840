

#include <iostream>
#include <algorithm>

#include "common.h"

#include "diskprov/StepPlanner.h"
#include "diskprov/StepExecutor.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


// /dev/test-a with efi (fat32) and var (ext4), /dev/test-b with home (btrfs)
Layout
two_disks()
{
    Layout layout;

    layout.addDisk(Disk("/dev/test-a", ROLE_BOOT));
    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB, "fat32"));
    layout.addPartition(Partition("/dev/test-a", 2, 512 * MiB, 4096 * MiB, "ext4"));

    layout.addDisk(Disk("/dev/test-b"));
    Partition p("/dev/test-b", 1, 1 * MiB, 0, "btrfs");
    p.to_end = true;
    layout.addPartition(p);

    Filesystem efi("efi", FAT32);
    efi.devices.push_back("/dev/test-a1");
    efi.label = "EFI";
    layout.addFilesystem(efi);

    Filesystem var("var", EXT4);
    var.devices.push_back("/dev/test-a2");
    var.label = "VAR";
    layout.addFilesystem(var);

    Filesystem home("home", BTRFS);
    home.devices.push_back("/dev/test-b1");
    home.label = "HOME";
    home.compression = "zstd";
    layout.addFilesystem(home);

    layout.addMount(Mount("efi", "/mnt/efi"));
    layout.addMount(Mount("var", "/mnt/var"));
    layout.addMount(Mount("home", "/mnt/home"));

    layout.validate();

    return layout;
}


Environment
keep_going()
{
    Environment env;
    env.workers = 2;
    env.retry_backoff_ms = 0;
    env.stop_on_any_failure = false;
    env.lock = false;
    return env;
}


void
destructive_failure()
{
    Layout layout = two_disks();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("mkfs.fat", 1);

    Environment env = keep_going();
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    check(find_result(results, "Format(efi)").status == STEP_FAILED);
    check(find_result(results, "Label(efi)").skip_reason == SKIP_DEPENDENCY_FAILED);
    check(find_result(results, "Mount(/mnt/efi)").skip_reason == SKIP_DEPENDENCY_FAILED);

    // the rest of the failed disk is halted
    check(find_result(results, "Format(var)").status == STEP_SKIPPED);
    check(find_result(results, "Format(var)").skip_reason == SKIP_DISK_HALTED);
    check(find_result(results, "Label(var)").skip_reason == SKIP_DEPENDENCY_FAILED);
    check(find_result(results, "Mount(/mnt/var)").skip_reason == SKIP_DEPENDENCY_FAILED);

    // the other disk is finished
    check(find_result(results, "Wipe(/dev/test-b)").status == STEP_SUCCEEDED);
    check(find_result(results, "Partition(/dev/test-b)").status == STEP_SUCCEEDED);
    check(find_result(results, "Format(home)").status == STEP_SUCCEEDED);
    check(find_result(results, "Label(home)").status == STEP_SUCCEEDED);
    check(find_result(results, "Mount(/mnt/home)").status == STEP_SUCCEEDED);

    check(runner.numCalls("mkfs.ext4") == 0);
    check(runner.numCalls("mkfs.btrfs") == 1);

    vector<string> lines = runner.getLines();
    check(find(lines.begin(), lines.end(), "mount -t btrfs -o compress=zstd /dev/test-b1 /mnt/home") !=
	  lines.end());

    RunReport report;
    report.setResults(results);
    vector<const StepResult*> failures = report.firstFailures();
    check(failures.size() == 1);
    check(failures.front()->text == "Format(efi)");
}


void
non_destructive_failure()
{
    Layout layout = two_disks();
    Plan plan = StepPlanner(layout).plan();

    StubRunner runner;
    runner.failProgram("fatlabel", 1);

    Environment env = keep_going();
    env.retries = 0;
    StepExecutor executor(runner, env);
    vector<StepResult> results = executor.execute(plan);

    check(find_result(results, "Label(efi)").status == STEP_FAILED);
    check(find_result(results, "Mount(/mnt/efi)").skip_reason == SKIP_DEPENDENCY_FAILED);

    // a failed label does not halt the disk
    check(find_result(results, "Format(var)").status == STEP_SUCCEEDED);
    check(find_result(results, "Label(var)").status == STEP_SUCCEEDED);
    check(find_result(results, "Mount(/mnt/var)").status == STEP_SUCCEEDED);
    check(find_result(results, "Mount(/mnt/home)").status == STEP_SUCCEEDED);
}


int
main()
{
    setup_logger();

    destructive_failure();
    non_destructive_failure();

    cout << "executor-blast-radius ok" << endl;
}
