

#include <iostream>
#include <algorithm>

#include "common.h"

#include "diskprov/StepPlanner.h"
#include "diskprov/Graph.h"
#include "diskprov/Utils/AsciiFile.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


vector<string>
texts(const Plan& plan)
{
    vector<string> ret;
    for (vector<Step>::const_iterator it = plan.getSteps().begin(); it != plan.getSteps().end(); ++it)
	ret.push_back(it->text());
    return ret;
}


const Step&
find_step(const Plan& plan, const string& text)
{
    for (vector<Step>::const_iterator it = plan.getSteps().begin(); it != plan.getSteps().end(); ++it)
	if (it->text() == text)
	    return *it;

    check_failure(("no step " + text).c_str(), __FILE__, __LINE__, __PRETTY_FUNCTION__);
    return plan.getSteps().front();
}


// every dependency comes earlier in the plan
void
check_topological(const Plan& plan)
{
    for (vector<Step>::const_iterator it = plan.getSteps().begin(); it != plan.getSteps().end(); ++it)
	for (vector<unsigned>::const_iterator dep = it->depends.begin(); dep != it->depends.end(); ++dep)
	    check(*dep < it->id);
}


void
simple()
{
    Layout layout = simple_layout();
    layout.validate();

    Plan plan = StepPlanner(layout).plan();
    check_topological(plan);

    vector<string> expected = { "Wipe(/dev/test-a)", "Partition(/dev/test-a)", "Format(efi)",
				"Label(efi)", "Mount(/mnt/efi)" };
    check(texts(plan) == expected);

    check(plan.getStep(2).depends == vector<unsigned>({ 1 }));
    check(plan.getStep(3).depends == vector<unsigned>({ 2 }));
    check(plan.getStep(4).depends == vector<unsigned>({ 3 }));
    check(plan.getStep(5).depends == vector<unsigned>({ 3, 4 }));

    check(plan.getStep(1).isDestructive());
    check(plan.getStep(2).isDestructive());
    check(plan.getStep(3).isDestructive());
    check(!plan.getStep(4).isDestructive());
    check(!plan.getStep(5).isDestructive());

    check(plan.getStep(2).partitions.size() == 1);
    check(plan.getStep(5).touchesDisk("/dev/test-a"));

    check(plan.allDependentsOf(3) == set<unsigned>({ 4, 5 }));
    check(plan.allDependentsOf(1) == set<unsigned>({ 2, 3, 4, 5 }));
}


void
raid(const vector<string>& disks)
{
    Layout layout = raid_layout(disks);
    layout.validate();

    Plan plan = StepPlanner(layout).plan();
    check_topological(plan);
    check(plan.numSteps() == 2 * disks.size() + 2);

    // the raid format depends on exactly the partitioning of all member disks
    const Step& format = find_step(plan, "Format(data)");
    check(format.depends.size() == disks.size());
    for (vector<unsigned>::const_iterator it = format.depends.begin(); it != format.depends.end(); ++it)
	check(plan.getStep(*it).kind == PARTITION);

    for (vector<string>::const_iterator it = disks.begin(); it != disks.end(); ++it)
    {
	check(format.touchesDisk(*it));

	const Step& partition = find_step(plan, "Partition(" + *it + ")");
	check(find(format.depends.begin(), format.depends.end(), partition.id) != format.depends.end());
	check(partition.id < format.id);
    }

    const Step& mount = find_step(plan, "Mount(/mnt/data)");
    check(mount.depends == vector<unsigned>({ format.id }));
    check(mount.id == plan.numSteps());
}


void
raid_order()
{
    vector<string> disks = { "/dev/test-a", "/dev/test-b", "/dev/test-c", "/dev/test-d" };
    raid(disks);

    Plan plan = StepPlanner(raid_layout(disks)).plan();

    vector<string> expected = {
	"Wipe(/dev/test-a)", "Partition(/dev/test-a)", "Wipe(/dev/test-b)", "Partition(/dev/test-b)",
	"Wipe(/dev/test-c)", "Partition(/dev/test-c)", "Wipe(/dev/test-d)", "Partition(/dev/test-d)",
	"Format(data)", "Mount(/mnt/data)"
    };
    check(texts(plan) == expected);
    check(plan.getStep(9).depends == vector<unsigned>({ 2, 4, 6, 8 }));

    // declaration order does not change the dependencies
    vector<string> reversed(disks.rbegin(), disks.rend());
    raid(reversed);

    Plan plan2 = StepPlanner(raid_layout(reversed)).plan();
    check(plan2.getStep(1).text() == "Wipe(/dev/test-d)");
}


void
nested()
{
    Layout layout;
    layout.addDisk(Disk("/dev/test-a", ROLE_BOOT));

    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB, "fat32"));
    Partition p2("/dev/test-a", 2, 512 * MiB, 0, "btrfs");
    p2.to_end = true;
    layout.addPartition(p2);

    Filesystem efi("efi", FAT32);
    efi.devices.push_back("/dev/test-a1");
    efi.label = "EFI";
    layout.addFilesystem(efi);

    Filesystem root("root", BTRFS);
    root.devices.push_back("/dev/test-a2");
    root.label = "ROOT";
    root.uuid = "66696c65-7379-7374-656d-000000000002";
    layout.addFilesystem(root);

    // the nested mount is declared first
    layout.addMount(Mount("efi", "/mnt/boot/efi"));
    layout.addMount(Mount("root", "/mnt"));

    layout.validate();

    Plan plan = StepPlanner(layout).plan();
    check_topological(plan);

    vector<string> expected = {
	"Wipe(/dev/test-a)", "Partition(/dev/test-a)", "Format(efi)", "Format(root)", "Label(efi)",
	"Label(root)", "AssignUUID(root)", "Mount(/mnt)", "Mount(/mnt/boot/efi)"
    };
    check(texts(plan) == expected);

    const Step& uuid = find_step(plan, "AssignUUID(root)");
    check(uuid.depends == vector<unsigned>({ find_step(plan, "Label(root)").id }));

    const Step& mount = find_step(plan, "Mount(/mnt/boot/efi)");
    check(find(mount.depends.begin(), mount.depends.end(), find_step(plan, "Mount(/mnt)").id) !=
	  mount.depends.end());
}


void
no_wipe()
{
    Layout layout;
    layout.addDisk(Disk("/dev/test-a", ROLE_DATA, PT_GPT, false));
    layout.addDisk(Disk("/dev/test-b"));
    layout.validate();

    // nothing to partition on either disk
    Plan plan = StepPlanner(layout).plan();
    check(texts(plan) == vector<string>({ "Wipe(/dev/test-b)" }));
}


void
swap()
{
    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));
    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 1024 * MiB, "linux-swap"));

    Filesystem swap("swap", SWAP);
    swap.devices.push_back("/dev/test-a1");
    swap.uuid = "66696c65-7379-7374-656d-000000000000";
    layout.addFilesystem(swap);
    layout.addMount(Mount("swap", "swap"));

    layout.validate();

    Plan plan = StepPlanner(layout).plan();
    check(texts(plan) == vector<string>({ "Wipe(/dev/test-a)", "Partition(/dev/test-a)",
		"Format(swap)", "AssignUUID(swap)", "Mount(swap:swap)" }));
}


void
deterministic()
{
    vector<string> disks = { "/dev/test-c", "/dev/test-a", "/dev/test-d", "/dev/test-b" };
    Layout layout = raid_layout(disks);

    Plan plan1 = StepPlanner(layout).plan();
    Plan plan2 = StepPlanner(layout).plan();

    check(texts(plan1) == texts(plan2));
    for (unsigned id = 1; id <= plan1.numSteps(); ++id)
	check(plan1.getStep(id).depends == plan2.getStep(id).depends);
}


void
graph()
{
    Plan plan = StepPlanner(simple_layout()).plan();

    check(savePlanGraph(plan, "planner-order.gv"));

    AsciiFile file("planner-order.gv");
    const vector<string>& lines = file.lines();

    check(find(lines.begin(), lines.end(), "digraph plan") != lines.end());
    check(find(lines.begin(), lines.end(), "    \"step:1\" -> \"step:2\";") != lines.end());
    check(find(lines.begin(), lines.end(), "    { rank=source; \"step:1\" };") != lines.end());
}


int
main()
{
    setup_logger();

    simple();
    raid_order();
    nested();
    no_wipe();
    swap();
    deterministic();
    graph();

    cout << "planner-order ok" << endl;
}
