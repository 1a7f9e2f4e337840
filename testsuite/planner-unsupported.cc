

#include <iostream>

#include "common.h"

#include "diskprov/StepPlanner.h"
#include "diskprov/Utils/Exception.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


void
fat32_uuid()
{
    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));
    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB, "fat32"));

    Filesystem efi("efi", FAT32);
    efi.devices.push_back("/dev/test-a1");
    efi.uuid = "66696c65-7379-7374-656d-000000000001";
    layout.addFilesystem(efi);

    // the layout itself is fine, fat32 just cannot get a UUID
    layout.validate();

    StepPlanner planner(layout);
    check_throw(planner.plan(), UnsupportedOperationException);

    try
    {
	planner.plan();
    }
    catch (const Exception& e)
    {
	check(e.errorKind() == ERR_UNSUPPORTED_OPERATION);
    }
}


void
missing_partition()
{
    // not validated, the planner must still notice
    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));

    Filesystem root("root", BTRFS);
    root.devices.push_back("/dev/test-a1");
    layout.addFilesystem(root);

    check_throw(StepPlanner(layout).plan(), PlanningException);
}


void
missing_filesystem()
{
    Layout layout = simple_layout();
    layout.addMount(Mount("unknown", "/mnt/unknown"));

    check_throw(StepPlanner(layout).plan(), PlanningException);
}


void
missing_disk()
{
    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));
    layout.addPartition(Partition("/dev/test-b", 1, 1 * MiB, 512 * MiB));

    Filesystem root("root", BTRFS);
    root.devices.push_back("/dev/test-b1");
    layout.addFilesystem(root);

    check_throw(StepPlanner(layout).plan(), PlanningException);
}


int
main()
{
    setup_logger();

    fat32_uuid();
    missing_partition();
    missing_filesystem();
    missing_disk();

    cout << "planner-unsupported ok" << endl;
}
