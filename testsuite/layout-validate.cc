

#include <iostream>

#include "common.h"

#include "diskprov/Utils/Exception.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


Layout
two_partitions(unsigned long long start2, unsigned long long end2)
{
    Layout layout;
    layout.addDisk(Disk("/dev/test-a"));
    layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB));
    layout.addPartition(Partition("/dev/test-a", 2, start2, end2));
    return layout;
}


// simple_layout() plus a second partition carrying the filesystem
Layout
with_filesystem(const Filesystem& filesystem)
{
    Layout layout = simple_layout();
    layout.addPartition(Partition("/dev/test-a", 2, 512 * MiB, 1024 * MiB));
    layout.addFilesystem(filesystem);
    return layout;
}


void
valid()
{
    simple_layout().validate();

    vector<string> disks = { "/dev/test-a", "/dev/test-b", "/dev/test-c", "/dev/test-d" };
    raid_layout(disks).validate();

    // adjacent partitions do not overlap
    two_partitions(512 * MiB, 1024 * MiB).validate();
}


void
disks()
{
    check_throw(Layout().validate(), InvalidLayoutException);

    Layout twice;
    twice.addDisk(Disk("/dev/test-a"));
    twice.addDisk(Disk("/dev/test-a"));
    check_throw(twice.validate(), InvalidLayoutException);

    Layout relative;
    relative.addDisk(Disk("test-a"));
    check_throw(relative.validate(), InvalidLayoutException);
}


void
partitions()
{
    // overlap
    try
    {
	two_partitions(256 * MiB, 1024 * MiB).validate();
	check(false);
    }
    catch (const InvalidLayoutException& e)
    {
	check(e.msg() == "partitions /dev/test-a1 and /dev/test-a2 overlap in 256 MiB from byte 268435456");
    }

    // empty region
    check_throw(two_partitions(512 * MiB, 512 * MiB).validate(), InvalidLayoutException);

    // offsets must increase with the number
    check_throw(two_partitions(0, 1 * MiB).validate(), InvalidLayoutException);

    Layout undeclared;
    undeclared.addDisk(Disk("/dev/test-a"));
    undeclared.addPartition(Partition("/dev/test-b", 1, 1 * MiB, 2 * MiB));
    check_throw(undeclared.validate(), InvalidLayoutException);

    Layout number_twice = two_partitions(512 * MiB, 1024 * MiB);
    number_twice.addPartition(Partition("/dev/test-a", 2, 2048 * MiB, 4096 * MiB));
    check_throw(number_twice.validate(), InvalidLayoutException);

    Layout number_zero;
    number_zero.addDisk(Disk("/dev/test-a"));
    number_zero.addPartition(Partition("/dev/test-a", 0, 1 * MiB, 2 * MiB));
    check_throw(number_zero.validate(), InvalidLayoutException);

    // only the last partition may extend to the end of the disk
    Layout to_end;
    to_end.addDisk(Disk("/dev/test-a"));
    Partition p1("/dev/test-a", 1, 1 * MiB, 0);
    p1.to_end = true;
    to_end.addPartition(p1);
    to_end.addPartition(Partition("/dev/test-a", 2, 2048 * MiB, 4096 * MiB));
    check_throw(to_end.validate(), InvalidLayoutException);

    Layout msdos;
    msdos.addDisk(Disk("/dev/test-a", ROLE_DATA, PT_MSDOS));
    msdos.addPartition(Partition("/dev/test-a", 5, 1 * MiB, 2 * MiB));
    check_throw(msdos.validate(), InvalidLayoutException);
}


void
filesystems()
{
    Filesystem reuse("other", EXT4);
    reuse.devices.push_back("/dev/test-a1");
    check_throw(with_filesystem(reuse).validate(), InvalidLayoutException);

    Filesystem missing("other", EXT4);
    missing.devices.push_back("/dev/test-a7");
    check_throw(with_filesystem(missing).validate(), InvalidLayoutException);

    Filesystem duplicate("efi", EXT4);
    duplicate.devices.push_back("/dev/test-a2");
    check_throw(with_filesystem(duplicate).validate(), InvalidLayoutException);

    Filesystem long_label("other", FAT32);
    long_label.devices.push_back("/dev/test-a2");
    long_label.label = "LABEL-TOO-LONG";
    check_throw(with_filesystem(long_label).validate(), InvalidLayoutException);

    Filesystem bad_uuid("other", BTRFS);
    bad_uuid.devices.push_back("/dev/test-a2");
    bad_uuid.uuid = "66696c657379737465736d02";
    check_throw(with_filesystem(bad_uuid).validate(), InvalidLayoutException);

    Filesystem good_uuid("other", BTRFS);
    good_uuid.devices.push_back("/dev/test-a2");
    good_uuid.uuid = "66696c65-7379-7374-656d-000000000002";
    with_filesystem(good_uuid).validate();

    Filesystem compression("other", EXT4);
    compression.devices.push_back("/dev/test-a2");
    compression.compression = "zstd";
    check_throw(with_filesystem(compression).validate(), InvalidLayoutException);

    Filesystem profile("other", EXT4);
    profile.devices.push_back("/dev/test-a2");
    profile.data_profile = "raid1";
    check_throw(with_filesystem(profile).validate(), InvalidLayoutException);
}


void
raid()
{
    vector<string> disks = { "/dev/test-a", "/dev/test-b" };

    // both members on one disk
    Layout one_disk;
    one_disk.addDisk(Disk("/dev/test-a"));
    one_disk.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB));
    one_disk.addPartition(Partition("/dev/test-a", 2, 512 * MiB, 1024 * MiB));
    Filesystem data("data", BTRFS);
    data.devices.push_back("/dev/test-a1");
    data.devices.push_back("/dev/test-a2");
    data.data_profile = "raid0";
    one_disk.addFilesystem(data);
    check_throw(one_disk.validate(), InvalidLayoutException);

    // raid10 needs four devices
    Layout raid10;
    Filesystem data10("data", BTRFS);
    data10.data_profile = "raid10";
    for (vector<string>::const_iterator it = disks.begin(); it != disks.end(); ++it)
    {
	raid10.addDisk(Disk(*it));
	raid10.addPartition(Partition(*it, 1, 1 * MiB, 512 * MiB));
	data10.devices.push_back(*it + "1");
    }
    raid10.addFilesystem(data10);
    check_throw(raid10.validate(), InvalidLayoutException);

    // only btrfs spans several devices
    Layout ext4;
    Filesystem data4("data", EXT4);
    for (vector<string>::const_iterator it = disks.begin(); it != disks.end(); ++it)
    {
	ext4.addDisk(Disk(*it));
	ext4.addPartition(Partition(*it, 1, 1 * MiB, 512 * MiB));
	data4.devices.push_back(*it + "1");
    }
    ext4.addFilesystem(data4);
    check_throw(ext4.validate(), InvalidLayoutException);
}


void
mounts()
{
    Layout twice = simple_layout();
    twice.addMount(Mount("efi", "/mnt/efi2"));
    check_throw(twice.validate(), InvalidLayoutException);

    Layout undeclared = simple_layout();
    undeclared.addMount(Mount("unknown", "/mnt/unknown"));
    check_throw(undeclared.validate(), InvalidLayoutException);

    Filesystem root("root", BTRFS);
    root.devices.push_back("/dev/test-a2");

    Layout relative = with_filesystem(root);
    relative.addMount(Mount("root", "mnt/root"));
    check_throw(relative.validate(), InvalidLayoutException);

    Layout same_path = with_filesystem(root);
    same_path.addMount(Mount("root", "/mnt/efi"));
    check_throw(same_path.validate(), InvalidLayoutException);

    Layout not_swap = with_filesystem(root);
    not_swap.addMount(Mount("root", "swap"));
    check_throw(not_swap.validate(), InvalidLayoutException);

    Filesystem swap("swap", SWAP);
    swap.devices.push_back("/dev/test-a2");

    Layout swap_path = with_filesystem(swap);
    swap_path.addMount(Mount("swap", "/mnt/swap"));
    check_throw(swap_path.validate(), InvalidLayoutException);

    Layout swap_ok = with_filesystem(swap);
    swap_ok.addMount(Mount("swap", "swap"));
    swap_ok.validate();

    Layout bad_option = with_filesystem(root);
    Mount mount("root", "/mnt/root");
    mount.options.push_back("noatime,compress=zstd");
    bad_option.addMount(mount);
    check_throw(bad_option.validate(), InvalidLayoutException);
}


void
partition_names()
{
    check(Disk::partitionDevice("/dev/sda", 1) == "/dev/sda1");
    check(Disk::partitionDevice("/dev/nvme0n1", 2) == "/dev/nvme0n1p2");
    check(Disk::partitionDevice("/dev/mmcblk0", 3) == "/dev/mmcblk0p3");
    check(Disk::partitionDevice("/dev/mapper/isw_test", 4) == "/dev/mapper/isw_test_part4");
}


int
main()
{
    setup_logger();

    valid();
    disks();
    partitions();
    filesystems();
    raid();
    mounts();
    partition_names();

    cout << "layout-validate ok" << endl;
}
