

#include <iostream>

#include "common.h"

#include "diskprov/Actions.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/AsciiFile.h"
#include "diskprov/Utils/Exception.h"


using namespace std;
using namespace diskprov;


static const unsigned long long MiB = 1024 * 1024;


static const string list_signatures_cmd = "wipefs --no-act --noheadings --output TYPE ";


void
wipe()
{
    StubRunner runner;
    runner.setOutput("lsblk", { "/dev/test-a  disk", "/dev/test-a1 part", "/dev/test-a2 part",
				"/dev/md127   raid1" });
    runner.setOutput(list_signatures_cmd + "/dev/test-a1", { "linux_raid_member" });
    runner.setOutput(list_signatures_cmd + "/dev/test-a2", { "ext4", "LVM2_member" });
    runner.setOutput(list_signatures_cmd + "/dev/test-a", { "gpt", "gpt", "PMBR" });

    Actions actions(runner);
    actions.doWipe(Disk("/dev/test-a"));

    vector<string> expected = {
	"blockdev --getsize64 /dev/test-a",
	"lsblk --noheadings --list --paths --output NAME,TYPE /dev/test-a",
	list_signatures_cmd + "/dev/test-a1",
	list_signatures_cmd + "/dev/test-a2",
	list_signatures_cmd + "/dev/test-a",
	"mdadm --zero-superblock /dev/test-a1",
	"pvremove -ff -y /dev/test-a2",
	"wipefs --all --force /dev/test-a1",
	"wipefs --all --force /dev/test-a2",
	"wipefs --all --force /dev/test-a",
	"dd if=/dev/zero of=/dev/test-a bs=1k count=1024 conv=nocreat,fsync",
	"dd if=/dev/zero of=/dev/test-a bs=1k seek=10484736 count=1024 conv=nocreat,fsync"
    };
    check(runner.getLines() == expected);

    vector<Command> commands = runner.getCommands();
    for (unsigned i = 0; i < 5; ++i)
	check(!commands[i].destructive);
    for (unsigned i = 5; i < commands.size(); ++i)
	check(commands[i].destructive);
}


// several signatures on one device, blkid -p would give up here
void
wipe_several_signatures()
{
    StubRunner runner;
    runner.setOutput("blockdev", { "524288" });
    runner.setOutput(list_signatures_cmd + "/dev/test-a", { "zfs_member", "linux_raid_member" });

    Actions actions(runner);
    actions.doWipe(Disk("/dev/test-a"));

    vector<string> expected = {
	"blockdev --getsize64 /dev/test-a",
	"lsblk --noheadings --list --paths --output NAME,TYPE /dev/test-a",
	list_signatures_cmd + "/dev/test-a",
	"mdadm --zero-superblock /dev/test-a",
	"zpool labelclear -f /dev/test-a",
	"wipefs --all --force /dev/test-a",
	"dd if=/dev/zero of=/dev/test-a bs=1k count=512 conv=nocreat,fsync"
    };
    check(runner.getLines() == expected);
}


void
wipe_listing_fails()
{
    StubRunner runner;
    runner.failProgram("lsblk", 1, 32);

    Actions actions(runner);
    check_throw(actions.doWipe(Disk("/dev/test-a")), CommandNonZeroExitException);

    check(runner.numCalls("wipefs") == 0);
    check(runner.numCalls("dd") == 0);
}


void
wipe_bad_size()
{
    StubRunner runner;
    runner.setOutput("blockdev", { "lots" });

    Actions actions(runner);
    check_throw(actions.doWipe(Disk("/dev/test-a")), ParseException);

    check(runner.numCalls("wipefs") == 0);
}


void
busy()
{
    // any block device mounted on the test machine will do
    AsciiFile mounts("/proc/mounts", true);
    for (vector<string>::const_iterator it = mounts.lines().begin(); it != mounts.lines().end(); ++it)
    {
	string dev = extractNthWord(0, *it);
	if (dev.compare(0, 5, "/dev/") != 0)
	    continue;

	StubRunner runner;
	Actions actions(runner);
	check_throw(actions.checkNotBusy(dev), DeviceBusyException);
	check_throw(actions.doWipe(Disk(dev)), DeviceBusyException);
	check(runner.getCommands().empty());
	break;
    }

    StubRunner runner;
    Actions actions(runner);
    actions.checkNotBusy("/dev/test-a");
}


void
partition()
{
    Disk disk("/dev/test-a");

    Partition p1("/dev/test-a", 1, 1 * MiB, 512 * MiB, "fat32");
    p1.name = "efi";
    Partition p2("/dev/test-a", 2, 512 * MiB, 0, "btrfs");
    p2.to_end = true;

    vector<const Partition*> partitions = { &p1, &p2 };

    StubRunner runner;
    Actions actions(runner);
    actions.doPartition(disk, partitions);

    vector<string> expected = {
	"parted -s /dev/test-a mklabel gpt",
	"parted -s -a optimal /dev/test-a unit B mkpart efi fat32 1048576B 536870911B",
	"parted -s -a optimal /dev/test-a unit B mkpart primary btrfs 536870912B 100%",
	"udevadm settle --timeout=20",
	"wipefs --all --force /dev/test-a1",
	"wipefs --all --force /dev/test-a2"
    };
    check(runner.getLines() == expected);

    vector<Command> commands = runner.getCommands();
    for (vector<Command>::const_iterator it = commands.begin(); it != commands.end(); ++it)
	check(it->destructive);
}


void
partition_msdos()
{
    Disk disk("/dev/nvme0n1", ROLE_DATA, PT_MSDOS);

    Partition p1("/dev/nvme0n1", 1, 1 * MiB, 2 * MiB);
    p1.name = "ignored";

    vector<const Partition*> partitions = { &p1 };

    StubRunner runner;
    Actions actions(runner);
    actions.doPartition(disk, partitions);

    vector<string> lines = runner.getLines();
    check(lines[0] == "parted -s /dev/nvme0n1 mklabel msdos");
    check(lines[1] == "parted -s -a optimal /dev/nvme0n1 unit B mkpart primary 1048576B 2097151B");
    check(lines.back() == "wipefs --all --force /dev/nvme0n1p1");
}


Filesystem
filesystem(const string& id, FsType type, const string& device)
{
    Filesystem ret(id, type);
    ret.devices.push_back(device);
    return ret;
}


void
format()
{
    StubRunner runner;
    Actions actions(runner);

    actions.doFormat(filesystem("efi", FAT32, "/dev/test-a1"));
    actions.doFormat(filesystem("swap", SWAP, "/dev/test-a2"));

    Filesystem var = filesystem("var", EXT4, "/dev/test-a3");
    var.mkfs_options = { "-E", "nodiscard" };
    actions.doFormat(var);

    Filesystem root = filesystem("root", BTRFS, "/dev/test-a4");
    actions.doFormat(root);

    vector<string> expected = {
	"mkfs.fat -F 32 /dev/test-a1",
	"mkswap -f /dev/test-a2",
	"mkfs.ext4 -F -E nodiscard /dev/test-a3",
	"mkfs.btrfs -f /dev/test-a4"
    };
    check(runner.getLines() == expected);

    vector<Command> commands = runner.getCommands();
    for (vector<Command>::const_iterator it = commands.begin(); it != commands.end(); ++it)
	check(it->destructive);
}


void
label_and_uuid()
{
    StubRunner runner;
    Actions actions(runner);

    const string uuid = "66696c65-7379-7374-656d-000000000002";

    Filesystem efi = filesystem("efi", FAT32, "/dev/test-a1");
    efi.label = "EFI";
    efi.uuid = uuid;
    actions.doSetLabel(efi);
    check_throw(actions.doSetUuid(efi), UnsupportedOperationException);

    Filesystem root = filesystem("root", BTRFS, "/dev/test-a2");
    root.label = "ROOT";
    root.uuid = uuid;
    actions.doSetLabel(root);
    actions.doSetUuid(root);

    Filesystem swap = filesystem("swap", SWAP, "/dev/test-a3");
    swap.label = "SWAP";
    swap.uuid = uuid;
    actions.doSetLabel(swap);
    actions.doSetUuid(swap);

    Filesystem var = filesystem("var", EXT4, "/dev/test-a4");
    var.label = "VAR";
    var.uuid = uuid;
    actions.doSetLabel(var);
    actions.doSetUuid(var);

    vector<string> expected = {
	"fatlabel /dev/test-a1 EFI",
	"btrfs filesystem label /dev/test-a2 ROOT",
	"btrfstune -f -U " + uuid + " /dev/test-a2",
	"swaplabel -L SWAP /dev/test-a3",
	"swaplabel -U " + uuid + " /dev/test-a3",
	"e2label /dev/test-a4 VAR",
	"tune2fs -U " + uuid + " /dev/test-a4"
    };
    check(runner.getLines() == expected);

    vector<Command> commands = runner.getCommands();
    for (vector<Command>::const_iterator it = commands.begin(); it != commands.end(); ++it)
	check(!it->destructive);
}


void
mount()
{
    StubRunner runner;
    Actions actions(runner);

    Filesystem var = filesystem("var", EXT4, "/dev/test-a1");
    Mount mount_var("var", "/mnt/var");
    mount_var.options = { "noatime", "nodev" };
    actions.doMount(var, mount_var);

    Filesystem swap = filesystem("swap", SWAP, "/dev/test-a2");
    actions.doMount(swap, Mount("swap", "swap"));

    Filesystem efi = filesystem("efi", FAT32, "/dev/test-a3");
    actions.doMount(efi, Mount("efi", "/mnt/boot/efi"));

    Filesystem home = filesystem("home", BTRFS, "/dev/test-a4");
    home.compression = "zstd";
    actions.doMount(home, Mount("home", "/mnt/home"));

    vector<string> expected = {
	"mkdir -p /mnt/var",
	"mount -t ext4 -o noatime,nodev /dev/test-a1 /mnt/var",
	"swapon /dev/test-a2",
	"mkdir -p /mnt/boot/efi",
	"mount -t vfat /dev/test-a3 /mnt/boot/efi",
	"mkdir -p /mnt/home",
	"mount -t btrfs -o compress=zstd /dev/test-a4 /mnt/home"
    };
    check(runner.getLines() == expected);
}


void
failure()
{
    StubRunner runner;
    runner.failProgram("parted", 1, 1);

    Partition p1("/dev/test-a", 1, 1 * MiB, 2 * MiB);
    vector<const Partition*> partitions = { &p1 };

    Actions actions(runner);
    check_throw(actions.doPartition(Disk("/dev/test-a"), partitions), CommandNonZeroExitException);

    // nothing after the failing command
    check(runner.getLines() == vector<string>({ "parted -s /dev/test-a mklabel gpt" }));
}


int
main()
{
    setup_logger();

    wipe();
    wipe_several_signatures();
    wipe_listing_fails();
    wipe_bad_size();
    busy();
    partition();
    partition_msdos();
    format();
    label_and_uuid();
    mount();
    failure();

    cout << "actions ok" << endl;
}
