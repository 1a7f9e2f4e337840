

#include <iostream>
#include <fstream>

#include "common.h"

#include "diskprov/LayoutFile.h"
#include "diskprov/Utils/Exception.h"


using namespace std;
using namespace diskprov;


string
write_file(const string& name, const string& content)
{
    ofstream file(name.c_str());
    file << content;
    return name;
}


void
workstation()
{
    string filename = write_file("layout-xml-1.xml",
	"<?xml version=\"1.0\"?>\n"
	"<layout>\n"
	"  <disk>\n"
	"    <device>/dev/nvme1n1</device>\n"
	"    <role>system</role>\n"
	"    <partition>\n"
	"      <number>1</number>\n"
	"      <start>1 MiB</start>\n"
	"      <end>100GB</end>\n"
	"      <fs-hint>btrfs</fs-hint>\n"
	"      <name>home</name>\n"
	"    </partition>\n"
	"    <partition>\n"
	"      <number>2</number>\n"
	"      <start>100GB</start>\n"
	"      <end>100%</end>\n"
	"      <fs-hint>linux-swap</fs-hint>\n"
	"    </partition>\n"
	"  </disk>\n"
	"  <disk>\n"
	"    <device>/dev/sda</device>\n"
	"    <label>msdos</label>\n"
	"    <wipe>false</wipe>\n"
	"  </disk>\n"
	"  <filesystem>\n"
	"    <id>home</id>\n"
	"    <type>btrfs</type>\n"
	"    <device>/dev/nvme1n1p1</device>\n"
	"    <compression>zstd</compression>\n"
	"    <mkfs-option>--nodiscard</mkfs-option>\n"
	"    <label>Freya</label>\n"
	"    <uuid>66696C65-7379-7374-656D-000000000003</uuid>\n"
	"  </filesystem>\n"
	"  <filesystem>\n"
	"    <id>swap</id>\n"
	"    <type>swap</type>\n"
	"    <device>/dev/nvme1n1p2</device>\n"
	"    <label>Tyr</label>\n"
	"  </filesystem>\n"
	"  <mount>\n"
	"    <filesystem>home</filesystem>\n"
	"    <path>/mnt/home</path>\n"
	"    <options>noatime,ssd</options>\n"
	"  </mount>\n"
	"  <mount>\n"
	"    <filesystem>swap</filesystem>\n"
	"    <path>swap</path>\n"
	"  </mount>\n"
	"</layout>\n");

    Layout layout = readLayout(filename);
    layout.validate();

    check(layout.getDisks().size() == 2);

    const Disk& nvme = layout.getDisks()[0];
    check(nvme.device == "/dev/nvme1n1");
    check(nvme.role == ROLE_SYSTEM);
    check(nvme.label == PT_GPT);
    check(nvme.wipe);

    const Disk& sda = layout.getDisks()[1];
    check(sda.label == PT_MSDOS);
    check(!sda.wipe);

    check(layout.getPartitions().size() == 2);

    const Partition* home = layout.findPartition("/dev/nvme1n1p1");
    check(home != NULL);
    check(home->start == 1024 * 1024);
    check(home->end == 100000000000ULL);
    check(!home->to_end);
    check(home->fs_hint == "btrfs");
    check(home->name == "home");

    const Partition* swap = layout.findPartition("/dev/nvme1n1p2");
    check(swap != NULL);
    check(swap->start == 100000000000ULL);
    check(swap->to_end);

    const Filesystem* fs = layout.findFilesystem("home");
    check(fs != NULL);
    check(fs->type == BTRFS);
    check(fs->devices == list<string>({ "/dev/nvme1n1p1" }));
    check(fs->compression == "zstd");
    check(fs->mkfs_options == list<string>({ "--nodiscard" }));
    check(fs->label == "Freya");
    check(fs->uuid == "66696c65-7379-7374-656d-000000000003");

    const Mount* mount = layout.findMount("home");
    check(mount != NULL);
    check(mount->path == "/mnt/home");
    check(mount->options == list<string>({ "noatime", "ssd" }));

    check(layout.findMount("swap")->isSwap());
}


void
malformed()
{
    check_throw(readLayout("layout-xml-does-not-exist.xml"), ParseException);

    string not_xml = write_file("layout-xml-2.xml", "<layout><disk>");
    check_throw(readLayout(not_xml), ParseException);

    string wrong_root = write_file("layout-xml-3.xml", "<storage></storage>");
    check_throw(readLayout(wrong_root), ParseException);

    string bad_size = write_file("layout-xml-4.xml",
	"<layout><disk><device>/dev/sda</device><partition><number>1</number>"
	"<start>lots</start><end>100%</end></partition></disk></layout>");
    check_throw(readLayout(bad_size), ParseException);

    string bad_type = write_file("layout-xml-5.xml",
	"<layout><filesystem><id>x</id><type>ntfs</type></filesystem></layout>");
    check_throw(readLayout(bad_type), ParseException);

    string missing_device = write_file("layout-xml-6.xml",
	"<layout><disk><role>data</role></disk></layout>");
    check_throw(readLayout(missing_device), ParseException);

    string bad_bool = write_file("layout-xml-7.xml",
	"<layout><disk><device>/dev/sda</device><wipe>maybe</wipe></disk></layout>");
    check_throw(readLayout(bad_bool), ParseException);
}


int
main()
{
    setup_logger();

    workstation();
    malformed();

    cout << "layout-xml ok" << endl;
}
