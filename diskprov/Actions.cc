/*
 * Copyright (c) [2026] diskprov authors
 *
 * All Rights Reserved.
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of version 2 of the GNU General Public License as published
 * by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for
 * more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, see <http://www.gnu.org/licenses/>.
 */


#include <algorithm>
#include <map>
#include <boost/algorithm/string.hpp>

#include "diskprov/Actions.h"
#include "diskprov/DiskprovDefines.h"
#include "diskprov/FsCapabilities.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/AsciiFile.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    Actions::Actions(CommandRunner& runner)
	: runner(runner)
    {
    }


    CommandResult
    Actions::run(const vector<string>& args, bool destructive, const vector<int>& ok_codes)
    {
	Command command(args, destructive);
	command.ok_codes = ok_codes;
	return runner.execute(command);
    }


    void
    Actions::runStep(const Step& step)
    {
	y2mil("running step " << step);

	switch (step.kind)
	{
	    case WIPE:
		doWipe(*step.disk);
		break;

	    case PARTITION:
		doPartition(*step.disk, step.partitions);
		break;

	    case FORMAT:
		doFormat(*step.filesystem);
		break;

	    case LABEL:
		doSetLabel(*step.filesystem);
		break;

	    case ASSIGN_UUID:
		doSetUuid(*step.filesystem);
		break;

	    case MOUNT:
		doMount(*step.filesystem, *step.mount);
		break;
	}
    }


    // true if dev is the disk itself or one of its partitions
    static bool
    isDeviceOf(const string& disk, const string& dev)
    {
	if (dev == disk)
	    return true;

	if (!boost::starts_with(dev, disk))
	    return false;

	string rest = dev.substr(disk.size());
	if (boost::starts_with(rest, "_part"))
	    rest.erase(0, 5);
	else if (boost::starts_with(rest, "p"))
	    rest.erase(0, 1);

	return !rest.empty() && rest.find_first_not_of("0123456789") == string::npos;
    }


    void
    Actions::checkNotBusy(const string& disk) const
    {
	AsciiFile mounts(PROCMOUNTSFILE, true);
	for (vector<string>::const_iterator it = mounts.lines().begin(); it != mounts.lines().end(); ++it)
	{
	    string dev = extractNthWord(0, *it);
	    if (isDeviceOf(disk, dev))
		DP_THROW(DeviceBusyException(dev, "mount point " + extractNthWord(1, *it)));
	}

	AsciiFile swaps(PROCSWAPSFILE, true);
	for (unsigned i = 1; i < swaps.numLines(); ++i)
	{
	    string dev = extractNthWord(0, swaps[i]);
	    if (isDeviceOf(disk, dev))
		DP_THROW(DeviceBusyException(dev, "swap"));
	}
    }


    unsigned long long
    Actions::deviceSize(const string& device)
    {
	vector<string> cmd = { BLOCKDEVBIN, "--getsize64", device };
	CommandResult result = run(cmd, false);

	unsigned long long size = 0;
	if (result.stdout.empty() || !(boost::trim_copy(result.stdout.front()) >> size))
	    DP_THROW(ParseException("bad size of " + device,
				    result.stdout.empty() ? "" : result.stdout.front(), "bytes"));

	y2mil("device:" << device << " size:" << size);
	return size;
    }


    vector<string>
    Actions::listPartitions(const string& disk)
    {
	vector<string> cmd = { LSBLKBIN, "--noheadings", "--list", "--paths", "--output", "NAME,TYPE",
			       disk };
	CommandResult result = run(cmd, false);

	// holders like md or dm devices are listed too
	vector<string> ret;
	for (vector<string>::const_iterator it = result.stdout.begin(); it != result.stdout.end(); ++it)
	{
	    string name = extractNthWord(0, *it);
	    if (extractNthWord(1, *it) == "part" && find(ret.begin(), ret.end(), name) == ret.end())
		ret.push_back(name);
	}

	y2mil("disk:" << disk << " partitions:" << ret);
	return ret;
    }


    set<string>
    Actions::listSignatures(const string& device)
    {
	// unlike blkid wipefs reports every signature, also ambivalent ones
	vector<string> cmd = { WIPEFSBIN, "--no-act", "--noheadings", "--output", "TYPE", device };
	CommandResult result = run(cmd, false);

	set<string> ret;
	for (vector<string>::const_iterator it = result.stdout.begin(); it != result.stdout.end(); ++it)
	{
	    string type = boost::trim_copy(*it);
	    if (!type.empty())
		ret.insert(type);
	}

	y2mil("device:" << device << " signatures:" << ret);
	return ret;
    }


    void
    Actions::clearMember(const string& device, const string& signature)
    {
	vector<string> cmd;

	if (signature == "linux_raid_member")
	    cmd = { MDADMBIN, "--zero-superblock", device };
	else if (signature == "LVM2_member")
	    cmd = { PVREMOVEBIN, "-ff", "-y", device };
	else if (signature == "zfs_member")
	    cmd = { ZPOOLBIN, "labelclear", "-f", device };
	else
	    return;

	y2mil("clearing " << signature << " on " << device);
	run(cmd, true);
    }


    void
    Actions::zeroDevice(const string& device, unsigned long long size)
    {
	const unsigned long long sizeK = size / 1024;
	const unsigned long long countK = min(1024ULL, sizeK);

	vector<string> head = { DDBIN, "if=/dev/zero", "of=" + device, "bs=1k",
				"count=" + decString(countK), "conv=nocreat,fsync" };
	run(head, true);

	if (sizeK > countK)
	{
	    vector<string> tail = { DDBIN, "if=/dev/zero", "of=" + device, "bs=1k",
				    "seek=" + decString(sizeK - countK), "count=" + decString(countK),
				    "conv=nocreat,fsync" };
	    run(tail, true);
	}
    }


    void
    Actions::doWipe(const Disk& disk)
    {
	y2mil("wiping " << disk.device);

	checkNotBusy(disk.device);

	const unsigned long long size = deviceSize(disk.device);

	// existing partitions first, the disk itself last
	vector<string> devices = listPartitions(disk.device);
	devices.push_back(disk.device);

	map<string, set<string>> signatures;
	for (vector<string>::const_iterator it = devices.begin(); it != devices.end(); ++it)
	    signatures[*it] = listSignatures(*it);

	for (vector<string>::const_iterator it = devices.begin(); it != devices.end(); ++it)
	{
	    const set<string>& tmp = signatures[*it];
	    for (set<string>::const_iterator sig = tmp.begin(); sig != tmp.end(); ++sig)
		clearMember(*it, *sig);
	}

	for (vector<string>::const_iterator it = devices.begin(); it != devices.end(); ++it)
	{
	    vector<string> wipefs = { WIPEFSBIN, "--all", "--force", *it };
	    run(wipefs, true);
	}

	zeroDevice(disk.device, size);
    }


    void
    Actions::doPartition(const Disk& disk, const vector<const Partition*>& partitions)
    {
	y2mil("partitioning " << disk.device << " with " << partitions.size() << " partitions");

	vector<string> mklabel = { PARTEDBIN, "-s", disk.device, "mklabel", toString(disk.label) };
	run(mklabel, true);

	for (vector<const Partition*>::const_iterator it = partitions.begin(); it != partitions.end(); ++it)
	{
	    const Partition& partition = **it;

	    vector<string> cmd = { PARTEDBIN, "-s", "-a", "optimal", disk.device, "unit", "B", "mkpart" };

	    // with gpt the first argument is the partition name
	    if (disk.label == PT_GPT && !partition.name.empty())
		cmd.push_back(partition.name);
	    else
		cmd.push_back("primary");

	    if (!partition.fs_hint.empty())
		cmd.push_back(partition.fs_hint);

	    cmd.push_back(decString(partition.start) + "B");
	    cmd.push_back(partition.to_end ? string("100%") : decString(partition.end - 1) + "B");

	    run(cmd, true);
	}

	// part of the destructive step, a cancellation must not leave the
	// new partitions without the final wipe
	vector<string> settle = { UDEVADMBIN, "settle", "--timeout=20" };
	run(settle, true);

	// old signatures can show up again at the offsets of the new partitions
	for (vector<const Partition*>::const_iterator it = partitions.begin(); it != partitions.end(); ++it)
	{
	    vector<string> wipefs = { WIPEFSBIN, "--all", "--force", (*it)->device() };
	    run(wipefs, true);
	}
    }


    void
    Actions::doFormat(const Filesystem& filesystem)
    {
	y2mil("formatting " << filesystem);

	vector<string> cmd;

	switch (filesystem.type)
	{
	    case FAT32:
		cmd = { MKFSFATBIN, "-F", "32" };
		break;

	    case BTRFS:
		cmd = { MKFSBTRFSBIN, "-f" };
		if (!filesystem.data_profile.empty())
		{
		    cmd.push_back("-d");
		    cmd.push_back(filesystem.data_profile);
		}
		if (!filesystem.metadata_profile.empty())
		{
		    cmd.push_back("-m");
		    cmd.push_back(filesystem.metadata_profile);
		}
		break;

	    case SWAP:
		cmd = { MKSWAPBIN, "-f" };
		break;

	    case EXT4:
		cmd = { MKFSEXT4BIN, "-F" };
		break;

	    case FSUNKNOWN:
		DP_THROW(UnsupportedOperationException("formatting filesystem " + filesystem.id +
						       " of unknown type"));
	}

	cmd.insert(cmd.end(), filesystem.mkfs_options.begin(), filesystem.mkfs_options.end());
	cmd.insert(cmd.end(), filesystem.devices.begin(), filesystem.devices.end());

	run(cmd, true);
    }


    void
    Actions::doSetLabel(const Filesystem& filesystem)
    {
	y2mil("labeling " << filesystem.id << " as " << filesystem.label);

	const string& device = filesystem.devices.front();

	vector<string> cmd;

	switch (filesystem.type)
	{
	    case FAT32:
		cmd = { FATLABELBIN, device, filesystem.label };
		break;

	    case BTRFS:
		cmd = { BTRFSBIN, "filesystem", "label", device, filesystem.label };
		break;

	    case SWAP:
		cmd = { SWAPLABELBIN, "-L", filesystem.label, device };
		break;

	    case EXT4:
		cmd = { E2LABELBIN, device, filesystem.label };
		break;

	    case FSUNKNOWN:
		DP_THROW(UnsupportedOperationException("labeling filesystem " + filesystem.id +
						       " of unknown type"));
	}

	run(cmd, false);
    }


    void
    Actions::doSetUuid(const Filesystem& filesystem)
    {
	y2mil("setting uuid of " << filesystem.id << " to " << filesystem.uuid);

	const string& device = filesystem.devices.front();

	vector<string> cmd;

	switch (filesystem.type)
	{
	    case BTRFS:
		cmd = { BTRFSTUNEBIN, "-f", "-U", filesystem.uuid, device };
		break;

	    case SWAP:
		cmd = { SWAPLABELBIN, "-U", filesystem.uuid, device };
		break;

	    case EXT4:
		cmd = { TUNE2FSBIN, "-U", filesystem.uuid, device };
		break;

	    case FAT32:
	    case FSUNKNOWN:
		DP_THROW(UnsupportedOperationException("assigning a UUID to " + toString(filesystem.type) +
						       " filesystem " + filesystem.id));
	}

	run(cmd, false);
    }


    void
    Actions::doMount(const Filesystem& filesystem, const Mount& mount)
    {
	y2mil("mounting " << filesystem.id << " at " << mount.path);

	const string& device = filesystem.devices.front();

	if (mount.isSwap())
	{
	    vector<string> cmd = { SWAPONBIN, device };
	    run(cmd, false);
	    return;
	}

	vector<string> mkdir = { MKDIRBIN, "-p", mount.path };
	run(mkdir, false);

	FsCapabilities caps;
	if (!getFsCapabilities(filesystem.type, caps))
	    DP_THROW(UnsupportedOperationException("mounting filesystem " + filesystem.id +
						   " of unknown type"));

	list<string> options = mount.options;
	if (!filesystem.compression.empty())
	    options.push_back("compress=" + filesystem.compression);

	vector<string> cmd = { MOUNTBIN, "-t", caps.mountType };
	if (!options.empty())
	{
	    cmd.push_back("-o");
	    cmd.push_back(boost::join(options, ","));
	}
	cmd.push_back(device);
	cmd.push_back(mount.path);

	run(cmd, false);
    }

}
