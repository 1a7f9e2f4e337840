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


#include <ctype.h>
#include <climits>
#include <set>
#include <map>
#include <algorithm>
#include <boost/algorithm/string.hpp>

#include "diskprov/Layout.h"
#include "diskprov/FsCapabilities.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/HumanString.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    string
    Disk::partitionDevice(const string& disk, unsigned nr)
    {
	if (boost::starts_with(disk, "/dev/mapper/"))
	    return disk + "_part" + decString(nr);
	else if (!disk.empty() && isdigit((unsigned char) disk[disk.size() - 1]))
	    return disk + "p" + decString(nr);
	else
	    return disk + decString(nr);
    }


    std::ostream&
    operator<<(std::ostream& s, const Disk& disk)
    {
	s << "device:" << disk.device << " role:" << toString(disk.role)
	  << " label:" << toString(disk.label);
	if (!disk.wipe)
	    s << " nowipe";
	return s;
    }


    Region
    Partition::region() const
    {
	if (to_end)
	    return Region(start, ULLONG_MAX - start);

	return Region(start, end > start ? end - start : 0);
    }


    std::ostream&
    operator<<(std::ostream& s, const Partition& partition)
    {
	s << "device:" << partition.device() << " start:" << partition.start;
	if (partition.to_end)
	    s << " end:100%";
	else
	    s << " end:" << partition.end;
	if (!partition.fs_hint.empty())
	    s << " fs-hint:" << partition.fs_hint;
	if (!partition.name.empty())
	    s << " name:" << partition.name;
	return s;
    }


    bool
    Filesystem::isRaid() const
    {
	return devices.size() > 1 || boost::starts_with(data_profile, "raid") ||
	    boost::starts_with(metadata_profile, "raid");
    }


    std::ostream&
    operator<<(std::ostream& s, const Filesystem& filesystem)
    {
	s << "id:" << filesystem.id << " type:" << toString(filesystem.type)
	  << " devices:" << filesystem.devices;
	if (!filesystem.data_profile.empty())
	    s << " data:" << filesystem.data_profile;
	if (!filesystem.metadata_profile.empty())
	    s << " metadata:" << filesystem.metadata_profile;
	if (!filesystem.compression.empty())
	    s << " compression:" << filesystem.compression;
	if (!filesystem.mkfs_options.empty())
	    s << " mkfs-options:" << filesystem.mkfs_options;
	if (!filesystem.label.empty())
	    s << " label:" << filesystem.label;
	if (!filesystem.uuid.empty())
	    s << " uuid:" << filesystem.uuid;
	return s;
    }


    std::ostream&
    operator<<(std::ostream& s, const Mount& mount)
    {
	s << "filesystem:" << mount.filesystem << " path:" << mount.path;
	if (!mount.options.empty())
	    s << " options:" << boost::join(mount.options, ",");
	return s;
    }


    const Disk*
    Layout::findDisk(const string& device) const
    {
	for (vector<Disk>::const_iterator it = disks.begin(); it != disks.end(); ++it)
	    if (it->device == device)
		return &*it;
	return NULL;
    }


    int
    Layout::diskIndex(const string& device) const
    {
	for (vector<Disk>::size_type i = 0; i < disks.size(); ++i)
	    if (disks[i].device == device)
		return i;
	return -1;
    }


    const Partition*
    Layout::findPartition(const string& device) const
    {
	for (vector<Partition>::const_iterator it = partitions.begin(); it != partitions.end(); ++it)
	    if (it->device() == device)
		return &*it;
	return NULL;
    }


    vector<const Partition*>
    Layout::partitionsOf(const string& disk) const
    {
	vector<const Partition*> ret;

	for (vector<Partition>::const_iterator it = partitions.begin(); it != partitions.end(); ++it)
	    if (it->disk == disk)
		ret.push_back(&*it);

	std::stable_sort(ret.begin(), ret.end(), [](const Partition* a, const Partition* b) {
	    return a->nr < b->nr;
	});

	return ret;
    }


    const Filesystem*
    Layout::findFilesystem(const string& id) const
    {
	for (vector<Filesystem>::const_iterator it = filesystems.begin(); it != filesystems.end(); ++it)
	    if (it->id == id)
		return &*it;
	return NULL;
    }


    vector<string>
    Layout::disksOf(const Filesystem& filesystem) const
    {
	set<int> indices;

	for (list<string>::const_iterator it = filesystem.devices.begin();
	     it != filesystem.devices.end(); ++it)
	{
	    const Partition* partition = findPartition(*it);
	    if (partition)
	    {
		int idx = diskIndex(partition->disk);
		if (idx >= 0)
		    indices.insert(idx);
	    }
	}

	vector<string> ret;
	for (set<int>::const_iterator it = indices.begin(); it != indices.end(); ++it)
	    ret.push_back(disks[*it].device);
	return ret;
    }


    const Mount*
    Layout::findMount(const string& filesystem) const
    {
	for (vector<Mount>::const_iterator it = mounts.begin(); it != mounts.end(); ++it)
	    if (it->filesystem == filesystem)
		return &*it;
	return NULL;
    }


    void
    Layout::validate() const
    {
	y2mil("validating layout with " << disks.size() << " disks, " << partitions.size()
	      << " partitions, " << filesystems.size() << " filesystems and " << mounts.size()
	      << " mounts");

	validateDisks();
	validatePartitions();
	validateFilesystems();
	validateMounts();

	y2mil("layout is valid");
    }


    void
    Layout::validateDisks() const
    {
	if (disks.empty())
	    DP_THROW(InvalidLayoutException("no disks declared"));

	set<string> seen;

	for (vector<Disk>::const_iterator it = disks.begin(); it != disks.end(); ++it)
	{
	    if (it->device.empty())
		DP_THROW(InvalidLayoutException("disk without device"));

	    if (it->device[0] != '/')
		DP_THROW(InvalidLayoutException("disk device " + it->device + " is not an absolute path"));

	    if (!seen.insert(it->device).second)
		DP_THROW(InvalidLayoutException("disk " + it->device + " declared twice"));
	}
    }


    void
    Layout::validatePartitions() const
    {
	for (vector<Partition>::const_iterator it = partitions.begin(); it != partitions.end(); ++it)
	{
	    if (!findDisk(it->disk))
		DP_THROW(InvalidLayoutException("partition " + it->device() + " references undeclared disk " +
						it->disk));

	    if (it->nr == 0)
		DP_THROW(InvalidLayoutException("partition number 0 on disk " + it->disk));

	    if (it->region().empty())
		DP_THROW(InvalidLayoutException("partition " + it->device() + " is empty"));
	}

	for (vector<Disk>::const_iterator disk = disks.begin(); disk != disks.end(); ++disk)
	{
	    const vector<const Partition*> parts = partitionsOf(disk->device);

	    // no extended and logical partitions
	    if (disk->label == PT_MSDOS && !parts.empty() && parts.back()->nr > 4)
		DP_THROW(InvalidLayoutException("msdos partition table of " + disk->device +
						" supports only partitions 1 to 4"));

	    for (vector<const Partition*>::size_type i = 0; i < parts.size(); ++i)
	    {
		const Partition& p1 = *parts[i];

		for (vector<const Partition*>::size_type j = i + 1; j < parts.size(); ++j)
		{
		    const Partition& p2 = *parts[j];

		    if (p1.nr == p2.nr)
			DP_THROW(InvalidLayoutException("partition number " + decString(p1.nr) +
							" used twice on disk " + disk->device));

		    if (p1.region().doIntersect(p2.region()))
		    {
			const Region overlap = p1.region().intersect(p2.region());
			DP_THROW(InvalidLayoutException("partitions " + p1.device() + " and " +
							p2.device() + " overlap in " +
							byteToHumanString(overlap.len()) + " from byte " +
							decString(overlap.start())));
		    }
		}

		if (i + 1 < parts.size())
		{
		    const Partition& next = *parts[i + 1];

		    if (p1.to_end)
			DP_THROW(InvalidLayoutException("only the last partition of disk " + disk->device +
							" may extend to the end of the disk"));

		    if (next.start <= p1.start)
			DP_THROW(InvalidLayoutException("offset of partition " + next.device() +
							" is not above offset of " + p1.device()));
		}
	    }
	}
    }


    namespace
    {

	struct RaidProfile
	{
	    const char* name;
	    unsigned min_devices;
	};

	const RaidProfile raid_profiles[] = {
	    { "single", 1 }, { "dup", 1 }, { "raid0", 2 }, { "raid1", 2 }, { "raid1c3", 3 },
	    { "raid1c4", 4 }, { "raid10", 4 }, { "raid5", 2 }, { "raid6", 3 }
	};


	bool
	minDevicesOf(const string& profile, unsigned& min_devices)
	{
	    for (unsigned i = 0; i < lengthof(raid_profiles); ++i)
	    {
		if (profile == raid_profiles[i].name)
		{
		    min_devices = raid_profiles[i].min_devices;
		    return true;
		}
	    }
	    return false;
	}

    }


    void
    Layout::validateFilesystems() const
    {
	set<string> ids;
	set<string> used;

	for (vector<Filesystem>::const_iterator it = filesystems.begin(); it != filesystems.end(); ++it)
	{
	    if (it->id.empty())
		DP_THROW(InvalidLayoutException("filesystem without id"));

	    if (!ids.insert(it->id).second)
		DP_THROW(InvalidLayoutException("filesystem " + it->id + " declared twice"));

	    FsCapabilities caps;
	    if (!getFsCapabilities(it->type, caps))
		DP_THROW(InvalidLayoutException("filesystem " + it->id + " has unknown type"));

	    if (it->devices.empty())
		DP_THROW(InvalidLayoutException("filesystem " + it->id + " has no devices"));

	    for (list<string>::const_iterator dev = it->devices.begin(); dev != it->devices.end(); ++dev)
	    {
		if (!findPartition(*dev))
		    DP_THROW(InvalidLayoutException("filesystem " + it->id + " references undeclared partition " +
						    *dev));

		if (!used.insert(*dev).second)
		    DP_THROW(InvalidLayoutException("partition " + *dev + " used by more than one filesystem"));
	    }

	    if (it->isRaid())
	    {
		if (!caps.supportsMultipleDevices)
		    DP_THROW(InvalidLayoutException("filesystem " + it->id + " of type " + toString(it->type) +
						    " cannot span several devices"));

		if (it->devices.size() < 2)
		    DP_THROW(InvalidLayoutException("raid filesystem " + it->id + " needs at least two devices"));

		vector<string> members = disksOf(*it);
		if (members.size() != it->devices.size())
		    DP_THROW(InvalidLayoutException("devices of raid filesystem " + it->id +
						    " are not on distinct disks"));
	    }

	    const string* profiles[] = { &it->data_profile, &it->metadata_profile };
	    for (unsigned i = 0; i < lengthof(profiles); ++i)
	    {
		const string& profile = *profiles[i];
		if (profile.empty())
		    continue;

		if (it->type != BTRFS)
		    DP_THROW(InvalidLayoutException("raid profile for non-btrfs filesystem " + it->id));

		unsigned min_devices = 0;
		if (!minDevicesOf(profile, min_devices))
		    DP_THROW(InvalidLayoutException("unknown raid profile " + profile + " for filesystem " +
						    it->id));

		if (it->devices.size() < min_devices)
		    DP_THROW(InvalidLayoutException("raid profile " + profile + " of filesystem " + it->id +
						    " needs at least " + decString(min_devices) + " devices"));
	    }

	    if (!it->compression.empty() && !caps.supportsCompression)
		DP_THROW(InvalidLayoutException("filesystem " + it->id + " of type " + toString(it->type) +
						" does not support compression"));

	    if (!it->label.empty())
	    {
		if (!caps.supportsLabel)
		    DP_THROW(InvalidLayoutException("filesystem " + it->id + " of type " + toString(it->type) +
						    " does not support labels"));

		if (it->label.size() > caps.labelLength)
		    DP_THROW(InvalidLayoutException("label " + it->label + " of filesystem " + it->id +
						    " is longer than " + decString(caps.labelLength) +
						    " characters"));
	    }

	    if (!it->uuid.empty() && !isValidUuid(it->uuid))
		DP_THROW(InvalidLayoutException("uuid " + it->uuid + " of filesystem " + it->id +
						" is malformed"));
	}
    }


    void
    Layout::validateMounts() const
    {
	set<string> paths;

	for (vector<Mount>::const_iterator it = mounts.begin(); it != mounts.end(); ++it)
	{
	    const Filesystem* filesystem = findFilesystem(it->filesystem);
	    if (!filesystem)
		DP_THROW(InvalidLayoutException("mount " + it->path + " references undeclared filesystem " +
						it->filesystem));

	    // the first mount of the filesystem is found
	    if (findMount(it->filesystem) != &*it)
		DP_THROW(InvalidLayoutException("filesystem " + it->filesystem + " mounted twice"));

	    if (filesystem->type == SWAP)
	    {
		if (!it->isSwap())
		    DP_THROW(InvalidLayoutException("swap filesystem " + it->filesystem +
						    " can only be mounted as swap"));
		continue;
	    }

	    if (it->isSwap())
		DP_THROW(InvalidLayoutException("filesystem " + it->filesystem + " is not swap"));

	    if (it->path.empty() || it->path[0] != '/')
		DP_THROW(InvalidLayoutException("mount point " + it->path + " is not an absolute path"));

	    if (!paths.insert(it->path).second)
		DP_THROW(InvalidLayoutException("mount point " + it->path + " used twice"));

	    for (list<string>::const_iterator opt = it->options.begin(); opt != it->options.end(); ++opt)
	    {
		if (opt->empty() || opt->find_first_of(", \t\n") != string::npos)
		    DP_THROW(InvalidLayoutException("bad mount option '" + *opt + "' for " + it->path));
	    }
	}
    }


    std::ostream&
    operator<<(std::ostream& s, const Layout& layout)
    {
	for (vector<Disk>::const_iterator disk = layout.disks.begin(); disk != layout.disks.end(); ++disk)
	{
	    s << "disk " << *disk << std::endl;

	    const vector<const Partition*> parts = layout.partitionsOf(disk->device);
	    for (vector<const Partition*>::const_iterator it = parts.begin(); it != parts.end(); ++it)
		s << "  partition " << **it << std::endl;
	}

	for (vector<Filesystem>::const_iterator it = layout.filesystems.begin();
	     it != layout.filesystems.end(); ++it)
	    s << "filesystem " << *it << std::endl;

	for (vector<Mount>::const_iterator it = layout.mounts.begin(); it != layout.mounts.end(); ++it)
	    s << "mount " << *it << std::endl;

	return s;
    }

}
