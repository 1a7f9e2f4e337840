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


#include <string.h>
#include <boost/algorithm/string.hpp>

#include "diskprov/LayoutFile.h"
#include "diskprov/Utils/XmlFile.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/HumanString.h"
#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{
    using namespace std;


    namespace
    {

	string
	requiredValue(const xmlNode* node, const char* name, const string& context)
	{
	    string value;
	    if (!getChildValue(node, name, value) || value.empty())
		DP_THROW(ParseException(string("missing <") + name + "> in " + context, "", name));
	    return value;
	}


	template <typename EnumType>
	EnumType
	enumValue(const string& value, const char* name)
	{
	    EnumType ret;
	    if (!toValue(value, ret, false))
		DP_THROW(ParseException(string("unknown value of <") + name + ">", value,
					boost::join(EnumInfo<EnumType>::names, "|")));
	    return ret;
	}


	unsigned long long
	sizeValue(const string& value, const char* name)
	{
	    unsigned long long size = 0;
	    if (!humanStringToByte(value, size))
		DP_THROW(ParseException(string("bad size in <") + name + ">", value, "e.g. 512 MiB"));
	    return size;
	}


	Partition
	readPartition(const xmlNode* node, const string& disk)
	{
	    const string context = "partition of " + disk;

	    unsigned nr = 0;
	    if (!getChildValue(node, "number", nr))
		DP_THROW(ParseException("missing or bad <number> in " + context, "", "number"));

	    unsigned long long start = sizeValue(requiredValue(node, "start", context), "start");

	    string end = requiredValue(node, "end", context);

	    Partition partition(disk, nr, start, 0);

	    if (boost::ends_with(end, "%"))
	    {
		if (boost::trim_copy(end.substr(0, end.size() - 1), locale::classic()) != "100")
		    DP_THROW(ParseException("only 100% is allowed as relative end", end, "100%"));
		partition.to_end = true;
	    }
	    else
	    {
		partition.end = sizeValue(end, "end");
	    }

	    getChildValue(node, "fs-hint", partition.fs_hint);
	    getChildValue(node, "name", partition.name);

	    return partition;
	}


	void
	readDisk(const xmlNode* node, Layout& layout)
	{
	    Disk disk(requiredValue(node, "device", "disk"));

	    string tmp;

	    if (getChildValue(node, "role", tmp))
		disk.role = enumValue<DiskRole>(tmp, "role");

	    if (getChildValue(node, "label", tmp))
		disk.label = enumValue<PtType>(tmp, "label");

	    getChildValue(node, "wipe", disk.wipe);

	    layout.addDisk(disk);

	    const list<const xmlNode*> partitions = getChildNodes(node, "partition");
	    for (list<const xmlNode*>::const_iterator it = partitions.begin(); it != partitions.end(); ++it)
		layout.addPartition(readPartition(*it, disk.device));
	}


	void
	readFilesystem(const xmlNode* node, Layout& layout)
	{
	    const string id = requiredValue(node, "id", "filesystem");
	    const string context = "filesystem " + id;

	    Filesystem filesystem(id, enumValue<FsType>(requiredValue(node, "type", context), "type"));

	    if (filesystem.type == FSUNKNOWN)
		DP_THROW(ParseException("unknown filesystem type in " + context, "unknown",
					"fat32|btrfs|swap|ext4"));

	    getChildValues(node, "device", filesystem.devices);
	    getChildValue(node, "data-profile", filesystem.data_profile);
	    getChildValue(node, "metadata-profile", filesystem.metadata_profile);
	    getChildValue(node, "compression", filesystem.compression);
	    getChildValues(node, "mkfs-option", filesystem.mkfs_options);
	    getChildValue(node, "label", filesystem.label);
	    getChildValue(node, "uuid", filesystem.uuid);

	    boost::to_lower(filesystem.uuid, locale::classic());

	    layout.addFilesystem(filesystem);
	}


	void
	readMount(const xmlNode* node, Layout& layout)
	{
	    Mount mount(requiredValue(node, "filesystem", "mount"),
			requiredValue(node, "path", "mount"));

	    string options;
	    if (getChildValue(node, "options", options) && !options.empty())
		boost::split(mount.options, options, boost::is_any_of(","), boost::token_compress_on);

	    layout.addMount(mount);
	}

    }


    Layout
    readLayout(const string& filename)
    {
	y2mil("reading layout " << filename);

	XmlFile file(filename);

	const xmlNode* root = file.getRootElement();
	if (!root || strcmp((const char*) root->name, "layout") != 0)
	    DP_THROW(ParseException("bad root element in " + filename,
				    root ? (const char*) root->name : "", "layout"));

	Layout layout;

	const list<const xmlNode*> disks = getChildNodes(root, "disk");
	for (list<const xmlNode*>::const_iterator it = disks.begin(); it != disks.end(); ++it)
	    readDisk(*it, layout);

	const list<const xmlNode*> filesystems = getChildNodes(root, "filesystem");
	for (list<const xmlNode*>::const_iterator it = filesystems.begin(); it != filesystems.end(); ++it)
	    readFilesystem(*it, layout);

	const list<const xmlNode*> mounts = getChildNodes(root, "mount");
	for (list<const xmlNode*>::const_iterator it = mounts.begin(); it != mounts.end(); ++it)
	    readMount(*it, layout);

	y2mil("layout:" << std::endl << layout);

	return layout;
    }

}
