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


#ifndef LAYOUT_H
#define LAYOUT_H


#include <string>
#include <list>
#include <vector>
#include <ostream>

#include "diskprov/DiskprovTypes.h"
#include "diskprov/Region.h"


namespace diskprov
{
    using std::string;
    using std::list;
    using std::vector;


    struct Disk
    {
	Disk(const string& device, DiskRole role = ROLE_DATA, PtType label = PT_GPT,
	     bool wipe = true)
	    : device(device), role(role), label(label), wipe(wipe) {}

	string device;
	DiskRole role;
	PtType label;
	bool wipe;

	/**
	 * Returns the device name of partition nr of the disk, e.g.
	 * /dev/sda1 or /dev/nvme0n1p1.
	 */
	static string partitionDevice(const string& disk, unsigned nr);

	friend std::ostream& operator<<(std::ostream& s, const Disk& disk);
    };


    struct Partition
    {
	Partition(const string& disk, unsigned nr, unsigned long long start,
		  unsigned long long end, const string& fs_hint = "")
	    : disk(disk), nr(nr), start(start), end(end), to_end(false), fs_hint(fs_hint) {}

	string disk;
	unsigned nr;

	// offsets in bytes, end is exclusive and ignored with to_end
	unsigned long long start;
	unsigned long long end;
	bool to_end;

	// filesystem type for parted, e.g. "fat32" or "linux-swap"
	string fs_hint;

	// partition name (gpt only)
	string name;

	string device() const { return Disk::partitionDevice(disk, nr); }

	/**
	 * Region of the partition, a partition running to the end of the
	 * disk extends up to the largest possible offset.
	 */
	Region region() const;

	friend std::ostream& operator<<(std::ostream& s, const Partition& partition);
    };


    struct Filesystem
    {
	Filesystem(const string& id, FsType type)
	    : id(id), type(type) {}

	string id;
	FsType type;

	// partition devices, more than one for btrfs raid
	list<string> devices;

	// btrfs only
	string data_profile;
	string metadata_profile;
	string compression;

	list<string> mkfs_options;

	string label;
	string uuid;

	bool isRaid() const;

	friend std::ostream& operator<<(std::ostream& s, const Filesystem& filesystem);
    };


    struct Mount
    {
	Mount(const string& filesystem, const string& path)
	    : filesystem(filesystem), path(path) {}

	// id of the filesystem
	string filesystem;

	// absolute path or "swap"
	string path;

	list<string> options;

	bool isSwap() const { return path == "swap"; }

	friend std::ostream& operator<<(std::ostream& s, const Mount& mount);
    };


    /**
     * Declarative description of the disks, partitions, filesystems and
     * mount points to set up. The declaration order of the disks matters
     * for the order of the plan.
     */
    class Layout
    {
    public:

	Layout() {}

	void addDisk(const Disk& disk) { disks.push_back(disk); }
	void addPartition(const Partition& partition) { partitions.push_back(partition); }
	void addFilesystem(const Filesystem& filesystem) { filesystems.push_back(filesystem); }
	void addMount(const Mount& mount) { mounts.push_back(mount); }

	const vector<Disk>& getDisks() const { return disks; }
	const vector<Partition>& getPartitions() const { return partitions; }
	const vector<Filesystem>& getFilesystems() const { return filesystems; }
	const vector<Mount>& getMounts() const { return mounts; }

	const Disk* findDisk(const string& device) const;

	/**
	 * Position of the disk in declaration order, -1 if not declared.
	 */
	int diskIndex(const string& device) const;

	/**
	 * Finds a partition by its device name.
	 */
	const Partition* findPartition(const string& device) const;

	/**
	 * Partitions of the disk sorted by number.
	 */
	vector<const Partition*> partitionsOf(const string& disk) const;

	const Filesystem* findFilesystem(const string& id) const;

	/**
	 * Disks holding the devices of the filesystem, in declaration order.
	 */
	vector<string> disksOf(const Filesystem& filesystem) const;

	const Mount* findMount(const string& filesystem) const;

	/**
	 * Checks the layout and throws InvalidLayoutException on the first
	 * violation found.
	 */
	void validate() const;

	friend std::ostream& operator<<(std::ostream& s, const Layout& layout);

    private:

	void validateDisks() const;
	void validatePartitions() const;
	void validateFilesystems() const;
	void validateMounts() const;

	vector<Disk> disks;
	vector<Partition> partitions;
	vector<Filesystem> filesystems;
	vector<Mount> mounts;

    };

}


#endif
