/*
 * Copyright (c) [2015] SUSE LLC
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
 * with this program; if not, contact Novell, Inc.
 *
 * To contact Novell about this file by physical or electronic mail, you may
 * find current contact information at www.novell.com.
 */


#ifndef DISKPROV_DEFINES_H
#define DISKPROV_DEFINES_H


// programs are looked up in PATH

#define SYSCONFIGFILE "/etc/sysconfig/diskprov"
#define LOCKFILE "/var/lock/diskprov/lock"

#define PROCMOUNTSFILE "/proc/mounts"
#define PROCSWAPSFILE "/proc/swaps"

#define PARTEDBIN "parted"
#define UDEVADMBIN "udevadm"

#define MDADMBIN "mdadm"
#define PVREMOVEBIN "pvremove"
#define ZPOOLBIN "zpool"
#define WIPEFSBIN "wipefs"

#define DDBIN "dd"
#define LSBLKBIN "lsblk"
#define BLOCKDEVBIN "blockdev"

#define MKFSFATBIN "mkfs.fat"
#define MKFSBTRFSBIN "mkfs.btrfs"
#define MKSWAPBIN "mkswap"
#define MKFSEXT4BIN "mkfs.ext4"

#define FATLABELBIN "fatlabel"
#define BTRFSBIN "btrfs"
#define SWAPLABELBIN "swaplabel"
#define E2LABELBIN "e2label"

#define BTRFSTUNEBIN "btrfstune"
#define TUNE2FSBIN "tune2fs"

#define MKDIRBIN "mkdir"
#define MOUNTBIN "mount"
#define SWAPONBIN "swapon"


#endif
