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


#ifndef DISKPROV_TYPES_H
#define DISKPROV_TYPES_H


namespace diskprov
{

    enum FsType { FSUNKNOWN, FAT32, BTRFS, SWAP, EXT4 };

    enum DiskRole { ROLE_DATA, ROLE_BOOT, ROLE_RAID_MEMBER, ROLE_SYSTEM };

    enum PtType { PT_GPT, PT_MSDOS };

    /**
     * The order of the step kinds is the tie-break priority of the
     * planner.
     */
    enum StepKind { WIPE, PARTITION, FORMAT, LABEL, ASSIGN_UUID, MOUNT };

    enum StepStatus { STEP_PENDING, STEP_SUCCEEDED, STEP_FAILED, STEP_SKIPPED };

    enum SkipReason { SKIP_NONE, SKIP_DEPENDENCY_FAILED, SKIP_DISK_HALTED, SKIP_RUN_HALTED,
		      SKIP_CANCELLED };

    enum ErrorKind { ERR_NONE, ERR_INVALID_LAYOUT, ERR_PARSE, ERR_PLANNING,
		     ERR_UNSUPPORTED_OPERATION, ERR_COMMAND_TIMEOUT, ERR_COMMAND_NON_ZERO_EXIT,
		     ERR_COMMAND_NOT_FOUND, ERR_CANCELLED, ERR_DEVICE_BUSY, ERR_LOCKED,
		     ERR_INTERNAL };

    enum RunState { IDLE, VALIDATING, PLANNING, EXECUTING, COMPLETED, HALTED };

}


#endif
