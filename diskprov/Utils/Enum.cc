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


#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{

    // strings must match the layout file
    static const string fs_type_names[] = {
	"unknown", "fat32", "btrfs", "swap", "ext4"
    };

    const vector<string> EnumInfo<FsType>::names(fs_type_names, fs_type_names +
						 lengthof(fs_type_names));


    static const string disk_role_names[] = {
	"data", "boot", "raid-member", "system"
    };

    const vector<string> EnumInfo<DiskRole>::names(disk_role_names, disk_role_names +
						   lengthof(disk_role_names));


    // strings must match "parted mklabel" argument
    static const string pt_type_names[] = {
	"gpt", "msdos"
    };

    const vector<string> EnumInfo<PtType>::names(pt_type_names, pt_type_names +
						 lengthof(pt_type_names));


    static const string step_kind_names[] = {
	"Wipe", "Partition", "Format", "Label", "AssignUUID", "Mount"
    };

    const vector<string> EnumInfo<StepKind>::names(step_kind_names, step_kind_names +
						   lengthof(step_kind_names));


    static const string step_status_names[] = {
	"Pending", "Succeeded", "Failed", "Skipped"
    };

    const vector<string> EnumInfo<StepStatus>::names(step_status_names, step_status_names +
						     lengthof(step_status_names));


    static const string skip_reason_names[] = {
	"none", "dependency-failed", "disk-halted", "run-halted", "cancelled"
    };

    const vector<string> EnumInfo<SkipReason>::names(skip_reason_names, skip_reason_names +
						     lengthof(skip_reason_names));


    static const string error_kind_names[] = {
	"None", "InvalidLayout", "ParseError", "PlanningError", "UnsupportedOperation",
	"CommandTimeout", "CommandNonZeroExit", "CommandNotFound", "Cancelled", "DeviceBusy",
	"Locked", "InternalError"
    };

    const vector<string> EnumInfo<ErrorKind>::names(error_kind_names, error_kind_names +
						    lengthof(error_kind_names));


    static const string run_state_names[] = {
	"Idle", "Validating", "Planning", "Executing", "Completed", "Halted"
    };

    const vector<string> EnumInfo<RunState>::names(run_state_names, run_state_names +
						   lengthof(run_state_names));

}
