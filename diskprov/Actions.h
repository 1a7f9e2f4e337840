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


#ifndef ACTIONS_H
#define ACTIONS_H


#include <string>
#include <vector>
#include <set>

#include "diskprov/CommandRunner.h"
#include "diskprov/Step.h"


namespace diskprov
{

    /**
     * The command sequences of the step kinds. Every function throws the
     * exception of the first failing command.
     */
    class Actions
    {
    public:

	Actions(CommandRunner& runner);

	/**
	 * Runs the commands of the step.
	 */
	void runStep(const Step& step);

	void doWipe(const Disk& disk);
	void doPartition(const Disk& disk, const vector<const Partition*>& partitions);
	void doFormat(const Filesystem& filesystem);
	void doSetLabel(const Filesystem& filesystem);
	void doSetUuid(const Filesystem& filesystem);
	void doMount(const Filesystem& filesystem, const Mount& mount);

	/**
	 * Returns the size of the device in bytes.
	 */
	unsigned long long deviceSize(const string& device);

	/**
	 * Throws DeviceBusyException if the disk or one of its partitions
	 * is mounted or used as swap.
	 */
	void checkNotBusy(const string& disk) const;

    private:

	CommandResult run(const vector<string>& args, bool destructive,
			  const vector<int>& ok_codes = vector<int>(1, 0));

	vector<string> listPartitions(const string& disk);
	set<string> listSignatures(const string& device);
	void clearMember(const string& device, const string& signature);
	void zeroDevice(const string& device, unsigned long long size);

	CommandRunner& runner;

    };

}


#endif
