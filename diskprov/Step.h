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


#ifndef STEP_H
#define STEP_H


#include <string>
#include <vector>
#include <set>
#include <ostream>

#include "diskprov/DiskprovTypes.h"
#include "diskprov/Layout.h"


namespace diskprov
{
    using std::string;
    using std::vector;
    using std::set;


    /**
     * One unit of work of a plan. The pointers refer into the Layout the
     * plan was made from, so the Layout must outlive the plan.
     */
    class Step
    {
    public:

	Step(unsigned seq, StepKind kind, const string& target);

	// position in the plan starting with 1
	unsigned id;

	// creation order in the planner
	unsigned seq;

	StepKind kind;

	// disk device, filesystem id or mount point
	string target;

	// disks touched by the step and the lowest declaration index of them
	set<string> disks;
	int disk_index;

	// ids of the steps that must succeed before this step
	vector<unsigned> depends;

	const Disk* disk;
	vector<const Partition*> partitions;
	const Filesystem* filesystem;
	const Mount* mount;

	/**
	 * Wipe, Partition and Format destroy data.
	 */
	bool isDestructive() const { return kind == WIPE || kind == PARTITION || kind == FORMAT; }

	bool touchesDisk(const string& device) const { return disks.count(device) > 0; }

	string text() const;

	friend std::ostream& operator<<(std::ostream& s, const Step& step);

    };


    /**
     * Steps in execution order.
     */
    class Plan
    {
    public:

	Plan() {}
	Plan(const vector<Step>& steps) : steps(steps) {}

	const vector<Step>& getSteps() const { return steps; }
	unsigned numSteps() const { return steps.size(); }
	bool empty() const { return steps.empty(); }

	/**
	 * Returns the step with the id (starting with 1).
	 */
	const Step& getStep(unsigned id) const { return steps.at(id - 1); }

	/**
	 * Ids of all steps depending directly or indirectly on the step.
	 */
	set<unsigned> allDependentsOf(unsigned id) const;

	/**
	 * Lists the steps with their dependencies, one per line.
	 */
	friend std::ostream& operator<<(std::ostream& s, const Plan& plan);

    private:

	vector<Step> steps;

    };

}


#endif
