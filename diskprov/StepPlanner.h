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


#ifndef STEP_PLANNER_H
#define STEP_PLANNER_H


#include <vector>
#include <set>
#include <map>

#include "diskprov/Layout.h"
#include "diskprov/Step.h"


namespace diskprov
{

    /**
     * Expands a validated Layout into the dependency graph of steps and
     * orders it topologically:
     *
     * Wipe(disk) before Partition(disk), Partition of every disk holding
     * a device of a filesystem before Format, Format before Label before
     * AssignUUID, all of them before Mount, and the mount of a parent
     * directory before nested mounts.
     *
     * Among steps that are ready at the same time the step with the
     * lowest disk declaration index comes first, then the step with the
     * lower kind (Wipe < Partition < Format < Label < AssignUUID <
     * Mount), then the earlier created step.
     */
    class StepPlanner
    {
    public:

	StepPlanner(const Layout& layout);

	/**
	 * Throws UnsupportedOperationException if the layout asks for a
	 * label or UUID the filesystem kind cannot get, and
	 * PlanningException if the graph has a cycle or a missing
	 * dependency.
	 */
	Plan plan();

    private:

	unsigned addStep(StepKind kind, const string& target);
	void addEdge(unsigned from, unsigned to);
	void addDisk(unsigned seq, const string& device);

	void createSteps();
	void createEdges();
	vector<unsigned> sortSteps() const;

	const Step* findStep(StepKind kind, const string& target) const;
	const Mount* findParentMount(const Mount& mount) const;

	const Layout& layout;

	// indexed by seq
	vector<Step> steps;
	vector<std::set<unsigned>> edges;

    };

}


#endif
