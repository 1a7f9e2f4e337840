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


#include <climits>
#include <algorithm>
#include <boost/algorithm/string.hpp>

#include "diskprov/StepPlanner.h"
#include "diskprov/FsCapabilities.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    StepPlanner::StepPlanner(const Layout& layout)
	: layout(layout)
    {
    }


    unsigned
    StepPlanner::addStep(StepKind kind, const string& target)
    {
	unsigned seq = steps.size();
	steps.push_back(Step(seq, kind, target));
	edges.push_back(set<unsigned>());
	return seq;
    }


    void
    StepPlanner::addEdge(unsigned from, unsigned to)
    {
	y2deb("edge " << steps[from].text() << " -> " << steps[to].text());
	edges[from].insert(to);
    }


    void
    StepPlanner::addDisk(unsigned seq, const string& device)
    {
	int idx = layout.diskIndex(device);
	if (idx < 0)
	    DP_THROW(PlanningException("missing dependency: disk " + device + " of " +
				       steps[seq].text() + " is not declared"));

	Step& step = steps[seq];
	step.disks.insert(device);
	if (step.disk_index < 0 || idx < step.disk_index)
	    step.disk_index = idx;
    }


    const Step*
    StepPlanner::findStep(StepKind kind, const string& target) const
    {
	for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	    if (it->kind == kind && it->target == target)
		return &*it;
	return NULL;
    }


    const Mount*
    StepPlanner::findParentMount(const Mount& mount) const
    {
	string path = mount.path;

	while (path != "/")
	{
	    string::size_type pos = path.rfind("/");
	    if (pos == string::npos)
		return NULL;

	    path.erase(pos);
	    if (path.empty())
		path = "/";

	    const vector<Mount>& mounts = layout.getMounts();
	    for (vector<Mount>::const_iterator it = mounts.begin(); it != mounts.end(); ++it)
		if (it->path == path)
		    return &*it;
	}

	return NULL;
    }


    static string
    mountTarget(const Mount& mount)
    {
	return mount.isSwap() ? "swap:" + mount.filesystem : mount.path;
    }


    void
    StepPlanner::createSteps()
    {
	const vector<Disk>& disks = layout.getDisks();
	for (vector<Disk>::const_iterator it = disks.begin(); it != disks.end(); ++it)
	{
	    if (it->wipe)
	    {
		unsigned seq = addStep(WIPE, it->device);
		steps[seq].disk = &*it;
		addDisk(seq, it->device);
	    }

	    const vector<const Partition*> partitions = layout.partitionsOf(it->device);
	    if (!partitions.empty())
	    {
		unsigned seq = addStep(PARTITION, it->device);
		steps[seq].disk = &*it;
		steps[seq].partitions = partitions;
		addDisk(seq, it->device);
	    }
	}

	const vector<Filesystem>& filesystems = layout.getFilesystems();
	for (vector<Filesystem>::const_iterator it = filesystems.begin(); it != filesystems.end(); ++it)
	{
	    FsCapabilities caps;
	    if (!getFsCapabilities(it->type, caps))
		DP_THROW(UnsupportedOperationException("filesystem " + it->id + " has unknown type"));

	    vector<const Partition*> partitions;
	    for (list<string>::const_iterator dev = it->devices.begin(); dev != it->devices.end(); ++dev)
	    {
		const Partition* partition = layout.findPartition(*dev);
		if (!partition)
		    DP_THROW(PlanningException("missing dependency: partition " + *dev + " of filesystem " +
					       it->id + " is not declared"));
		partitions.push_back(partition);
	    }

	    vector<StepKind> kinds;
	    kinds.push_back(FORMAT);

	    if (!it->label.empty())
	    {
		if (!caps.supportsLabel)
		    DP_THROW(UnsupportedOperationException("setting a label on " + toString(it->type) +
							   " filesystem " + it->id));
		kinds.push_back(LABEL);
	    }

	    if (!it->uuid.empty())
	    {
		if (!caps.supportsUuid)
		    DP_THROW(UnsupportedOperationException("assigning a UUID to " + toString(it->type) +
							   " filesystem " + it->id));
		kinds.push_back(ASSIGN_UUID);
	    }

	    for (vector<StepKind>::const_iterator kind = kinds.begin(); kind != kinds.end(); ++kind)
	    {
		unsigned seq = addStep(*kind, it->id);
		steps[seq].filesystem = &*it;
		steps[seq].partitions = partitions;
		for (vector<const Partition*>::const_iterator p = partitions.begin(); p != partitions.end(); ++p)
		    addDisk(seq, (*p)->disk);
	    }
	}

	const vector<Mount>& mounts = layout.getMounts();
	for (vector<Mount>::const_iterator it = mounts.begin(); it != mounts.end(); ++it)
	{
	    const Filesystem* filesystem = layout.findFilesystem(it->filesystem);
	    if (!filesystem)
		DP_THROW(PlanningException("missing dependency: filesystem " + it->filesystem +
					   " of mount " + it->path + " is not declared"));

	    unsigned seq = addStep(MOUNT, mountTarget(*it));
	    steps[seq].filesystem = filesystem;
	    steps[seq].mount = &*it;
	    for (list<string>::const_iterator dev = filesystem->devices.begin();
		 dev != filesystem->devices.end(); ++dev)
	    {
		const Partition* partition = layout.findPartition(*dev);
		if (!partition)
		    DP_THROW(PlanningException("missing dependency: partition " + *dev + " of mount " +
					       it->path + " is not declared"));
		steps[seq].partitions.push_back(partition);
		addDisk(seq, partition->disk);
	    }
	}
    }


    void
    StepPlanner::createEdges()
    {
	for (vector<Step>::size_type seq = 0; seq < steps.size(); ++seq)
	{
	    const Step& step = steps[seq];

	    switch (step.kind)
	    {
		case WIPE:
		    break;

		case PARTITION: {
		    const Step* wipe = findStep(WIPE, step.target);
		    if (wipe)
			addEdge(wipe->seq, seq);
		} break;

		case FORMAT: {
		    // raid filesystems depend on the partitioning of all member disks
		    for (set<string>::const_iterator disk = step.disks.begin(); disk != step.disks.end(); ++disk)
		    {
			const Step* partition = findStep(PARTITION, *disk);
			if (!partition)
			    DP_THROW(PlanningException("missing dependency: no partitioning of " + *disk +
						       " for " + step.text()));
			addEdge(partition->seq, seq);
		    }
		} break;

		case LABEL: {
		    const Step* format = findStep(FORMAT, step.target);
		    if (!format)
			DP_THROW(PlanningException("missing dependency: no format for " + step.text()));
		    addEdge(format->seq, seq);
		} break;

		case ASSIGN_UUID: {
		    const Step* prev = findStep(LABEL, step.target);
		    if (!prev)
			prev = findStep(FORMAT, step.target);
		    if (!prev)
			DP_THROW(PlanningException("missing dependency: no format for " + step.text()));
		    addEdge(prev->seq, seq);
		} break;

		case MOUNT: {
		    const string& id = step.filesystem->id;

		    const Step* format = findStep(FORMAT, id);
		    if (!format)
			DP_THROW(PlanningException("missing dependency: no format for " + step.text()));
		    addEdge(format->seq, seq);

		    const Step* label = findStep(LABEL, id);
		    if (label)
			addEdge(label->seq, seq);

		    const Step* uuid = findStep(ASSIGN_UUID, id);
		    if (uuid)
			addEdge(uuid->seq, seq);

		    if (!step.mount->isSwap())
		    {
			const Mount* parent = findParentMount(*step.mount);
			if (parent)
			{
			    const Step* tmp = findStep(MOUNT, mountTarget(*parent));
			    if (!tmp)
				DP_THROW(PlanningException("missing dependency: no mount of " + parent->path +
							   " for " + step.text()));
			    addEdge(tmp->seq, seq);
			}
		    }
		} break;
	    }
	}
    }


    vector<unsigned>
    StepPlanner::sortSteps() const
    {
	// order of ready steps: disk index, kind, creation order
	struct Less
	{
	    Less(const vector<Step>& steps) : steps(steps) {}

	    bool operator()(unsigned a, unsigned b) const
	    {
		const Step& sa = steps[a];
		const Step& sb = steps[b];

		int da = sa.disk_index < 0 ? INT_MAX : sa.disk_index;
		int db = sb.disk_index < 0 ? INT_MAX : sb.disk_index;

		if (da != db)
		    return da < db;
		if (sa.kind != sb.kind)
		    return sa.kind < sb.kind;
		return sa.seq < sb.seq;
	    }

	    const vector<Step>& steps;
	};

	vector<unsigned> in_degree(steps.size(), 0);
	for (vector<set<unsigned>>::const_iterator it = edges.begin(); it != edges.end(); ++it)
	    for (set<unsigned>::const_iterator to = it->begin(); to != it->end(); ++to)
		++in_degree[*to];

	const Less less(steps);
	set<unsigned, Less> ready(less);
	for (unsigned seq = 0; seq < steps.size(); ++seq)
	    if (in_degree[seq] == 0)
		ready.insert(seq);

	vector<unsigned> order;

	while (!ready.empty())
	{
	    unsigned seq = *ready.begin();
	    ready.erase(ready.begin());

	    order.push_back(seq);

	    for (set<unsigned>::const_iterator to = edges[seq].begin(); to != edges[seq].end(); ++to)
		if (--in_degree[*to] == 0)
		    ready.insert(*to);
	}

	if (order.size() != steps.size())
	{
	    list<string> blocked;
	    for (unsigned seq = 0; seq < steps.size(); ++seq)
		if (in_degree[seq] != 0)
		    blocked.push_back(steps[seq].text());

	    DP_THROW(PlanningException("cycle between steps " + boost::join(blocked, ", ")));
	}

	return order;
    }


    Plan
    StepPlanner::plan()
    {
	steps.clear();
	edges.clear();

	createSteps();
	createEdges();

	const vector<unsigned> order = sortSteps();

	vector<unsigned> ids(steps.size(), 0);
	for (unsigned pos = 0; pos < order.size(); ++pos)
	    ids[order[pos]] = pos + 1;

	vector<Step> ret;
	for (vector<unsigned>::const_iterator seq = order.begin(); seq != order.end(); ++seq)
	{
	    Step step = steps[*seq];
	    step.id = ids[*seq];

	    for (unsigned from = 0; from < edges.size(); ++from)
		if (edges[from].count(*seq))
		    step.depends.push_back(ids[from]);

	    sort(step.depends.begin(), step.depends.end());

	    ret.push_back(step);
	}

	Plan plan(ret);

	y2mil("plan with " << plan.numSteps() << " steps");
	for (vector<Step>::const_iterator it = plan.getSteps().begin(); it != plan.getSteps().end(); ++it)
	    y2mil(*it);

	return plan;
    }

}
