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


#include <iomanip>
#include <sstream>
#include <algorithm>

#include "diskprov/Step.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    Step::Step(unsigned seq, StepKind kind, const string& target)
	: id(0), seq(seq), kind(kind), target(target), disk_index(-1), disk(NULL),
	  filesystem(NULL), mount(NULL)
    {
    }


    string
    Step::text() const
    {
	return toString(kind) + "(" + target + ")";
    }


    std::ostream&
    operator<<(std::ostream& s, const Step& step)
    {
	s << "id:" << step.id << " " << step.text() << " disks:" << step.disks;
	if (!step.depends.empty())
	    s << " depends:" << step.depends;
	if (step.isDestructive())
	    s << " destructive";
	return s;
    }


    set<unsigned>
    Plan::allDependentsOf(unsigned id) const
    {
	set<unsigned> ret;

	// dependencies always point backwards so one pass suffices
	for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	{
	    for (vector<unsigned>::const_iterator dep = it->depends.begin(); dep != it->depends.end(); ++dep)
	    {
		if (*dep == id || ret.count(*dep))
		{
		    ret.insert(it->id);
		    break;
		}
	    }
	}

	return ret;
    }


    std::ostream&
    operator<<(std::ostream& s, const Plan& plan)
    {
	const vector<Step>& steps = plan.getSteps();

	for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	{
	    ostringstream depends;
	    classic(depends);
	    for (vector<unsigned>::const_iterator dep = it->depends.begin(); dep != it->depends.end(); ++dep)
		depends << (dep == it->depends.begin() ? "" : ",") << *dep;

	    s << setw(3) << it->id << "  " << left << setw(12) << toString(it->kind)
	      << setw(24) << it->target << setw(12) << (depends.str().empty() ? "-" : depends.str())
	      << (it->isDestructive() ? "destructive" : "") << right << endl;
	}

	return s;
    }

}
