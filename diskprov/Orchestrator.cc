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


#include <chrono>
#include <sstream>

#include "diskprov/Orchestrator.h"
#include "diskprov/StepPlanner.h"
#include "diskprov/StepExecutor.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/Lock.h"


namespace diskprov
{
    using namespace std;


    Orchestrator::Orchestrator(CommandRunner& runner, const Environment& env)
	: runner(runner), env(env), cancelled(false), state(IDLE)
    {
	y2mil("constructed Orchestrator with " << env);

	runner.setAbortFlag(&cancelled);
    }


    Orchestrator::~Orchestrator()
    {
	runner.setAbortFlag(nullptr);
    }


    void
    Orchestrator::setState(RunState value)
    {
	y2mil("state " << toString(state.load()) << " -> " << toString(value));
	state = value;
    }


    Plan
    Orchestrator::plan(const Layout& layout) const
    {
	layout.validate();

	StepPlanner planner(layout);
	return planner.plan();
    }


    RunReport
    Orchestrator::run(const Layout& layout)
    {
	const chrono::steady_clock::time_point start = chrono::steady_clock::now();

	RunReport report;

	try
	{
	    Lock lock(!env.lock, env.lock_file);

	    setState(VALIDATING);
	    layout.validate();

	    setState(PLANNING);
	    StepPlanner planner(layout);
	    const Plan plan = planner.plan();
	    y2mil("plan:" << endl << plan);

	    if (cancelled)
		DP_THROW(Exception("run cancelled before execution"));

	    setState(EXECUTING);
	    StepExecutor executor(runner, env);
	    report.setResults(executor.execute(plan, &cancelled));

	    if (cancelled)
		report.setError(ERR_CANCELLED, "run cancelled");

	    if (report.count(STEP_FAILED) == 0 && report.count(STEP_SKIPPED) == 0)
		setState(COMPLETED);
	    else
		setState(HALTED);
	}
	catch (const Exception& e)
	{
	    DP_CAUGHT(e);

	    report.setError(cancelled ? ERR_CANCELLED : e.errorKind(), e.msg());
	    setState(HALTED);
	}

	report.setState(state);
	report.setElapsedMs(chrono::duration_cast<chrono::milliseconds>(
				chrono::steady_clock::now() - start).count());

	ostringstream tmp;
	classic(tmp);
	tmp << report;

	if (state == HALTED)
	    y2err("run halted" << endl << tmp.str());
	else
	    y2mil("run completed" << endl << tmp.str());

	return report;
    }

}
