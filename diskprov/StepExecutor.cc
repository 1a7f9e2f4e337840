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


#include <thread>
#include <chrono>
#include <sstream>
#include <algorithm>

#include "diskprov/StepExecutor.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    StepExecutor::StepExecutor(CommandRunner& runner, const Environment& env)
	: actions(runner), env(env), plan(nullptr), cancel(nullptr), running(0), halted(false)
    {
    }


    vector<StepResult>
    StepExecutor::execute(const Plan& plan, const std::atomic<bool>* cancel)
    {
	this->plan = &plan;
	this->cancel = cancel;

	results.clear();
	started.assign(plan.numSteps(), false);
	busy_disks.clear();
	running = 0;
	halted = false;

	set<string> disks;
	const vector<Step>& steps = plan.getSteps();
	for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	{
	    results.push_back(StepResult(*it));
	    disks.insert(it->disks.begin(), it->disks.end());
	}

	if (steps.empty())
	    return results;

	const unsigned num_workers = min(env.numWorkers(disks.size()), plan.numSteps());

	y2mil("executing " << plan.numSteps() << " steps on " << disks.size() << " disks with "
	      << num_workers << " workers");

	vector<thread> threads;
	for (unsigned i = 0; i < num_workers; ++i)
	    threads.push_back(thread([this]() { worker(); }));

	for (vector<thread>::iterator it = threads.begin(); it != threads.end(); ++it)
	    it->join();

	for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	    y2mil("result " << *it);

	return results;
    }


    void
    StepExecutor::worker()
    {
	unique_lock<std::mutex> lock(mutex);

	while (true)
	{
	    if (cancelled() && numUnstarted() > 0)
	    {
		y2war("run cancelled, skipping remaining steps");
		skipRemaining(SKIP_CANCELLED);
		cv.notify_all();
	    }

	    if (numUnstarted() == 0)
		break;

	    const Step* step = nextStep();

	    if (!step)
	    {
		if (running == 0)
		{
		    // unreachable for a plan in topological order
		    y2err("no step can be started, skipping remaining steps");
		    skipRemaining(SKIP_DEPENDENCY_FAILED);
		    cv.notify_all();
		    break;
		}

		// wake up periodically to notice cancellation
		cv.wait_for(lock, chrono::milliseconds(100));
		continue;
	    }

	    started[step->id - 1] = true;
	    busy_disks.insert(step->disks.begin(), step->disks.end());
	    ++running;

	    StepResult result = results[step->id - 1];

	    lock.unlock();
	    runStep(*step, result);
	    lock.lock();

	    --running;
	    for (set<string>::const_iterator it = step->disks.begin(); it != step->disks.end(); ++it)
		busy_disks.erase(*it);

	    finishStep(*step, result);

	    cv.notify_all();
	}
    }


    const Step*
    StepExecutor::nextStep()
    {
	if (halted)
	    return nullptr;

	const vector<Step>& steps = plan->getSteps();
	for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	{
	    if (!started[it->id - 1] && isReady(*it))
		return &*it;
	}

	return nullptr;
    }


    bool
    StepExecutor::isReady(const Step& step) const
    {
	for (vector<unsigned>::const_iterator it = step.depends.begin(); it != step.depends.end(); ++it)
	    if (results[*it - 1].status != STEP_SUCCEEDED)
		return false;

	for (set<string>::const_iterator it = step.disks.begin(); it != step.disks.end(); ++it)
	    if (busy_disks.count(*it) > 0)
		return false;

	return true;
    }


    bool
    StepExecutor::waitForRetry() const
    {
	const chrono::steady_clock::time_point deadline = chrono::steady_clock::now() +
	    chrono::milliseconds(env.retry_backoff_ms);

	while (chrono::steady_clock::now() < deadline)
	{
	    if (cancelled())
		return false;

	    chrono::steady_clock::duration left = deadline - chrono::steady_clock::now();
	    this_thread::sleep_for(min<chrono::steady_clock::duration>(left, chrono::milliseconds(50)));
	}

	return !cancelled();
    }


    void
    StepExecutor::runStep(const Step& step, StepResult& result)
    {
	y2mil("starting step " << step);

	const chrono::steady_clock::time_point start = chrono::steady_clock::now();

	while (true)
	{
	    ++result.attempts;

	    try
	    {
		actions.runStep(step);
		result.status = STEP_SUCCEEDED;
		break;
	    }
	    catch (const Exception& e)
	    {
		DP_CAUGHT(e);

		const ErrorKind kind = e.errorKind();

		const bool retryable = !step.isDestructive() && result.retries < env.retries &&
		    (kind == ERR_COMMAND_TIMEOUT || kind == ERR_COMMAND_NON_ZERO_EXIT) &&
		    !cancelled();

		if (retryable)
		{
		    y2war("step " << step.text() << " failed, retry " << result.retries + 1 << " of "
			  << env.retries << " in " << env.retry_backoff_ms << " ms");

		    if (waitForRetry())
		    {
			++result.retries;
			continue;
		    }

		    y2war("step " << step.text() << " cancelled while waiting for retry");

		    result.status = STEP_FAILED;
		    result.error = ERR_CANCELLED;
		    result.detail = "cancelled while waiting for retry";
		    break;
		}

		ostringstream detail;
		classic(detail);
		detail << e;

		result.status = STEP_FAILED;
		result.error = kind;
		result.detail = detail.str();
		break;
	    }
	    catch (const std::exception& e)
	    {
		y2err("step " << step.text() << " failed with unexpected exception: " << e.what());

		result.status = STEP_FAILED;
		result.error = ERR_INTERNAL;
		result.detail = e.what();
		break;
	    }
	}

	result.duration_ms = chrono::duration_cast<chrono::milliseconds>(
	    chrono::steady_clock::now() - start).count();

	y2mil("finished step " << result);
    }


    void
    StepExecutor::finishStep(const Step& step, const StepResult& result)
    {
	results[step.id - 1] = result;

	if (result.status != STEP_FAILED)
	    return;

	y2err("step " << step.text() << " failed: " << toString(result.error) << ": "
	      << result.detail);

	skipDependents(step.id);

	if (env.stop_on_any_failure)
	{
	    y2err("halting run after failure of step " << step.id << ", no rollback is attempted");
	    halted = true;
	    skipRemaining(SKIP_RUN_HALTED);
	    return;
	}

	if (step.isDestructive())
	{
	    y2err("halting disks " << step.disks << " after failure of destructive step "
		  << step.id << ", no rollback is attempted");

	    const vector<Step>& steps = plan->getSteps();
	    for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	    {
		if (started[it->id - 1])
		    continue;

		for (set<string>::const_iterator disk = it->disks.begin(); disk != it->disks.end(); ++disk)
		{
		    if (step.touchesDisk(*disk))
		    {
			skipStep(it->id, SKIP_DISK_HALTED);
			skipDependents(it->id);
			break;
		    }
		}
	    }
	}
    }


    void
    StepExecutor::skipStep(unsigned id, SkipReason reason)
    {
	if (started[id - 1])
	    return;

	started[id - 1] = true;

	StepResult& result = results[id - 1];
	result.status = STEP_SKIPPED;
	result.skip_reason = reason;

	y2mil("skipping step " << id << " " << result.text << ": " << toString(reason));
    }


    void
    StepExecutor::skipDependents(unsigned id)
    {
	const set<unsigned> dependents = plan->allDependentsOf(id);
	for (set<unsigned>::const_iterator it = dependents.begin(); it != dependents.end(); ++it)
	    skipStep(*it, SKIP_DEPENDENCY_FAILED);
    }


    void
    StepExecutor::skipRemaining(SkipReason reason)
    {
	for (unsigned id = 1; id <= started.size(); ++id)
	    skipStep(id, reason);
    }


    unsigned
    StepExecutor::numUnstarted() const
    {
	return count(started.begin(), started.end(), false);
    }

}
