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


#ifndef STEP_EXECUTOR_H
#define STEP_EXECUTOR_H


#include <string>
#include <vector>
#include <set>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <boost/noncopyable.hpp>

#include "diskprov/Step.h"
#include "diskprov/RunReport.h"
#include "diskprov/Actions.h"
#include "diskprov/Environment.h"


namespace diskprov
{

    /**
     * Executes the steps of a plan on a pool of worker threads.
     *
     * A step is started once all steps it depends on have succeeded and
     * no other step working on one of its disks is running. Steps whose
     * dependencies failed or were skipped are never run but reported as
     * skipped.
     *
     * Destructive steps are never retried. Non-destructive steps are
     * retried on command failures and timeouts. After a failure either
     * the whole run stops or, with stop_on_any_failure disabled, only the
     * dependents of the failed step and, for a destructive step, the
     * remaining steps on its disks are skipped. Nothing is rolled back.
     */
    class StepExecutor : boost::noncopyable
    {
    public:

	StepExecutor(CommandRunner& runner, const Environment& env);

	/**
	 * Executes the plan and returns the results in plan order. Once
	 * the cancel flag is set no further step is started.
	 */
	vector<StepResult> execute(const Plan& plan, const std::atomic<bool>* cancel = nullptr);

    private:

	void worker();

	// all following functions must be called with the mutex held

	bool cancelled() const { return cancel && cancel->load(); }

	const Step* nextStep();
	bool isReady(const Step& step) const;

	void finishStep(const Step& step, const StepResult& result);
	void skipStep(unsigned id, SkipReason reason);
	void skipDependents(unsigned id);
	void skipRemaining(SkipReason reason);

	unsigned numUnstarted() const;

	// called without the mutex held
	void runStep(const Step& step, StepResult& result);

	/**
	 * Sleeps for the retry backoff. Returns false if the run was
	 * cancelled meanwhile.
	 */
	bool waitForRetry() const;

	Actions actions;
	const Environment& env;

	const Plan* plan;
	const std::atomic<bool>* cancel;

	std::mutex mutex;
	std::condition_variable cv;

	vector<StepResult> results;
	vector<bool> started;
	set<string> busy_disks;
	unsigned running;
	bool halted;

    };

}


#endif
