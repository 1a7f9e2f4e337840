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


#ifndef ORCHESTRATOR_H
#define ORCHESTRATOR_H


#include <atomic>
#include <boost/noncopyable.hpp>

#include "diskprov/Layout.h"
#include "diskprov/Step.h"
#include "diskprov/RunReport.h"
#include "diskprov/CommandRunner.h"
#include "diskprov/Environment.h"


namespace diskprov
{

    /**
     * Validates a layout, plans the steps and executes them. The state
     * goes from Idle through Validating, Planning and Executing to
     * Completed or Halted. Validation and planning errors halt the run
     * before any command is executed.
     */
    class Orchestrator : boost::noncopyable
    {
    public:

	Orchestrator(CommandRunner& runner, const Environment& env);
	~Orchestrator();

	/**
	 * Provisions the disks of the layout. Errors are reported in the
	 * run report, never thrown. The layout must stay unchanged during
	 * the run.
	 */
	RunReport run(const Layout& layout);

	/**
	 * Validates the layout and returns the plan without executing
	 * anything. Throws on invalid layouts and planning errors.
	 */
	Plan plan(const Layout& layout) const;

	/**
	 * Requests cancellation of the current run. Safe to call from
	 * another thread or a signal handler.
	 */
	void cancel() { cancelled = true; }

	RunState getState() const { return state; }

    private:

	void setState(RunState value);

	CommandRunner& runner;
	const Environment& env;

	std::atomic<bool> cancelled;
	std::atomic<RunState> state;

    };

}


#endif
