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


#ifndef RUN_REPORT_H
#define RUN_REPORT_H


#include <string>
#include <vector>
#include <set>
#include <ostream>

#include "diskprov/DiskprovTypes.h"
#include "diskprov/Step.h"


namespace diskprov
{
    using std::string;
    using std::vector;
    using std::set;


    /**
     * Outcome of one step.
     */
    struct StepResult
    {
	StepResult(const Step& step);

	unsigned id;
	StepKind kind;
	string text;
	set<string> disks;
	bool destructive;

	StepStatus status;

	// set for failed steps
	ErrorKind error;
	string detail;

	// set for skipped steps
	SkipReason skip_reason;

	unsigned attempts;
	unsigned retries;
	unsigned long duration_ms;

	friend std::ostream& operator<<(std::ostream& s, const StepResult& result);
    };


    /**
     * Outcome of a run: the state, the error that stopped the run before
     * execution (if any) and the results of all steps.
     */
    class RunReport
    {
    public:

	RunReport();

	RunState getState() const { return state; }
	void setState(RunState value) { state = value; }

	/**
	 * Error of validation, planning or locking. Errors of steps are
	 * kept in the step results.
	 */
	ErrorKind getError() const { return error; }
	const string& getErrorDetail() const { return error_detail; }
	void setError(ErrorKind kind, const string& detail);

	unsigned long getElapsedMs() const { return elapsed_ms; }
	void setElapsedMs(unsigned long value) { elapsed_ms = value; }

	const vector<StepResult>& getResults() const { return results; }
	void setResults(const vector<StepResult>& value) { results = value; }

	const StepResult* getResult(unsigned id) const;

	unsigned count(StepStatus status) const;

	/**
	 * The first failed step of every disk affected by a failure, in
	 * plan order.
	 */
	vector<const StepResult*> firstFailures() const;

	/**
	 * Saves the report as XML.
	 */
	bool save(const string& filename) const;

	/**
	 * Prints the report as a table.
	 */
	friend std::ostream& operator<<(std::ostream& s, const RunReport& report);

    private:

	RunState state;
	ErrorKind error;
	string error_detail;
	unsigned long elapsed_ms;

	vector<StepResult> results;

    };

}


#endif
