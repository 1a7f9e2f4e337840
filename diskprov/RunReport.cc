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
#include <boost/algorithm/string.hpp>

#include "diskprov/RunReport.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/XmlFile.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    StepResult::StepResult(const Step& step)
	: id(step.id), kind(step.kind), text(step.text()), disks(step.disks),
	  destructive(step.isDestructive()), status(STEP_PENDING), error(ERR_NONE),
	  skip_reason(SKIP_NONE), attempts(0), retries(0), duration_ms(0)
    {
    }


    std::ostream&
    operator<<(std::ostream& s, const StepResult& result)
    {
	s << "id:" << result.id << " " << result.text << " status:" << toString(result.status);
	if (result.status == STEP_FAILED)
	    s << " error:" << toString(result.error) << " detail:" << result.detail;
	if (result.status == STEP_SKIPPED)
	    s << " reason:" << toString(result.skip_reason);
	if (result.retries > 0)
	    s << " retries:" << result.retries;
	return s << " duration:" << result.duration_ms << "ms";
    }


    RunReport::RunReport()
	: state(IDLE), error(ERR_NONE), elapsed_ms(0)
    {
    }


    void
    RunReport::setError(ErrorKind kind, const string& detail)
    {
	error = kind;
	error_detail = detail;
    }


    const StepResult*
    RunReport::getResult(unsigned id) const
    {
	for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	    if (it->id == id)
		return &*it;
	return NULL;
    }


    unsigned
    RunReport::count(StepStatus status) const
    {
	unsigned ret = 0;
	for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	    if (it->status == status)
		++ret;
	return ret;
    }


    vector<const StepResult*>
    RunReport::firstFailures() const
    {
	vector<const StepResult*> ret;
	set<string> seen;

	for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	{
	    if (it->status != STEP_FAILED)
		continue;

	    bool first = false;
	    for (set<string>::const_iterator disk = it->disks.begin(); disk != it->disks.end(); ++disk)
		if (seen.insert(*disk).second)
		    first = true;

	    if (first)
		ret.push_back(&*it);
	}

	return ret;
    }


    bool
    RunReport::save(const string& filename) const
    {
	y2mil("saving report to " << filename);

	XmlFile xml;
	xmlNode* node = xmlNewNode("report");
	xml.setRootElement(node);

	setChildValue(node, "state", toString(state));
	setChildValueIf(node, "error", toString(error), error != ERR_NONE);
	setChildValueIf(node, "error-detail", error_detail, !error_detail.empty());
	setChildValue(node, "elapsed-ms", elapsed_ms);
	setChildValue(node, "hostname", hostname());
	setChildValue(node, "datetime", datetime());

	for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	{
	    xmlNode* tmp = xmlNewChild(node, "step");

	    setChildValue(tmp, "id", it->id);
	    setChildValue(tmp, "kind", toString(it->kind));
	    setChildValue(tmp, "text", it->text);
	    for (set<string>::const_iterator disk = it->disks.begin(); disk != it->disks.end(); ++disk)
		setChildValue(tmp, "disk", *disk);
	    setChildValue(tmp, "destructive", it->destructive);
	    setChildValue(tmp, "status", toString(it->status));
	    setChildValueIf(tmp, "error", toString(it->error), it->status == STEP_FAILED);
	    setChildValueIf(tmp, "detail", it->detail, !it->detail.empty());
	    setChildValueIf(tmp, "skip-reason", toString(it->skip_reason), it->status == STEP_SKIPPED);
	    setChildValue(tmp, "attempts", it->attempts);
	    setChildValue(tmp, "retries", it->retries);
	    setChildValue(tmp, "duration-ms", it->duration_ms);
	}

	return xml.save(filename);
    }


    std::ostream&
    operator<<(std::ostream& s, const RunReport& report)
    {
	const vector<StepResult>& results = report.getResults();

	if (!results.empty())
	{
	    s << right << setw(3) << "id" << "  " << left << setw(34) << "step" << setw(11) << "status"
	      << setw(9) << "retries" << setw(10) << "duration" << "detail" << endl;

	    for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	    {
		string detail;
		if (it->status == STEP_FAILED)
		    detail = toString(it->error) + ": " + it->detail;
		else if (it->status == STEP_SKIPPED)
		    detail = toString(it->skip_reason);

		s << right << setw(3) << it->id << "  " << left << setw(34) << it->text
		  << setw(11) << toString(it->status) << setw(9) << it->retries
		  << setw(10) << (decString(it->duration_ms) + " ms") << detail << endl;
	    }

	    s << right << endl;
	}

	s << "state: " << toString(report.getState()) << ", " << report.count(STEP_SUCCEEDED)
	  << " succeeded, " << report.count(STEP_FAILED) << " failed, " << report.count(STEP_SKIPPED)
	  << " skipped, elapsed " << report.getElapsedMs() << " ms" << endl;

	if (report.getError() != ERR_NONE)
	    s << "error: " << toString(report.getError()) << ": " << report.getErrorDetail() << endl;

	const vector<const StepResult*> failures = report.firstFailures();
	for (vector<const StepResult*>::const_iterator it = failures.begin(); it != failures.end(); ++it)
	{
	    s << "FAILED: step " << (*it)->id << " " << (*it)->text << " on "
	      << boost::join((*it)->disks, " ") << ": " << toString((*it)->error) << ": "
	      << (*it)->detail << endl;
	}

	if (report.getState() == HALTED && report.count(STEP_SUCCEEDED) > 0)
	{
	    s << "HALTED: completed steps were not rolled back, the disks may be partially provisioned"
	      << endl;
	}

	return s;
    }

}
