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


#include <algorithm>

#include "diskprov/Environment.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/AsciiFile.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    Environment::Environment()
	: workers(0), max_workers(8), retries(1), retry_backoff_ms(1000),
	  stop_on_any_failure(true), destructive_timeout(300), timeout(60), lock(true),
	  lock_file(LOCKFILE), log_level("info")
    {
    }


    void
    Environment::readSysconfig(const string& filename)
    {
	if (!checkNormalFile(filename))
	{
	    y2mil("no sysconfig file " << filename);
	    return;
	}

	SysconfigFile sysconfig(filename);

	static const char* keys[] = { "WORKERS", "MAX_WORKERS", "RETRIES", "RETRY_BACKOFF_MS",
				      "STOP_ON_ANY_FAILURE", "DESTRUCTIVE_TIMEOUT", "TIMEOUT",
				      "LOCK", "LOCK_FILE", "LOG_LEVEL" };

	const map<string, string>& values = sysconfig.getAllValues();
	for (map<string, string>::const_iterator it = values.begin(); it != values.end(); ++it)
	{
	    if (find(keys, keys + lengthof(keys), it->first) == keys + lengthof(keys))
		y2war("unknown key " << it->first << " in " << filename);
	}

	sysconfig.getValue("WORKERS", workers);
	sysconfig.getValue("MAX_WORKERS", max_workers);
	sysconfig.getValue("RETRIES", retries);
	sysconfig.getValue("RETRY_BACKOFF_MS", retry_backoff_ms);
	sysconfig.getValue("STOP_ON_ANY_FAILURE", stop_on_any_failure);
	sysconfig.getValue("DESTRUCTIVE_TIMEOUT", destructive_timeout);
	sysconfig.getValue("TIMEOUT", timeout);
	sysconfig.getValue("LOCK", lock);
	sysconfig.getValue("LOCK_FILE", lock_file);
	sysconfig.getValue("LOG_LEVEL", log_level);

	y2mil("environment " << *this);
    }


    unsigned
    Environment::numWorkers(unsigned num_disks) const
    {
	unsigned ret = workers > 0 ? workers : num_disks;
	if (max_workers > 0)
	    ret = min(ret, max_workers);
	return max(ret, 1U);
    }


    std::ostream&
    operator<<(std::ostream& s, const Environment& env)
    {
	s << "workers:" << env.workers << " max-workers:" << env.max_workers
	  << " retries:" << env.retries << " retry-backoff:" << env.retry_backoff_ms << "ms";
	if (env.stop_on_any_failure)
	    s << " stop-on-any-failure";
	s << " destructive-timeout:" << env.destructive_timeout << "s timeout:" << env.timeout << "s";
	if (!env.lock)
	    s << " no-lock";
	return s << " lock-file:" << env.lock_file << " log-level:" << env.log_level;
    }

}
