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


#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H


#include <string>
#include <ostream>

#include "diskprov/DiskprovDefines.h"


namespace diskprov
{
    using std::string;


    /**
     * Settings of a run. The defaults can be changed in the sysconfig
     * file and the command line overrides both.
     */
    struct Environment
    {
	Environment();

	// number of worker threads, 0 means one per disk
	unsigned workers;
	unsigned max_workers;

	// retries of non-destructive steps
	unsigned retries;
	unsigned retry_backoff_ms;

	// halt the whole run on the first failure
	bool stop_on_any_failure;

	// timeouts of commands in seconds
	unsigned destructive_timeout;
	unsigned timeout;

	// take the global lock
	bool lock;

	string lock_file;
	string log_level;

	/**
	 * Reads the settings present in the file. A missing file is not an
	 * error.
	 */
	void readSysconfig(const string& filename = SYSCONFIGFILE);

	/**
	 * Number of workers for a plan touching the given number of disks.
	 */
	unsigned numWorkers(unsigned num_disks) const;

	friend std::ostream& operator<<(std::ostream& s, const Environment& env);
    };

}


#endif
