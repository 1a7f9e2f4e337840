/*
 * Copyright (c) [2015] SUSE LLC
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
 * with this program; if not, contact Novell, Inc.
 *
 * To contact Novell about this file by physical or electronic mail, you may
 * find current contact information at www.novell.com.
 */


#ifndef LOCK_H
#define LOCK_H


#include <string>
#include <boost/noncopyable.hpp>

#include "diskprov/DiskprovDefines.h"


namespace diskprov
{

    /**
     * Implement a global lock so that two provisioning runs never work on
     * the disks at the same time. Throws LockException if another process
     * holds the lock. Setting DISKPROV_NO_LOCKING in the environment
     * disables locking.
     */
    class Lock : boost::noncopyable
    {

    public:

	Lock(bool disable = false, const std::string& filename = LOCKFILE);
	~Lock() noexcept;

    private:

	const bool disabled;
	int fd;

    };
}


#endif
