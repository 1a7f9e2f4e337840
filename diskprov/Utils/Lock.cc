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


#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "diskprov/Utils/Lock.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Exception.h"


namespace diskprov
{

    Lock::Lock(bool disable, const std::string& filename)
	: disabled(disable || getenv("DISKPROV_NO_LOCKING") != NULL),
	  fd(-1)
    {
	if (disabled)
	    return;

	y2mil("getting lock " << filename);

	string::size_type pos = filename.rfind('/');
	string dir = pos == string::npos ? string() : filename.substr(0, pos);
	if (!dir.empty() && !createPath(dir))
	{
	    // Not fatal, the directory should already exist.
	    y2deb("creating directory for lock-file failed: " << strerror(errno));
	}

	fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC,
		  S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
	if (fd < 0)
	{
	    y2err("opening lock-file failed: " << strerror(errno));
	    DP_THROW(LockException(0));
	}

	struct flock lock;
	memset(&lock, 0, sizeof(lock));
	lock.l_whence = SEEK_SET;
	lock.l_type = F_WRLCK;
	if (fcntl(fd, F_SETLK, &lock) < 0)
	{
	    int err = errno;
	    switch (err)
	    {
		case EACCES:
		case EAGAIN:
		    // Another process has a lock. Between the two fcntl
		    // calls the lock of the other process could be
		    // released. In that case we don't get the pid.
		    if (fcntl(fd, F_GETLK, &lock) < 0 || lock.l_type == F_UNLCK)
			lock.l_pid = 0;
		    close(fd);
		    y2err("locked by process " << lock.l_pid);
		    DP_THROW(LockException(lock.l_pid));

		default:
		    close(fd);
		    y2err("getting lock failed: " << strerror(err));
		    DP_THROW(LockException(0));
	    }
	}

	y2mil("lock succeeded");
    }


    Lock::~Lock() noexcept
    {
	if (disabled)
	    return;

	y2mil("releasing lock");
	close(fd);

	// Do not bother deleting lock-file. Likelihood of race conditions is
	// to high.
    }

}
