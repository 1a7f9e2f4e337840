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


#include <sstream>

#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{

    std::ostream&
    operator<<(std::ostream& str, const CodeLocation& obj)
    {
	return str << obj._file << "(" << obj._func << "):" << obj._line;
    }


    Exception::Exception()
    {
    }


    Exception::Exception(const string& msg)
	: _msg(msg)
    {
    }


    Exception::~Exception() noexcept
    {
    }


    std::ostream&
    Exception::dumpOn(std::ostream& str) const
    {
	return str << _msg;
    }


    std::ostream&
    operator<<(std::ostream& str, const Exception& obj)
    {
	return obj.dumpOn(str);
    }


    void
    Exception::log(const Exception& exception, const CodeLocation& where,
		   const char* const prefix)
    {
	y2war(where << " " << prefix << " " << toString(exception.errorKind()) << ": "
	      << exception);
    }


    ParseException::ParseException(const string& msg, const string& seen,
				   const string& expected)
	: Exception(msg + ": seen '" + seen + "'" +
		    (expected.empty() ? string() : ", expected '" + expected + "'")),
	  _seen(seen), _expected(expected)
    {
    }


    LockException::LockException(pid_t locker_pid)
	: Exception(locker_pid > 0 ? "locked by process " + decString(locker_pid) :
		    "locked by another process"),
	  locker_pid(locker_pid)
    {
    }


    SystemCmdException::SystemCmdException(const string& cmd, const string& msg,
					   const vector<string>& stderr_lines)
	: Exception(msg), _cmd(cmd), _stderr(stderr_lines)
    {
    }


    std::ostream&
    SystemCmdException::dumpOn(std::ostream& str) const
    {
	str << msg() << " [" << _cmd << "]";
	if (!_stderr.empty())
	    str << " stderr:" << _stderr;
	return str;
    }


    CommandTimeoutException::CommandTimeoutException(const string& cmd, unsigned timeout,
						     const vector<string>& stderr_lines)
	: SystemCmdException(cmd, "command timed out after " + decString(timeout) + " s",
			     stderr_lines)
    {
    }


    CommandNonZeroExitException::CommandNonZeroExitException(const string& cmd, int exit_code,
							     const vector<string>& stderr_lines)
	: SystemCmdException(cmd, "command failed with exit code " + decString(exit_code),
			     stderr_lines),
	  _exit_code(exit_code)
    {
    }

}
