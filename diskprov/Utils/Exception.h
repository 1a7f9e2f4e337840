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


#ifndef EXCEPTION_H
#define EXCEPTION_H


#include <stdexcept>
#include <string>
#include <vector>
#include <ostream>
#include <sys/types.h>

#include "diskprov/DiskprovTypes.h"
#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{
    using std::string;
    using std::vector;


    /**
     * Location of an exception in the source code.
     */
    class CodeLocation
    {
    public:

	CodeLocation()
	    : _line(0) {}

	CodeLocation(const string& file, const string& func, int line)
	    : _file(file), _func(func), _line(line) {}

	friend std::ostream& operator<<(std::ostream& str, const CodeLocation& obj);

    private:

	string _file;
	string _func;
	int _line;

    };


#define DP_EXCEPTION_CODE_LOCATION diskprov::CodeLocation(__FILE__, __FUNCTION__, __LINE__)


    /**
     * Base class for all exceptions. Use DP_THROW to throw an exception so
     * that the code location is recorded and the exception is logged.
     */
    class Exception : public std::exception
    {
    public:

	Exception();
	Exception(const string& msg);
	virtual ~Exception() noexcept;

	const CodeLocation& where() const { return _where; }
	void relocate(const CodeLocation& where) const { _where = where; }

	const string& msg() const { return _msg; }

	virtual const char* what() const noexcept { return _msg.c_str(); }

	/**
	 * The error kind recorded in the run report.
	 */
	virtual ErrorKind errorKind() const { return ERR_INTERNAL; }

	static void log(const Exception& exception, const CodeLocation& where,
			const char* const prefix);

	friend std::ostream& operator<<(std::ostream& str, const Exception& obj);

    protected:

	virtual std::ostream& dumpOn(std::ostream& str) const;

    private:

	mutable CodeLocation _where;
	string _msg;

    };


    /**
     * The layout violates one of its invariants.
     */
    class InvalidLayoutException : public Exception
    {
    public:

	InvalidLayoutException(const string& reason)
	    : Exception("invalid layout: " + reason) {}

	virtual ErrorKind errorKind() const { return ERR_INVALID_LAYOUT; }

    };


    /**
     * Input (layout file, command output) could not be parsed.
     */
    class ParseException : public Exception
    {
    public:

	ParseException(const string& msg, const string& seen, const string& expected);

	const string& seen() const { return _seen; }
	const string& expected() const { return _expected; }

	virtual ErrorKind errorKind() const { return ERR_PARSE; }

    private:

	string _seen;
	string _expected;

    };


    class PlanningException : public Exception
    {
    public:

	PlanningException(const string& msg)
	    : Exception("planning error: " + msg) {}

	virtual ErrorKind errorKind() const { return ERR_PLANNING; }

    };


    /**
     * A requested operation is not available for the filesystem kind,
     * e.g. assigning a UUID to a FAT filesystem.
     */
    class UnsupportedOperationException : public Exception
    {
    public:

	UnsupportedOperationException(const string& msg)
	    : Exception("unsupported operation: " + msg) {}

	virtual ErrorKind errorKind() const { return ERR_UNSUPPORTED_OPERATION; }

    };


    class DeviceBusyException : public Exception
    {
    public:

	DeviceBusyException(const string& device, const string& user)
	    : Exception(device + " is in use by " + user) {}

	virtual ErrorKind errorKind() const { return ERR_DEVICE_BUSY; }

    };


    class LockException : public Exception
    {
    public:

	LockException(pid_t locker_pid);

	pid_t getLockerPid() const { return locker_pid; }

	virtual ErrorKind errorKind() const { return ERR_LOCKED; }

    private:

	pid_t locker_pid;

    };


    /**
     * Base class for failures of external commands. Keeps the command line
     * and the captured stderr for the run report.
     */
    class SystemCmdException : public Exception
    {
    public:

	SystemCmdException(const string& cmd, const string& msg,
			   const vector<string>& stderr_lines = vector<string>());

	const string& cmd() const { return _cmd; }
	const vector<string>& getStderr() const { return _stderr; }

    protected:

	virtual std::ostream& dumpOn(std::ostream& str) const;

    private:

	string _cmd;
	vector<string> _stderr;

    };


    class CommandNotFoundException : public SystemCmdException
    {
    public:

	CommandNotFoundException(const string& cmd, const string& program)
	    : SystemCmdException(cmd, "program not found: " + program) {}

	virtual ErrorKind errorKind() const { return ERR_COMMAND_NOT_FOUND; }

    };


    class CommandTimeoutException : public SystemCmdException
    {
    public:

	CommandTimeoutException(const string& cmd, unsigned timeout,
				const vector<string>& stderr_lines);

	virtual ErrorKind errorKind() const { return ERR_COMMAND_TIMEOUT; }

    };


    class CommandNonZeroExitException : public SystemCmdException
    {
    public:

	CommandNonZeroExitException(const string& cmd, int exit_code,
				    const vector<string>& stderr_lines);

	int exitCode() const { return _exit_code; }

	virtual ErrorKind errorKind() const { return ERR_COMMAND_NON_ZERO_EXIT; }

    private:

	int _exit_code;

    };


    class CommandCancelledException : public SystemCmdException
    {
    public:

	CommandCancelledException(const string& cmd)
	    : SystemCmdException(cmd, "command interrupted by cancellation") {}

	virtual ErrorKind errorKind() const { return ERR_CANCELLED; }

    };


#define DP_THROW(EXCEPTION)						\
    do {								\
	const auto& _exception = EXCEPTION;				\
	diskprov::Exception::log(_exception, DP_EXCEPTION_CODE_LOCATION, "THROW"); \
	_exception.relocate(DP_EXCEPTION_CODE_LOCATION);		\
	throw _exception;						\
    } while (0)

#define DP_CAUGHT(EXCEPTION)						\
    diskprov::Exception::log(EXCEPTION, DP_EXCEPTION_CODE_LOCATION, "CAUGHT")

}


#endif
