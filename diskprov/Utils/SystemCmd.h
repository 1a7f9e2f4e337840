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


#ifndef SYSTEM_CMD_H
#define SYSTEM_CMD_H


#include <string>
#include <vector>
#include <atomic>
#include <boost/noncopyable.hpp>


namespace diskprov
{
    using std::string;
    using std::vector;


    /**
     * Runs a program with an argument vector (no shell involved) and
     * collects its stdout and stderr line by line. The program is looked
     * up in PATH and runs with LC_ALL=C.
     */
    class SystemCmd : private boost::noncopyable
    {
    public:

	enum OutputStream { IDX_STDOUT, IDX_STDERR };

	SystemCmd();

	/**
	 * Executes the command and waits for it. With a non-zero timeout
	 * the program is killed after timeout seconds, with an abort flag
	 * it is killed as soon as the flag becomes true. Returns the exit
	 * code of the program or a negative value if it did not exit
	 * normally.
	 */
	int execute(const vector<string>& args, unsigned timeout = 0,
		    const std::atomic<bool>* abort = nullptr);

	const vector<string>& stdout() const { return lines[IDX_STDOUT]; }
	const vector<string>& stderr() const { return lines[IDX_STDERR]; }
	const string& cmd() const { return last_cmd; }
	int retcode() const { return ret; }

	bool timedOut() const { return timed_out; }
	bool aborted() const { return was_aborted; }
	bool notFound() const { return not_found; }

	void logOutput() const;

	/**
	 * Quotes and protects a single string for shell execution. Only
	 * used to log commands and to show them in the dry-run output.
	 */
	static string quote(const string& str);

	/**
	 * Quotes and protects every single string in the list for shell
	 * execution.
	 */
	static string quote(const vector<string>& strs);

	/**
	 * Returns the full path of the program or an empty string if it
	 * cannot be found.
	 */
	static string findProgram(const string& name);

    private:

	void invalidate();
	void readOutput(int fd, OutputStream idx, string& partial, bool& eof);
	void addLine(const string& text, OutputStream idx);

	vector<string> lines[2];
	string last_cmd;
	int ret;
	bool timed_out;
	bool was_aborted;
	bool not_found;

    };


    inline string quote(const string& str)
    {
	return SystemCmd::quote(str);
    }

    inline string quote(const vector<string>& strs)
    {
	return SystemCmd::quote(strs);
    }

}

#endif
