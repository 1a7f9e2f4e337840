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


#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <chrono>
#include <boost/algorithm/string.hpp>

#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/DiskprovTmpl.h"
#include "diskprov/Utils/SystemCmd.h"


extern char** environ;


namespace diskprov
{
    using namespace std;


    SystemCmd::SystemCmd()
	: ret(0), timed_out(false), was_aborted(false), not_found(false)
    {
    }


    void
    SystemCmd::invalidate()
    {
	lines[IDX_STDOUT].clear();
	lines[IDX_STDERR].clear();
	ret = 0;
	timed_out = false;
	was_aborted = false;
	not_found = false;
    }


    string
    SystemCmd::findProgram(const string& name)
    {
	if (name.empty())
	    return "";

	if (name.find('/') != string::npos)
	    return access(name.c_str(), X_OK) == 0 ? name : "";

	const char* env = getenv("PATH");
	string path = env ? env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

	list<string> dirs = splitString(path, ":");
	for (list<string>::const_iterator it = dirs.begin(); it != dirs.end(); ++it)
	{
	    string tmp = *it + "/" + name;
	    if (access(tmp.c_str(), X_OK) == 0 && checkNormalFile(tmp))
		return tmp;
	}

	return "";
    }


    int
    SystemCmd::execute(const vector<string>& args, unsigned timeout,
		       const std::atomic<bool>* abort)
    {
	invalidate();

	last_cmd = quote(args);
	y2mil("SystemCmd Executing:\"" << last_cmd << "\"");

	if (args.empty())
	{
	    y2err("empty command");
	    not_found = true;
	    ret = -127;
	    return ret;
	}

	string program = findProgram(args.front());
	if (program.empty())
	{
	    y2err("program not found: " << args.front());
	    not_found = true;
	    ret = -127;
	    return ret;
	}

	// Everything the child needs is prepared here since only async-signal-safe
	// functions may be called between fork and exec.

	vector<char*> argv;
	argv.push_back(const_cast<char*>(program.c_str()));
	for (vector<string>::const_iterator it = args.begin() + 1; it != args.end(); ++it)
	    argv.push_back(const_cast<char*>(it->c_str()));
	argv.push_back(nullptr);

	vector<string> env_strings;
	for (char** e = environ; e && *e; ++e)
	{
	    if (!boost::starts_with(*e, "LC_ALL=") && !boost::starts_with(*e, "LANGUAGE="))
		env_strings.push_back(*e);
	}
	env_strings.push_back("LC_ALL=C");
	env_strings.push_back("LANGUAGE=C");

	vector<char*> envp;
	for (vector<string>::const_iterator it = env_strings.begin(); it != env_strings.end(); ++it)
	    envp.push_back(const_cast<char*>(it->c_str()));
	envp.push_back(nullptr);

	int sin = open("/dev/null", O_RDONLY | O_CLOEXEC);
	if (sin < 0)
	{
	    y2err("opening /dev/null failed errno=" << errno << " (" << strerror(errno) << ")");
	    ret = -1;
	    return ret;
	}

	int sout[2];
	int serr[2];

	if (pipe2(sout, O_CLOEXEC) < 0)
	{
	    y2err("pipe stdout creation failed errno=" << errno << " (" << strerror(errno) << ")");
	    close(sin);
	    ret = -1;
	    return ret;
	}

	if (pipe2(serr, O_CLOEXEC) < 0)
	{
	    y2err("pipe stderr creation failed errno=" << errno << " (" << strerror(errno) << ")");
	    close(sin);
	    close(sout[0]);
	    close(sout[1]);
	    ret = -1;
	    return ret;
	}

	pid_t pid = fork();
	switch (pid)
	{
	    case 0:
		// dup2 clears O_CLOEXEC on the new descriptors, all other
		// descriptors are closed by exec
		if (dup2(sin, 0) < 0 || dup2(sout[1], 1) < 0 || dup2(serr[1], 2) < 0)
		    _exit(126);
		execve(program.c_str(), argv.data(), envp.data());
		_exit(127);

	    case -1:
		y2err("fork failed errno=" << errno << " (" << strerror(errno) << ")");
		close(sin);
		close(sout[0]);
		close(sout[1]);
		close(serr[0]);
		close(serr[1]);
		ret = -1;
		return ret;
	}

	close(sin);
	close(sout[1]);
	close(serr[1]);

	struct pollfd pfds[2];
	pfds[IDX_STDOUT].fd = sout[0];
	pfds[IDX_STDERR].fd = serr[0];
	pfds[IDX_STDOUT].events = pfds[IDX_STDERR].events = POLLIN;

	for (int i = 0; i < 2; ++i)
	{
	    if (fcntl(pfds[i].fd, F_SETFL, O_NONBLOCK) < 0)
		y2err("fcntl O_NONBLOCK failed errno=" << errno << " (" << strerror(errno) << ")");
	}

	const chrono::steady_clock::time_point deadline = chrono::steady_clock::now() +
	    chrono::seconds(timeout);

	string partial[2];
	bool eof[2] = { false, false };
	bool killed = false;

	while (!eof[IDX_STDOUT] || !eof[IDX_STDERR])
	{
	    if (timeout > 0 && chrono::steady_clock::now() >= deadline)
	    {
		y2war("killing pid " << pid << " after " << timeout << " s");
		timed_out = true;
	    }
	    else if (abort && abort->load())
	    {
		y2war("killing pid " << pid << " on abort");
		was_aborted = true;
	    }

	    if (timed_out || was_aborted)
	    {
		kill(pid, SIGKILL);
		killed = true;
		break;
	    }

	    for (int i = 0; i < 2; ++i)
		pfds[i].fd = eof[i] ? -1 : (i == IDX_STDOUT ? sout[0] : serr[0]);

	    int sel = poll(pfds, 2, 100);
	    if (sel < 0)
	    {
		if (errno == EINTR)
		    continue;
		y2err("poll failed errno=" << errno << " (" << strerror(errno) << ")");
		kill(pid, SIGKILL);
		killed = true;
		break;
	    }

	    if (sel > 0)
	    {
		if (pfds[IDX_STDOUT].revents)
		    readOutput(sout[0], IDX_STDOUT, partial[IDX_STDOUT], eof[IDX_STDOUT]);
		if (pfds[IDX_STDERR].revents)
		    readOutput(serr[0], IDX_STDERR, partial[IDX_STDERR], eof[IDX_STDERR]);
	    }
	}

	for (int i = 0; i < 2; ++i)
	{
	    if (!partial[i].empty())
		addLine(partial[i], OutputStream(i));
	}

	close(sout[0]);
	close(serr[0]);

	// the program can close its output and keep running
	int status = 0;
	while (true)
	{
	    pid_t tmp = waitpid(pid, &status, killed ? 0 : WNOHANG);
	    if (tmp == pid)
		break;

	    if (tmp < 0)
	    {
		if (errno == EINTR)
		    continue;
		y2err("waitpid failed errno=" << errno << " (" << strerror(errno) << ")");
		break;
	    }

	    if (timeout > 0 && chrono::steady_clock::now() >= deadline)
	    {
		y2war("killing pid " << pid << " after " << timeout << " s");
		timed_out = true;
	    }
	    else if (abort && abort->load())
	    {
		y2war("killing pid " << pid << " on abort");
		was_aborted = true;
	    }

	    if (timed_out || was_aborted)
	    {
		kill(pid, SIGKILL);
		killed = true;
		continue;
	    }

	    poll(NULL, 0, 100);
	}

	if (killed)
	    ret = -1;
	else if (!WIFEXITED(status))
	    ret = -127;
	else
	    ret = WEXITSTATUS(status);

	y2mil("system() Returns:" << ret);
	if (ret != 0)
	    logOutput();

	return ret;
    }


    void
    SystemCmd::readOutput(int fd, OutputStream idx, string& partial, bool& eof)
    {
	char buffer[4096];

	while (true)
	{
	    ssize_t cnt = read(fd, buffer, sizeof(buffer));
	    if (cnt > 0)
	    {
		partial.append(buffer, cnt);

		string::size_type pos;
		while ((pos = partial.find('\n')) != string::npos)
		{
		    addLine(partial.substr(0, pos), idx);
		    partial.erase(0, pos + 1);
		}
	    }
	    else if (cnt == 0)
	    {
		eof = true;
		return;
	    }
	    else
	    {
		if (errno == EINTR)
		    continue;
		if (errno != EAGAIN && errno != EWOULDBLOCK)
		{
		    y2err("read failed errno=" << errno << " (" << strerror(errno) << ")");
		    eof = true;
		}
		return;
	    }
	}
    }


    void
    SystemCmd::addLine(const string& text, OutputStream idx)
    {
	if (lines[idx].size() < 200)
	{
	    if (idx == IDX_STDERR)
		y2mil("stderr:" << text);
	    else
		y2deb("stdout:" << text);
	}

	lines[idx].push_back(text);
    }


    void
    SystemCmd::logOutput() const
    {
	y2mil("stdout:" << lines[IDX_STDOUT].size() << " lines stderr:"
	      << lines[IDX_STDERR].size() << " lines");
    }


    string
    SystemCmd::quote(const string& str)
    {
	if (!str.empty() && str.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
						  "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
						  "0123456789_-.,:/=%+@") == string::npos)
	    return str;

	return "'" + boost::replace_all_copy(str, "'", "'\\''") + "'";
    }


    string
    SystemCmd::quote(const vector<string>& strs)
    {
	string ret;
	for (vector<string>::const_iterator it = strs.begin(); it != strs.end(); ++it)
	{
	    if (it != strs.begin())
		ret.append(" ");
	    ret.append(quote(*it));
	}
	return ret;
    }

}
