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


#ifndef APP_UTIL_H
#define APP_UTIL_H


#include <sstream>
#include <locale>
#include <string>
#include <list>
#include <vector>


namespace diskprov
{
    using std::string;
    using std::list;
    using std::vector;


    bool createPath(const string& path);
    bool checkDir(const string& path);
    bool checkNormalFile(const string& path);

    string extractNthWord(int num, const string& line, bool get_rest = false);

    list<string> splitString(const string& s, const string& del_chars = " \t\n",
			     bool multiple_delim = true, bool skip_empty = true);


    string hostname();
    string datetime();


    template<class StreamType>
    void classic(StreamType& stream)
    {
	stream.imbue(std::locale::classic());
    }


    enum LogLevel { DEBUG, MILESTONE, WARNING, ERROR };

    /**
     * Set up the blocxx log appender. logpath and logfile may both be
     * "STDERR" or "SYSLOG" to log there instead of into a file, or both
     * "NULL" to keep the current appender. level is one of "debug",
     * "info", "warning" and "error".
     */
    void createLogger(const string& name, const string& logpath, const string& logfile,
		      const string& level = "debug");

    bool testLogLevel(LogLevel level);

    std::ostringstream* logStreamOpen();

    void logStreamClose(LogLevel level, const char* file, unsigned line,
			const char* func, std::ostringstream*);

#define y2deb(op) y2log_op(diskprov::DEBUG, __FILE__, __LINE__, __FUNCTION__, op)
#define y2mil(op) y2log_op(diskprov::MILESTONE, __FILE__, __LINE__, __FUNCTION__, op)
#define y2war(op) y2log_op(diskprov::WARNING, __FILE__, __LINE__, __FUNCTION__, op)
#define y2err(op) y2log_op(diskprov::ERROR, __FILE__, __LINE__, __FUNCTION__, op)

#define y2log_op(level, file, line, func, op)				\
    do {								\
	if (diskprov::testLogLevel(level))				\
	{								\
	    std::ostringstream* __buf = diskprov::logStreamOpen();	\
	    *__buf << op;						\
	    diskprov::logStreamClose(level, file, line, func, __buf);	\
	}								\
    } while (0)


    extern const string app_ws;

}


#endif
