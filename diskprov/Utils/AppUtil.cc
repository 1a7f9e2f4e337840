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
#include <string.h>
#include <unistd.h>
#include <time.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <string>
#include <boost/algorithm/string.hpp>

#include <blocxx/AppenderLogger.hpp>
#include <blocxx/FileAppender.hpp>
#include <blocxx/Logger.hpp>
#include <blocxx/LogMessage.hpp>

#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{
    using namespace std;


    bool
    createPath(const string& path)
    {
	string::size_type pos = 0;
	while ((pos = path.find('/', pos + 1)) != string::npos)
	{
	    string tmp = path.substr(0, pos);
	    if (mkdir(tmp.c_str(), 0755) != 0 && errno != EEXIST)
		y2deb("mkdir " << tmp << " failed errno:" << errno);
	}
	if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST)
	{
	    y2err("mkdir " << path << " failed errno:" << errno << " (" << strerror(errno) << ")");
	    return false;
	}
	return checkDir(path);
    }


    bool
    checkDir(const string& path)
    {
	struct stat sbuf;
	return stat(path.c_str(), &sbuf) >= 0 && S_ISDIR(sbuf.st_mode);
    }


    bool
    checkNormalFile(const string& path)
    {
	struct stat sbuf;
	return stat(path.c_str(), &sbuf) >= 0 && S_ISREG(sbuf.st_mode);
    }


    string
    extractNthWord(int num, const string& line, bool get_rest)
    {
	string ret = boost::trim_left_copy_if(line, boost::is_any_of(app_ws));

	for (int i = 0; i < num && !ret.empty(); ++i)
	{
	    string::size_type pos = ret.find_first_of(app_ws);
	    if (pos == string::npos)
		ret.erase();
	    else
		ret = boost::trim_left_copy_if(ret.substr(pos), boost::is_any_of(app_ws));
	}

	string::size_type pos;
	if (!get_rest && (pos = ret.find_first_of(app_ws)) != string::npos)
	    ret.erase(pos);

	return ret;
    }


    list<string>
    splitString(const string& s, const string& del_chars, bool multiple_delim, bool skip_empty)
    {
	list<string> ret;

	string::size_type cur = 0;
	string::size_type pos;
	while (cur < s.size() && (pos = s.find_first_of(del_chars, cur)) != string::npos)
	{
	    if (pos == cur)
	    {
		if (!skip_empty)
		    ret.push_back("");
	    }
	    else
		ret.push_back(s.substr(cur, pos - cur));

	    if (multiple_delim)
		cur = s.find_first_not_of(del_chars, pos);
	    else
		cur = pos + 1;
	}
	if (cur < s.size())
	    ret.push_back(s.substr(cur));
	if (!skip_empty && !s.empty() && s.find_last_of(del_chars) == s.size() - 1)
	    ret.push_back("");

	return ret;
    }


    string
    hostname()
    {
	struct utsname buf;
	if (uname(&buf) != 0)
	    return string("unknown");
	string hostname(buf.nodename);
	if (strlen(buf.domainname) > 0 && strcmp(buf.domainname, "(none)") != 0)
	    hostname += "." + string(buf.domainname);
	return hostname;
    }


    string
    datetime()
    {
	time_t t1 = time(NULL);
	struct tm t2;
	localtime_r(&t1, &t2);
	char buf[64 + 1];
	if (strftime(buf, sizeof(buf), "%F %T %Z", &t2) == 0)
	    return string("unknown");
	return string(buf);
    }


    static const blocxx::String component = "diskprov";


    void
    createLogger(const string& name, const string& logpath, const string& logfile,
		 const string& level)
    {
	using namespace blocxx;

	if (logpath == "NULL" || logfile == "NULL")
	    return;

	String nm = name.c_str();
	LoggerConfigMap configItems;

	String level_key;
	level_key.format("log.%s.level", name.c_str());
	configItems[level_key] = level.c_str();

	String type = LogAppender::TYPE_FILE;

	if (logpath == "STDERR" && logfile == "STDERR")
	{
	    type = LogAppender::TYPE_STDERR;
	}
	else if (logpath == "SYSLOG" && logfile == "SYSLOG")
	{
	    type = LogAppender::TYPE_SYSLOG;
	}
	else
	{
	    String location_key;
	    location_key.format("log.%s.location", name.c_str());
	    configItems[location_key] = (logpath + "/" + logfile).c_str();
	}

	LogAppenderRef logApp =
	    LogAppender::createLogAppender(nm, LogAppender::ALL_COMPONENTS,
					   LogAppender::ALL_CATEGORIES,
					   "%d %-5p %c(%P) %F(%M):%L - %m",
					   type, configItems);

	LogAppender::setDefaultLogAppender(logApp);
    }


    bool
    testLogLevel(LogLevel level)
    {
	using namespace blocxx;

	ELogLevel curLevel = LogAppender::getCurrentLogAppender()->getLogLevel();

	switch (level)
	{
	    case DEBUG:
		return curLevel >= ::blocxx::E_DEBUG_LEVEL;
	    case MILESTONE:
		return curLevel >= ::blocxx::E_INFO_LEVEL;
	    case WARNING:
		return curLevel >= ::blocxx::E_WARNING_LEVEL;
	    case ERROR:
		return curLevel >= ::blocxx::E_ERROR_LEVEL;
	    default:
		return curLevel >= ::blocxx::E_FATAL_ERROR_LEVEL;
	}
    }


    static void
    prepareLogStream(ostringstream& stream)
    {
	stream.imbue(std::locale::classic());
	stream.setf(std::ios::boolalpha);
	stream.setf(std::ios::showbase);
    }


    ostringstream*
    logStreamOpen()
    {
	std::ostringstream* stream = new ostringstream;
	prepareLogStream(*stream);
	return stream;
    }


    void
    logStreamClose(LogLevel level, const char* file, unsigned line, const char* func,
		   ostringstream* stream)
    {
	using namespace blocxx;

	String category;

	switch (level)
	{
	    case DEBUG:
		category = Logger::STR_DEBUG_CATEGORY;
		break;
	    case MILESTONE:
		category = Logger::STR_INFO_CATEGORY;
		break;
	    case WARNING:
		category = Logger::STR_WARNING_CATEGORY;
		break;
	    case ERROR:
		category = Logger::STR_ERROR_CATEGORY;
		break;
	    default:
		category = Logger::STR_FATAL_CATEGORY;
		break;
	}

	string tmp = stream->str();

	string::size_type pos1 = 0;

	while (true)
	{
	    string::size_type pos2 = tmp.find('\n', pos1);

	    if (pos2 != string::npos || pos1 != tmp.length())
		LogAppender::getCurrentLogAppender()->logMessage(LogMessage(component, category,
									    String(tmp.substr(pos1, pos2 - pos1).c_str()),
									    file, line, func));

	    if (pos2 == string::npos)
		break;

	    pos1 = pos2 + 1;
	}

	delete stream;
    }


    const string app_ws = " \t\n";

}
