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


#include <fstream>
#include <boost/algorithm/string.hpp>

#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/AsciiFile.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    AsciiFile::AsciiFile(const string& name, bool remove_empty)
	: Name_C(name), remove_empty(remove_empty)
    {
	reload();
    }


    bool
    AsciiFile::reload()
    {
	y2mil("loading file " << Name_C);
	Lines_C.clear();

	ifstream File_Ci(Name_C.c_str());
	classic(File_Ci);

	bool Ret_bi = File_Ci.good();

	string Line_Ci;
	while (getline(File_Ci, Line_Ci))
	{
	    if (!remove_empty || !boost::trim_copy(Line_Ci, locale::classic()).empty())
		Lines_C.push_back(Line_Ci);
	}

	if (!Ret_bi)
	    y2war("reading " << Name_C << " failed");

	return Ret_bi;
    }


    SysconfigFile::SysconfigFile(const string& name)
	: AsciiFile(name, true)
    {
	for (vector<string>::const_iterator it = Lines_C.begin(); it != Lines_C.end(); ++it)
	{
	    string line = boost::trim_copy(*it, locale::classic());

	    if (line.empty() || line[0] == '#')
		continue;

	    string::size_type pos = line.find('=');
	    if (pos == string::npos || pos == 0)
	    {
		y2war("ignoring line '" << line << "' in " << name);
		continue;
	    }

	    string key = boost::trim_copy(line.substr(0, pos), locale::classic());
	    string value = boost::trim_copy(line.substr(pos + 1), locale::classic());

	    if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'') &&
		value[value.size() - 1] == value[0])
		value = value.substr(1, value.size() - 2);

	    values[key] = value;
	}

	y2mil("values:" << values);
    }


    bool
    SysconfigFile::getValue(const string& key, string& value) const
    {
	map<string, string>::const_iterator it = values.find(key);
	if (it == values.end())
	    return false;

	value = it->second;
	return true;
    }


    bool
    SysconfigFile::getValue(const string& key, bool& value) const
    {
	string tmp;
	if (!getValue(key, tmp))
	    return false;

	boost::to_lower(tmp, locale::classic());
	if (tmp == "yes" || tmp == "true" || tmp == "1")
	    value = true;
	else if (tmp == "no" || tmp == "false" || tmp == "0")
	    value = false;
	else
	{
	    y2war("invalid boolean '" << tmp << "' for " << key << " in " << name());
	    return false;
	}

	return true;
    }


    bool
    SysconfigFile::getValue(const string& key, unsigned& value) const
    {
	string tmp;
	if (!getValue(key, tmp))
	    return false;

	if (tmp.empty() || tmp.find_first_not_of("0123456789") != string::npos || !(tmp >> value))
	{
	    y2war("invalid number '" << tmp << "' for " << key << " in " << name());
	    return false;
	}

	return true;
    }

}
