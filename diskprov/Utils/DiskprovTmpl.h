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


#ifndef DISKPROV_TMPL_H
#define DISKPROV_TMPL_H


#include <sstream>
#include <string>
#include <list>
#include <vector>
#include <set>
#include <map>

#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{

    template<class Num> string decString(Num number)
    {
	std::ostringstream num_str;
	classic(num_str);
	num_str << number;
	return num_str.str();
    }


    template<class Value> bool operator>>(const string& d, Value& v)
    {
	std::istringstream data(d);
	classic(data);
	data >> v;
	return !data.fail();
    }


    template<class Container>
    std::ostream& streamSequence(std::ostream& s, const Container& c)
    {
	s << "<";
	for (typename Container::const_iterator it = c.begin(); it != c.end(); ++it)
	{
	    if (it != c.begin())
		s << " ";
	    s << *it;
	}
	return s << ">";
    }


    template<class Value> std::ostream& operator<<(std::ostream& s, const std::list<Value>& l)
    {
	return streamSequence(s, l);
    }

    template<class Value> std::ostream& operator<<(std::ostream& s, const std::vector<Value>& v)
    {
	return streamSequence(s, v);
    }

    template<class Value> std::ostream& operator<<(std::ostream& s, const std::set<Value>& v)
    {
	return streamSequence(s, v);
    }


    template<class F, class S> std::ostream& operator<<(std::ostream& s, const std::pair<F, S>& p)
    {
	return s << "[" << p.first << ":" << p.second << "]";
    }


    template<class Key, class Value> std::ostream& operator<<(std::ostream& s, const std::map<Key, Value>& m)
    {
	s << "<";
	for (typename std::map<Key, Value>::const_iterator it = m.begin(); it != m.end(); ++it)
	{
	    if (it != m.begin())
		s << " ";
	    s << it->first << ":" << it->second;
	}
	return s << ">";
    }


    template <class T, unsigned int sz>
    inline unsigned int lengthof(T (&)[sz]) { return sz; }

}


#endif
