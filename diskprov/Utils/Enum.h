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


#ifndef ENUM_H
#define ENUM_H


#include <string>
#include <vector>
#include <algorithm>
#include <type_traits>

#include "diskprov/DiskprovTypes.h"
#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{
    using std::string;
    using std::vector;


    template <typename EnumType> struct EnumInfo {};

    template <> struct EnumInfo<FsType> { static const vector<string> names; };
    template <> struct EnumInfo<DiskRole> { static const vector<string> names; };
    template <> struct EnumInfo<PtType> { static const vector<string> names; };
    template <> struct EnumInfo<StepKind> { static const vector<string> names; };
    template <> struct EnumInfo<StepStatus> { static const vector<string> names; };
    template <> struct EnumInfo<SkipReason> { static const vector<string> names; };
    template <> struct EnumInfo<ErrorKind> { static const vector<string> names; };
    template <> struct EnumInfo<RunState> { static const vector<string> names; };


    template <typename EnumType>
    const string& toString(EnumType value)
    {
	static_assert(std::is_enum<EnumType>::value, "not enum");

	const vector<string>& names = EnumInfo<EnumType>::names;

	// Comparisons must not be done with type of enum since the enum may
	// define comparison operators.
	if ((size_t)(value) >= names.size())
	{
	    y2err("invalid enum value " << (size_t)(value));
	    return names.front();
	}

	return names[value];
    }


    template <typename EnumType>
    bool toValue(const string& str, EnumType& value, bool log_error = true)
    {
	static_assert(std::is_enum<EnumType>::value, "not enum");

	const vector<string>& names = EnumInfo<EnumType>::names;

	vector<string>::const_iterator it = std::find(names.begin(), names.end(), str);

	if (it == names.end())
	{
	    if (log_error)
		y2err("converting '" << str << "' to enum failed");
	    return false;
	}

	value = EnumType(it - names.begin());
	return true;
    }

}


#endif
