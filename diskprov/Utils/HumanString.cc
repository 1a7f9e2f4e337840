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


#include <cmath>
#include <sstream>
#include <locale>
#include <boost/algorithm/string.hpp>

#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/HumanString.h"


namespace diskprov
{
    using namespace std;


    struct Suffix
    {
	const char* name;
	int exponent;
	bool binary;
    };


    // longer names first so that "KiB" is not taken for "B"
    static const Suffix suffixes[] = {
	{ "KiB", 1, true }, { "MiB", 2, true }, { "GiB", 3, true },
	{ "TiB", 4, true }, { "PiB", 5, true }, { "EiB", 6, true },
	{ "kB", 1, false }, { "MB", 2, false }, { "GB", 3, false },
	{ "TB", 4, false }, { "PB", 5, false }, { "EB", 6, false },
	{ "K", 1, true }, { "M", 2, true }, { "G", 3, true },
	{ "T", 4, true }, { "P", 5, true }, { "E", 6, true },
	{ "B", 0, true }
    };

    static const char* binary_names[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB" };


    string
    byteToHumanString(unsigned long long size, int precision, bool omit_zeroes)
    {
	double f = size;
	int i = 0;

	while (f >= 1024.0 && i + 1 < 7)
	{
	    f /= 1024.0;
	    i++;
	}

	if ((i == 0) || (omit_zeroes && (f == (unsigned long long)(f))))
	{
	    precision = 0;
	}

	ostringstream s;
	classic(s);
	s.setf(ios::fixed);
	s.precision(precision);

	s << f << ' ' << binary_names[i];

	return s.str();
    }


    bool
    humanStringToByte(const string& str, unsigned long long& size)
    {
	const string str_trimmed = boost::trim_copy(str, locale::classic());
	if (str_trimmed.empty())
	    return false;

	string number = str_trimmed;
	double f = 1.0;

	for (size_t i = 0; i < sizeof(suffixes) / sizeof(suffixes[0]); ++i)
	{
	    const string tmp = suffixes[i].name;

	    if (boost::ends_with(str_trimmed, tmp))
	    {
		number = str_trimmed.substr(0, str_trimmed.size() - tmp.size());
		for (int e = 0; e < suffixes[i].exponent; ++e)
		    f *= suffixes[i].binary ? 1024.0 : 1000.0;
		break;
	    }
	}

	istringstream s(boost::trim_copy(number, locale::classic()));
	classic(s);

	double g;
	s >> g;

	if (s.fail() || !s.eof() || g < 0.0)
	    return false;

	// ULLONG_MAX is not exact as double, 2^64 is
	const double product = g * f;
	if (!std::isfinite(product) || product >= 18446744073709551616.0)
	    return false;

	size = product;
	return true;
    }

}
