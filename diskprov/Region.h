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


#ifndef REGION_H
#define REGION_H

#include <algorithm>
#include <ostream>


namespace diskprov
{

    /**
     * Byte range on a disk. end() is inclusive.
     */
    class Region
    {
    public:

	Region() : s(0), l(0) {}
	Region(unsigned long long start, unsigned long long len) : s(start), l(len) {}

	bool empty() const { return l == 0; }

	bool doIntersect(const Region& r) const
	    { return !empty() && !r.empty() && r.start() <= end() && r.end() >= start(); }
	Region intersect(const Region& r) const
	{
	    if (doIntersect(r))
	    {
		unsigned long long s = std::max(r.start(), start());
		unsigned long long e = std::min(r.end(), end());
		return Region(s, e - s + 1);
	    }
	    return Region(0, 0);
	}
	unsigned long long start() const { return s; }
	unsigned long long end() const { return s + l - 1; }
	unsigned long long len() const { return l; }

	friend std::ostream& operator<<(std::ostream& s, const Region& p)
	{
	    return s << "[" << p.start() << "," << p.len() << "]";
	}

    protected:

	unsigned long long s;
	unsigned long long l;

    };

}

#endif
