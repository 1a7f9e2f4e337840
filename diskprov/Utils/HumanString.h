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


#ifndef HUMAN_STRING_H
#define HUMAN_STRING_H


#include <string>


namespace diskprov
{

    /**
     * Return a pretty description of a size with required precision and
     * using B, KiB, MiB, GiB, TiB, PiB or EiB as unit as appropriate.
     *
     * @param size size in bytes
     * @param precision number of fraction digits in output
     * @param omit_zeroes if true omit trailing zeroes for exact values
     * @return formatted string
     */
    std::string byteToHumanString(unsigned long long size, int precision = 2,
				  bool omit_zeroes = true);

    /**
     * Converts a size description into an integer. Understands B, the
     * binary units KiB, MiB, GiB, TiB, PiB and EiB with K, M, G, T, P and E
     * as short forms, and the decimal units kB, MB, GB, TB, PB and EB, the
     * way parted does. Spaces between number and unit are allowed. A
     * number without unit is taken as bytes.
     *
     * @param str size string
     * @param size size in bytes
     * @return true on successful conversion
     */
    bool humanStringToByte(const std::string& str, unsigned long long& size);

}


#endif
