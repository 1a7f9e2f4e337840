/*
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
 * with this program; if not, see <http://www.gnu.org/licenses/>.
 */


#ifndef FS_CAPABILITIES_H
#define FS_CAPABILITIES_H


#include <string>

#include "diskprov/DiskprovTypes.h"


namespace diskprov
{

    /**
     * What the tools of a filesystem kind can do.
     */
    struct FsCapabilities
    {
	FsCapabilities() {}
	bool supportsLabel;
	bool supportsUuid;
	bool supportsMultipleDevices;
	bool supportsCompression;
	unsigned int labelLength;
	unsigned long long minimalFsSize;
	std::string mountType;
    };


    /**
     * Returns false for unknown filesystem kinds.
     */
    bool getFsCapabilities(FsType fstype, FsCapabilities& fscapabilities);

    /**
     * Checks the format 8-4-4-4-12 of hex digits.
     */
    bool isValidUuid(const std::string& uuid);

}


#endif
