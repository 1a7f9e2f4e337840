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


#include <ctype.h>

#include "diskprov/FsCapabilities.h"


namespace diskprov
{

    bool
    getFsCapabilities(FsType fstype, FsCapabilities& fscapabilities)
    {
	struct FsCapabilitiesX : public FsCapabilities
	{
	    FsCapabilitiesX(bool supportsLabelX, bool supportsUuidX,
			    bool supportsMultipleDevicesX, bool supportsCompressionX,
			    unsigned int labelLengthX, unsigned long long minimalFsSizeX,
			    const char* mountTypeX)
		: FsCapabilities()
	    {
		supportsLabel = supportsLabelX;
		supportsUuid = supportsUuidX;
		supportsMultipleDevices = supportsMultipleDevicesX;
		supportsCompression = supportsCompressionX;
		labelLength = labelLengthX;
		minimalFsSize = minimalFsSizeX;
		mountType = mountTypeX;
	    }
	};

	// FAT has a 32 bit volume serial instead of a UUID
	static const FsCapabilitiesX fat32Caps(true, false, false, false, 11,
					       33 * 1024 * 1024, "vfat");

	static const FsCapabilitiesX btrfsCaps(true, true, true, true, 255,
					       256 * 1024 * 1024, "btrfs");

	static const FsCapabilitiesX swapCaps(true, true, false, false, 16,
					      64 * 1024, "swap");

	static const FsCapabilitiesX ext4Caps(true, true, false, false, 16,
					      32 * 1024 * 1024, "ext4");

	switch (fstype)
	{
	    case FAT32:
		fscapabilities = fat32Caps;
		return true;

	    case BTRFS:
		fscapabilities = btrfsCaps;
		return true;

	    case SWAP:
		fscapabilities = swapCaps;
		return true;

	    case EXT4:
		fscapabilities = ext4Caps;
		return true;

	    case FSUNKNOWN:
		break;
	}

	return false;
    }


    bool
    isValidUuid(const std::string& uuid)
    {
	if (uuid.size() != 36)
	    return false;

	for (std::string::size_type i = 0; i < uuid.size(); ++i)
	{
	    if (i == 8 || i == 13 || i == 18 || i == 23)
	    {
		if (uuid[i] != '-')
		    return false;
	    }
	    else if (!isxdigit((unsigned char) uuid[i]))
		return false;
	}

	return true;
    }

}
