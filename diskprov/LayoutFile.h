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


#ifndef LAYOUT_FILE_H
#define LAYOUT_FILE_H


#include <string>

#include "diskprov/Layout.h"


namespace diskprov
{

    /**
     * Reads a layout from an XML file:
     *
     * <layout>
     *   <disk>
     *     <device>/dev/nvme0n1</device>
     *     <role>boot</role>
     *     <label>gpt</label>
     *     <wipe>true</wipe>
     *     <partition>
     *       <number>1</number>
     *       <start>1 MiB</start>
     *       <end>512 MiB</end>
     *       <fs-hint>fat32</fs-hint>
     *     </partition>
     *   </disk>
     *   <filesystem>
     *     <id>efi</id>
     *     <type>fat32</type>
     *     <device>/dev/nvme0n1p1</device>
     *     <label>ODIN</label>
     *   </filesystem>
     *   <mount>
     *     <filesystem>efi</filesystem>
     *     <path>/mnt/efi</path>
     *     <options>noatime</options>
     *   </mount>
     * </layout>
     *
     * Throws ParseException on malformed input. The layout is not
     * validated.
     */
    Layout readLayout(const std::string& filename);

}


#endif
