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


#ifndef GRAPH_H
#define GRAPH_H


#include <string>

#include "diskprov/Step.h"


namespace diskprov
{

    /**
     * Saves the steps of the plan and their dependencies as a graphviz
     * dot file. Wipe steps are placed at the top and mounts
     * at the bottom.
     */
    bool savePlanGraph(const Plan& plan, const std::string& filename);

}


#endif
