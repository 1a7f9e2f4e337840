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


#include <string>
#include <fstream>
#include <list>
#include <map>
#include <boost/algorithm/string.hpp>

#include "config.h"
#include "diskprov/Graph.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Enum.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{
    using namespace std;


    class Graph
    {

    public:

	bool save(const string& filename) const;

    protected:

	struct Node
	{
	    Node(StepKind kind, unsigned id, const string& label, const string& tooltip,
		 bool destructive)
		: kind(kind), id(id), label(label), tooltip(tooltip), destructive(destructive) {}

	    string name() const { return "step:" + decString(id); }

	    StepKind kind;
	    unsigned id;
	    string label;
	    string tooltip;
	    bool destructive;
	};

	struct Edge
	{
	    Edge(const string& id1, const string& id2)
		: id1(id1), id2(id2) {}

	    string id1;
	    string id2;
	};

	enum RankType { RANK_SOURCE, RANK_SAME, RANK_SINK };

	struct Rank
	{
	    Rank(RankType type = RANK_SAME)
		: type(type) {}

	    RankType type;
	    list<string> ids;
	};

	friend ostream& operator<<(ostream& s, const Node& node);
	friend ostream& operator<<(ostream& s, const Edge& edge);
	friend ostream& operator<<(ostream& s, const Rank& rank);

	list<Node> nodes;
	list<Edge> edges;
	list<Rank> ranks;

	static string quote(const string& str);

    };


    class PlanGraph : public Graph
    {

    public:

	PlanGraph(const Plan& plan);

    };


    PlanGraph::PlanGraph(const Plan& plan)
    {
	Rank wipe_rank(RANK_SOURCE);
	Rank mount_rank(RANK_SINK);

	const vector<Step>& steps = plan.getSteps();
	for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	{
	    string tooltip = toString(it->kind) + "\\n" + boost::join(it->disks, " ");
	    if (it->isDestructive())
		tooltip += "\\ndestructive";

	    Node node(it->kind, it->id, decString(it->id) + ": " + it->text(), tooltip,
		      it->isDestructive());
	    nodes.push_back(node);

	    if (it->kind == WIPE)
		wipe_rank.ids.push_back(node.name());
	    else if (it->kind == MOUNT)
		mount_rank.ids.push_back(node.name());

	    for (vector<unsigned>::const_iterator dep = it->depends.begin(); dep != it->depends.end(); ++dep)
		edges.push_back(Edge("step:" + decString(*dep), node.name()));
	}

	if (!wipe_rank.ids.empty())
	    ranks.push_back(wipe_rank);

	if (!mount_rank.ids.empty())
	    ranks.push_back(mount_rank);
    }


    string
    Graph::quote(const string& str)
    {
	return '"' + boost::replace_all_copy(str, "\"", "\\\"") + '"';
    }


    ostream& operator<<(ostream& s, const Graph::Node& node)
    {
	s << Graph::quote(node.name()) << " [label=" << Graph::quote(node.label);
	switch (node.kind)
	{
	    case WIPE:
		s << ", color=\"#ff0000\", fillcolor=\"#ffaaaa\"";
		break;
	    case PARTITION:
		s << ", color=\"#cc33cc\", fillcolor=\"#eeaaee\"";
		break;
	    case FORMAT:
		s << ", color=\"#17534f\", fillcolor=\"#28e3d8\"";
		break;
	    case LABEL:
	    case ASSIGN_UUID:
		s << ", color=\"#0000ff\", fillcolor=\"#aaaaff\"";
		break;
	    case MOUNT:
		s << ", color=\"#008800\", fillcolor=\"#99ee99\"";
		break;
	}
	if (node.destructive)
	    s << ", penwidth=2";
	return s << ", tooltip=" << Graph::quote(node.tooltip) << "];";
    }


    ostream& operator<<(ostream& s, const Graph::Edge& edge)
    {
	return s << Graph::quote(edge.id1) << " -> " << Graph::quote(edge.id2) << ";";
    }


    ostream& operator<<(ostream& s, const Graph::Rank& rank)
    {
	static const char* names[] = { "source", "same", "sink" };

	s << "{ rank=" << names[rank.type] << "; ";
	for (list<string>::const_iterator id = rank.ids.begin(); id != rank.ids.end(); ++id)
	    s << Graph::quote(*id) << " ";
	return s << "};";
    }


    bool
    Graph::save(const string& filename) const
    {
	ofstream out(filename.c_str());
	classic(out);

	out << "// generated by diskprov version " VERSION << endl;
	out << "// " << hostname() << ", " << datetime() << endl;
	out << endl;

	out << "digraph plan" << endl;
	out << "{" << endl;
	out << "    node [shape=rectangle, style=filled, fontname=\"Arial\"];" << endl;
	out << "    edge [color=\"#444444\"];" << endl;
	out << endl;

	for (list<Node>::const_iterator node = nodes.begin(); node != nodes.end(); ++node)
	    out << "    " << (*node) << endl;

	out << endl;

	for (list<Rank>::const_iterator rank = ranks.begin(); rank != ranks.end(); ++rank)
	    out << "    " << (*rank) << endl;

	out << endl;

	for (list<Edge>::const_iterator edge = edges.begin(); edge != edges.end(); ++edge)
	    out << "    " << (*edge) << endl;

	out << "}" << endl;

	out.close();

	return !out.fail();
    }


    bool
    savePlanGraph(const Plan& plan, const string& filename)
    {
	y2mil("saving plan graph to " << filename);
	return PlanGraph(plan).save(filename);
    }

}
