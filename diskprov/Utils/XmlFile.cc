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


#include <string.h>
#include <libxml/parser.h>
#include <libxml/xmlsave.h>
#include <boost/algorithm/string.hpp>

#include "diskprov/Utils/XmlFile.h"
#include "diskprov/Utils/Exception.h"


namespace diskprov
{
    using namespace std;


    XmlFile::XmlFile()
	: doc(xmlNewDoc((const xmlChar*) "1.0"))
    {
    }


    XmlFile::XmlFile(const string& filename)
	: doc(xmlReadFile(filename.c_str(), NULL, XML_PARSE_NOBLANKS | XML_PARSE_NONET))
    {
	if (!doc)
	    DP_THROW(ParseException("reading xml file failed", filename, "well-formed xml"));
    }


    XmlFile::~XmlFile()
    {
	if (doc)
	    xmlFreeDoc(doc);
    }


    void
    XmlFile::setRootElement(xmlNode* node)
    {
	xmlDocSetRootElement(doc, node);
    }


    const xmlNode*
    XmlFile::getRootElement() const
    {
	return xmlDocGetRootElement(doc);
    }


    bool
    XmlFile::save(const string& filename) const
    {
	if (xmlSaveFormatFile(filename.c_str(), doc, 1) < 0)
	{
	    y2err("saving xml file " << filename << " failed");
	    return false;
	}

	return true;
    }


    xmlNode*
    xmlNewNode(const char* name)
    {
	return ::xmlNewNode(NULL, (const xmlChar*) name);
    }


    xmlNode*
    xmlNewChild(xmlNode* node, const char* name)
    {
	return ::xmlNewChild(node, NULL, (const xmlChar*) name, NULL);
    }


    const xmlNode*
    getChildNode(const xmlNode* node, const char* name)
    {
	if (!node)
	    return NULL;

	for (const xmlNode* cur_node = node->children; cur_node; cur_node = cur_node->next)
	{
	    if (cur_node->type == XML_ELEMENT_NODE &&
		strcmp(name, (const char*) cur_node->name) == 0)
	    {
		return cur_node;
	    }
	}

	return NULL;
    }


    list<const xmlNode*>
    getChildNodes(const xmlNode* node, const char* name)
    {
	list<const xmlNode*> ret;

	if (!node)
	    return ret;

	for (const xmlNode* cur_node = node->children; cur_node; cur_node = cur_node->next)
	{
	    if (cur_node->type == XML_ELEMENT_NODE &&
		strcmp(name, (const char*) cur_node->name) == 0)
	    {
		ret.push_back(cur_node);
	    }
	}

	return ret;
    }


    static string
    nodeText(const xmlNode* node)
    {
	string ret;

	if (node->children && node->children->content)
	    ret = (const char*) node->children->content;

	return boost::trim_copy(ret, locale::classic());
    }


    bool
    getChildValue(const xmlNode* node, const char* name, string& value)
    {
	const xmlNode* child = getChildNode(node, name);
	if (!child)
	    return false;

	value = nodeText(child);
	return true;
    }


    bool
    getChildValue(const xmlNode* node, const char* name, bool& value)
    {
	string tmp;
	if (!getChildValue(node, name, tmp))
	    return false;

	if (tmp == "true" || tmp == "yes")
	    value = true;
	else if (tmp == "false" || tmp == "no")
	    value = false;
	else
	    DP_THROW(ParseException(string("bad boolean in <") + name + ">", tmp, "true or false"));

	return true;
    }


    bool
    getChildValues(const xmlNode* node, const char* name, list<string>& values)
    {
	const list<const xmlNode*> children = getChildNodes(node, name);

	for (list<const xmlNode*>::const_iterator it = children.begin(); it != children.end(); ++it)
	    values.push_back(nodeText(*it));

	return !children.empty();
    }


    void
    setChildValue(xmlNode* node, const char* name, const char* value)
    {
	xmlNode* child = xmlNewChild(node, name);
	xmlNodeAddContent(child, (const xmlChar*) value);
    }


    void
    setChildValue(xmlNode* node, const char* name, const string& value)
    {
	setChildValue(node, name, value.c_str());
    }


    void
    setChildValue(xmlNode* node, const char* name, bool value)
    {
	setChildValue(node, name, value ? "true" : "false");
    }

}
