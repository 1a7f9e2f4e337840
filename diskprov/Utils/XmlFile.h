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


#ifndef XML_FILE_H
#define XML_FILE_H


#include <libxml/tree.h>
#include <string>
#include <list>
#include <sstream>
#include <boost/noncopyable.hpp>

#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{
    using std::string;
    using std::list;


    class XmlFile : private boost::noncopyable
    {
    public:

	XmlFile();

	/**
	 * Reads and parses the file. Throws ParseException if the file
	 * cannot be read or is not well-formed XML.
	 */
	XmlFile(const string& filename);

	~XmlFile();

	void setRootElement(xmlNode* node);
	const xmlNode* getRootElement() const;

	bool save(const string& filename) const;

    private:

	xmlDoc* doc;

    };


    xmlNode* xmlNewNode(const char* name);
    xmlNode* xmlNewChild(xmlNode* node, const char* name);


    const xmlNode* getChildNode(const xmlNode* node, const char* name);
    list<const xmlNode*> getChildNodes(const xmlNode* node, const char* name);


    bool getChildValue(const xmlNode* node, const char* name, string& value);
    bool getChildValue(const xmlNode* node, const char* name, bool& value);

    template<typename Type>
    bool getChildValue(const xmlNode* node, const char* name, Type& value)
    {
	string tmp;
	if (!getChildValue(node, name, tmp))
	    return false;

	std::istringstream istr(tmp);
	classic(istr);
	istr >> value;
	return !istr.fail();
    }

    /**
     * Collects the values of all children with the name.
     */
    bool getChildValues(const xmlNode* node, const char* name, list<string>& values);


    void setChildValue(xmlNode* node, const char* name, const char* value);
    void setChildValue(xmlNode* node, const char* name, const string& value);
    void setChildValue(xmlNode* node, const char* name, bool value);

    template<typename Type>
    void setChildValue(xmlNode* node, const char* name, const Type& value)
    {
	std::ostringstream ostr;
	classic(ostr);
	ostr << value;
	setChildValue(node, name, ostr.str());
    }

    template<typename Type>
    void setChildValueIf(xmlNode* node, const char* name, const Type& value, bool pred)
    {
	if (pred)
	    setChildValue(node, name, value);
    }

}


#endif
