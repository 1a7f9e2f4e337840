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


#ifndef ASCII_FILE_H
#define ASCII_FILE_H


#include <string>
#include <vector>
#include <map>


namespace diskprov
{
    using std::string;
    using std::vector;
    using std::map;


    /**
     * Text file kept in memory line by line.
     */
    class AsciiFile
    {
    public:

	AsciiFile(const string& name, bool remove_empty = false);

	const string& name() const { return Name_C; }

	/**
	 * Reads the file again. Returns false if the file cannot be read,
	 * the content is empty in that case.
	 */
	bool reload();

	const string& operator[](unsigned int Index_iv) const { return Lines_C[Index_iv]; }

	unsigned numLines() const { return Lines_C.size(); }

	const vector<string>& lines() const { return Lines_C; }

    protected:

	const string Name_C;
	const bool remove_empty;

	vector<string> Lines_C;

    };


    /**
     * Shell style KEY="value" file as found in /etc/sysconfig.
     */
    class SysconfigFile : protected AsciiFile
    {
    public:

	SysconfigFile(const string& name);

	using AsciiFile::name;

	/**
	 * Looks up the key. Surrounding quotes of the value are removed.
	 */
	bool getValue(const string& key, string& value) const;

	/**
	 * Looks up the key and converts the value, "yes" and "no" are
	 * understood for bool.
	 */
	bool getValue(const string& key, bool& value) const;
	bool getValue(const string& key, unsigned& value) const;

	const map<string, string>& getAllValues() const { return values; }

    private:

	map<string, string> values;

    };

}


#endif
