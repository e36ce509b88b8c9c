/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2024 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <algorithm>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the lookup and get* methods.  Entries that precede the
 *  first section header belong to the unnamed section "".  Everything following an unquoted hash mark is a comment.
 *  Values may be enclosed in double quotes in order to preserve leading or trailing blanks or to embed hash marks.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;

    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        /** \note Later entries with the same name replace earlier ones. */
        void insert(const std::string &variable_name, const std::string &value);

        bool lookup(const std::string &variable_name, std::string * const s) const;
        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }

        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws  A std::runtime_error if the value cannot be converted to an unsigned integer. */
        unsigned getUnsigned(const std::string &variable_name, const unsigned &default_value) const;

        /** \brief   Retrieves a boolean value from a configuration file.
         *  \note    Valid values are "true", "false", "yes", "no", "on", "off", "1" and "0".
         *  \throws  A std::runtime_error if the value is not a valid boolean.
         */
        bool getBool(const std::string &variable_name, const bool default_value) const;

    private:
        const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }
    };

    typedef std::vector<Section>::const_iterator const_iterator;

private:
    std::string ini_file_name_;
    std::vector<Section> sections_;
    unsigned current_lineno_;

public:
    /** \throws  A std::runtime_error if the file can't be read or contains a syntax error. */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    const std::string &getFilename() const { return ini_file_name_; }

    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }
    inline bool sectionIsDefined(const std::string &section_name) const { return getSection(section_name) != sections_.cend(); }

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned &default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

private:
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
};
