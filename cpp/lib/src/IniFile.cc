/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
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

#include "IniFile.h"
#include <stdexcept>
#include <cctype>
#include "Compiler.h"
#include "FileUtil.h"
#include "StringUtil.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    for (auto &entry : entries_) {
        if (entry.name_ == variable_name) {
            entry.value_ = value;
            return;
        }
    }

    entries_.emplace_back(variable_name, value);
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return false;

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    return existing_entry == end() ? default_value : existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    unsigned retval;
    if (unlikely(not StringUtil::ToUnsigned(existing_entry->value_, &retval)))
        throw std::runtime_error("in IniFile::Section::getUnsigned: invalid unsigned value in section \"" + section_name_ + "\", entry \""
                                 + variable_name + "\" (bad value is \"" + existing_entry->value_ + "\")!");

    return retval;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    bool retval;
    if (unlikely(not StringUtil::ToBool(existing_entry->value_, &retval)))
        throw std::runtime_error("in IniFile::Section::getBool: invalid boolean value in section \"" + section_name_ + "\", entry \""
                                 + variable_name + "\" (bad value is \"" + existing_entry->value_ + "\")!");

    return retval;
}


namespace {


// Removes an unquoted '#' and everything following it.  A backslash-escaped hash mark is kept.
void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (size_t i(0); i < line->length(); ++i) {
        const char ch((*line)[i]);
        if (ch == '"')
            inside_string_literal = not inside_string_literal;
        else if (ch == '#' and not inside_string_literal) {
            if (i > 0 and (*line)[i - 1] == '\\') {
                line->erase(i - 1, 1);
                --i;
                continue;
            }
            line->resize(i);
            return;
        }
    }
}


bool IsValidVariableName(const std::string &name) {
    if (name.empty() or not (std::isalpha(static_cast<unsigned char>(name[0])) or name[0] == '_'))
        return false;

    for (const char ch : name) {
        if (not std::isalnum(static_cast<unsigned char>(ch)) and ch != '_' and ch != '-' and ch != '.')
            return false;
    }

    return true;
}


} // unnamed namespace


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    std::vector<std::string> lines;
    if (unlikely(not FileUtil::ReadLines(ini_file_name, &lines)))
        throw std::runtime_error("in IniFile::IniFile: can't open \"" + ini_file_name + "\" for reading!");

    sections_.emplace_back("");
    for (auto line : lines) {
        ++current_lineno_;
        StripComment(&line);
        StringUtil::TrimWhite(&line);
        if (line.empty())
            continue;

        if (line[0] == '[')
            processSectionHeader(line);
        else
            processSectionEntry(line);
    }
}


void IniFile::processSectionHeader(const std::string &line) {
    if (unlikely(line.back() != ']'))
        throw std::runtime_error("in IniFile::processSectionHeader: unterminated section header on line " + std::to_string(current_lineno_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    const std::string section_name(StringUtil::TrimWhite(line.substr(1, line.length() - 2)));
    if (unlikely(section_name.empty()))
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on line " + std::to_string(current_lineno_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    if (unlikely(sectionIsDefined(section_name)))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    sections_.emplace_back(section_name);
}


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // A bare variable name is a boolean flag.
        if (unlikely(not IsValidVariableName(line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + line + "\" on line "
                                     + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

        sections_.back().insert(line, "true");
        return;
    }

    const std::string variable_name(StringUtil::TrimWhite(line.substr(0, equal_sign)));
    if (unlikely(not IsValidVariableName(variable_name)))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    std::string value(StringUtil::TrimWhite(line.substr(equal_sign + 1)));
    if (not value.empty() and value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value.back() != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on line " + std::to_string(current_lineno_)
                                     + " in file \"" + ini_file_name_ + "\"!");
        value = value.substr(1, value.length() - 2);
    }

    sections_.back().insert(variable_name, value);
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    return section != end() and section->lookup(variable_name, s);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const auto section(getSection(section_name));
    return section == end() ? default_value : section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned &default_value) const {
    const auto section(getSection(section_name));
    return section == end() ? default_value : section->getUnsigned(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const auto section(getSection(section_name));
    return section == end() ? default_value : section->getBool(variable_name, default_value);
}
