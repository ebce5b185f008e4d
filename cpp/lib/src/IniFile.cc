/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen
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
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "Compiler.h"
#include "FileUtil.h"
#include "StringUtil.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &ini_file_name,
                              const unsigned line_no)
{
    if (unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: duplicate variable name \"" + variable_name + "\" in section \""
                                 + section_name_ + "\" on line " + std::to_string(line_no) + " in file \"" + ini_file_name + "\"!");

    entries_.emplace_back(variable_name, value);
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("in IniFile::Section::getString: can't find \"" + variable_name + "\" in section \"" + section_name_
                                 + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const std::string value(getString(variable_name));

    unsigned number;
    if (not StringUtil::ToUnsigned(value, &number))
        throw std::runtime_error("in IniFile::Section::getUnsigned: invalid unsigned entry \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const std::string value(StringUtil::ASCIIToLower(getString(variable_name)));
    if (value == "true" or value == "yes" or value == "on")
        return true;
    if (value == "false" or value == "no" or value == "off")
        return false;

    throw std::runtime_error("in IniFile::Section::getBool: invalid boolean value \"" + value + "\" for \"" + variable_name
                             + "\" in section \"" + section_name_ + "\"!");
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


int IniFile::Section::getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map) const {
    const std::string value(getString(variable_name));
    const auto name_and_value(string_to_value_map.find(value));
    if (unlikely(name_and_value == string_to_value_map.cend()))
        throw std::runtime_error("in IniFile::Section::getEnum: invalid value \"" + value + "\" for \"" + variable_name
                                 + "\" in section \"" + section_name_ + "\"!");

    return name_and_value->second;
}


int IniFile::Section::getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                              const int default_value) const
{
    return hasEntry(variable_name) ? getEnum(variable_name, string_to_value_map) : default_value;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_line_no_(0) {
    processFile();
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on line " + std::to_string(current_line_no_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    std::string section_name(line.substr(1, line.length() - 2));
    StringUtil::Trim(" \t", &section_name);
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on line " + std::to_string(current_line_no_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    if (hasSection(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on line "
                                 + std::to_string(current_line_no_) + " in file \"" + ini_file_name_ + "\"!");
    sections_.emplace_back(section_name);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores and periods.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#' and not inside_string_literal) {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            line->resize(std::distance(line->begin(), character));
            return;
        }
    }
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos)
        throw std::runtime_error("in IniFile::processSectionEntry: missing equal sign on line " + std::to_string(current_line_no_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on line "
                                 + std::to_string(current_line_no_) + " in file \"" + ini_file_name_ + "\"!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value on line " + std::to_string(current_line_no_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on line "
                                     + std::to_string(current_line_no_) + " in file \"" + ini_file_name_ + "\"!");
        value = value.substr(1, value.length() - 2);
    }

    // Escaped hash marks have survived StripComment() with their backslashes:
    std::string::size_type escaped_hash_pos;
    while ((escaped_hash_pos = value.find("\\#")) != std::string::npos)
        value.erase(escaped_hash_pos, 1);

    if (sections_.empty())
        sections_.emplace_back("");
    sections_.back().insert(variable_name, value, ini_file_name_, current_line_no_);
}


void IniFile::processFile() {
    if (unlikely(not FileUtil::Exists(ini_file_name_)))
        throw std::runtime_error("in IniFile::processFile: file \"" + ini_file_name_ + "\" does not exist!");
    std::ifstream ini_file(ini_file_name_.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(std::strerror(errno))
                                 + ")");

    while (not ini_file.eof()) {
        std::string line;

        // read lines until newline character is not preceeded by a '\'
        bool continued_line(false);
        do {
            std::string buf;
            if (not std::getline(ini_file, buf))
                break;
            ++current_line_no_;
            line += StringUtil::Trim(buf, " \t\r");
            if (line.empty())
                break;

            continued_line = line[line.length() - 1] == '\\';
            if (continued_line)
                line = StringUtil::Trim(line.substr(0, line.length() - 1), " \t");
        } while (continued_line);

        StripComment(&line);
        StringUtil::Trim(" \t", &line);

        // skip blank and comment-only lines:
        if (line.empty())
            continue;

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else
            processSectionEntry(line);
    }
}


bool IniFile::hasSection(const std::string &section_name) const {
    return std::find(sections_.cbegin(), sections_.cend(), section_name) != sections_.cend();
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    return (section == sections_.cend()) ? nullptr : &*section;
}


const IniFile::Section &IniFile::getSectionOrThrow(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (unlikely(section == nullptr))
        throw std::runtime_error("in IniFile::getSectionOrThrow: no such section: \"" + section_name + "\"! (variable: \"" + variable_name
                                 + "\", file: \"" + ini_file_name_ + "\")");

    return *section;
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    if (section == nullptr)
        return false;

    return section->lookup(variable_name, s);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name, variable_name).getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const auto section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name, variable_name).getUnsigned(variable_name);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const auto section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getUnsigned(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name, variable_name).getBool(variable_name);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const auto section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getBool(variable_name, default_value);
}


int IniFile::getEnum(const std::string &section_name, const std::string &variable_name,
                     const std::map<std::string, int> &string_to_value_map) const
{
    return getSectionOrThrow(section_name, variable_name).getEnum(variable_name, string_to_value_map);
}


int IniFile::getEnum(const std::string &section_name, const std::string &variable_name,
                     const std::map<std::string, int> &string_to_value_map, const int default_value) const
{
    const auto section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getEnum(variable_name, string_to_value_map, default_value);
}
