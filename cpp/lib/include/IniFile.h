/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
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
#pragma once


#include <algorithm>
#include <map>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  The file consists of "[section]" headers followed by "name = value" lines.  Everything following an unquoted hash
 *  mark is a comment.  Values may be double-quoted in order to preserve leading or trailing blanks or to embed a hash
 *  mark.  In order to extend a value over multiple lines, put backslashes just before the line ends on all but the
 *  last line.  Entries that precede the first section header belong to the section with the empty name.
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

        bool lookup(const std::string &variable_name, std::string * const s) const;
        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }

        /** \throws  A std::runtime_error if the variable is not found. */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws  A std::runtime_error if the variable is not found or is not a non-negative integer. */
        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \brief   Retrieves a boolean value.
         *  \note    The expected values are case insensitive and can be any of "true", "yes", "on", "false", "no" or
         *           "off".  Any other value results in an exception being thrown.
         */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

        /** \brief   Retrieves an enum value.
         *  \param   string_to_value_map  A mapping of allowable string constants to integer values.
         *  \note    The expected values are case sensitive.  The caller will have to use a static_cast to convert the
         *           int-encoded enum to a variable of the approriate enumerated type.  An unknown value results in an
         *           exception being thrown.
         */
        int getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map) const;
        int getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                    const int default_value) const;

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }
    private:
        void insert(const std::string &variable_name, const std::string &value, const std::string &ini_file_name,
                    const unsigned line_no);
    };

    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;
protected:
    Sections sections_;
    std::string ini_file_name_;
    unsigned current_line_no_;
public:
    /** \brief  Construct an IniFile based on the named file.
     *  \throws std::runtime_error if the file can't be read or contains a syntax error.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    inline const std::string &getFilename() const { return ini_file_name_; }

    bool hasSection(const std::string &section_name) const;

    //* \return A pointer to the named section or nullptr if there is no such section.
    const Section *getSection(const std::string &section_name) const;

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;
    int getEnum(const std::string &section_name, const std::string &variable_name,
                const std::map<std::string, int> &string_to_value_map) const;
    int getEnum(const std::string &section_name, const std::string &variable_name,
                const std::map<std::string, int> &string_to_value_map, const int default_value) const;
private:
    void processFile();
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
    const Section &getSectionOrThrow(const std::string &section_name, const std::string &variable_name) const;
};
