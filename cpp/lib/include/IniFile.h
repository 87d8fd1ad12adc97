/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
 */

/*
 *  Copyright 2026 Universitätsbibliothek Tübingen
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <algorithm>
#include <stack>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the lookup and get* methods.  String constants can use
 *  C-style character backslash escapes like \\n.  If you want to embed a hash mark in a string you must preceede it with
 *  a single backslash.  In order to extend a string constant over multiple lines, put backslashes just before the line
 *  ends on all but the last line.
 *  Other files can be pulled in with 'include "path"', relative paths being resolved against the directory of the
 *  including file.  Entries in one section can be inherited by later sections by using a '@inherit "section_name"'
 *  directive.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
        inline bool empty() const { return name_.empty() and value_.empty() and comment_.empty(); }
    };

public:
    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;
        typedef std::vector<Entry>::iterator iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }
        Section() = default;
        Section(const Section &other) = default;

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const std::string &getSectionName() const { return section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        // \throws std::runtime_error if "variable_name" has already been defined in this section.
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        void replace(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \brief   Retrieves a string value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \return  The value of the string in the specified section.
         *  \note    If the variable is not defined in the section, the program aborts.
         */
        std::string getString(const std::string &variable_name) const;

        /** \brief   Retrieves a string value from a configuration file.
         *  \param   variable_name  The name of the section entry to read.
         *  \param   default_value  A default to return if the variable is not defined.
         *  \return  The value of the specified variable in the specified section, or "default_value" if it is not
         *           defined.
         */
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

        std::vector<std::string> getEntryNames() const;

        // \return An iterator referencing the found entry or end() if no matching enmtry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

public:
    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    std::string current_section_name_;

    struct IncludeFileInfo {
        std::string filename_;
        unsigned current_lineno_;

    public:
        explicit IncludeFileInfo(const std::string &filename): filename_(filename), current_lineno_(0) { }
    };
    std::stack<IncludeFileInfo> include_file_infos_;

    bool ignore_failed_includes_;

public:
    /** \brief  Construct an IniFile based on the named file.
     *  \param  ini_file_name           The name of the file to read.
     *  \param  ignore_failed_includes  If true, missing include files are silently skipped.
     *  \throws std::runtime_error if the file can't be read or contains a syntax error.
     */
    explicit IniFile(const std::string &ini_file_name, const bool ignore_failed_includes = false);

    inline const_iterator begin() const { return sections_.begin(); }
    inline const_iterator end() const { return sections_.end(); }

    /** \brief   Get the name of the file used to construct the object. */
    const std::string &getFilename() const { return ini_file_name_; }

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;

    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;

    bool getBool(const std::string &section_name, const std::string &variable_name) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

    // \note The unnamed global section, if present, is included.
    std::vector<std::string> getSections() const;

    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }

    bool sectionIsDefined(const std::string &section_name) const;
    bool variableIsDefined(const std::string &section_name, const std::string &variable_name) const;

private:
    inline unsigned &getCurrentLineNo() { return include_file_infos_.top().current_lineno_; }
    inline const std::string &getCurrentFile() const { return include_file_infos_.top().filename_; }
    std::string getCurrentPosition() const;

    void processSectionHeader(const std::string &line);
    void processInclude(const std::string &line);
    void processInherit(const std::string &line, Section * const current_section);
    void processSectionEntry(const std::string &line, const std::string &comment);
    void processFile(const std::string &filename);
};
