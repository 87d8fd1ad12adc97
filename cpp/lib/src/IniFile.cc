/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "Compiler.h"
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment) {
    // Handle comment-only lines first:
    if (variable_name.empty() and value.empty()) {
        entries_.emplace_back("", "", comment);
        return;
    }

    if (unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: duplicate variable name \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    entries_.emplace_back(variable_name, value, comment);
}


void IniFile::Section::replace(const std::string &variable_name, const std::string &value, const std::string &comment) {
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value, comment);
    else {
        existing_entry->value_ = value;
        existing_entry->comment_ = comment;
    }
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        LOG_ERROR("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    bool retval;
    if (not StringUtil::ToBool(existing_entry->value_, &retval))
        LOG_ERROR("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
                  + existing_entry->value_ + "\")!");

    return retval;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


std::vector<std::string> IniFile::Section::getEntryNames() const {
    std::vector<std::string> entry_names;

    for (const auto &entry : entries_) {
        if (not entry.name_.empty())
            entry_names.emplace_back(entry.name_);
    }

    return entry_names;
}


IniFile::IniFile(const std::string &ini_file_name, const bool ignore_failed_includes)
    : ini_file_name_(ini_file_name), ignore_failed_includes_(ignore_failed_includes)
{
    processFile(ini_file_name_);
}


std::string IniFile::getCurrentPosition() const {
    return "line " + std::to_string(include_file_infos_.top().current_lineno_) + " in file \"" + getCurrentFile() + "\"";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on " + getCurrentPosition() + "!");

    current_section_name_ = line.substr(1, line.length() - 2);
    StringUtil::Trim(" \t", &current_section_name_);
    if (current_section_name_.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on " + getCurrentPosition() + "!");

    if (sectionIsDefined(current_section_name_))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + current_section_name_ + "\" on "
                                 + getCurrentPosition() + "!");
    sections_.emplace_back(current_section_name_);
}


namespace {


std::string GetDirname(const std::string &path) {
    const auto last_slash(path.rfind('/'));
    return last_slash == std::string::npos ? "" : path.substr(0, last_slash + 1);
}


bool FileExists(const std::string &path) {
    std::ifstream input(path);
    return input.good();
}


// Strips the surrounding double quotes off "quoted_text".  Returns false if "quoted_text" is not properly quoted.
bool Unquote(const std::string &quoted_text, std::string * const unquoted_text) {
    if (quoted_text.length() < 2 or quoted_text.front() != '"' or quoted_text.back() != '"')
        return false;

    *unquoted_text = quoted_text.substr(1, quoted_text.length() - 2);
    return true;
}


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores, periods, slashes or colons.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    std::string::const_iterator ch(possible_variable_name.begin());
    if (not StringUtil::IsAsciiLetter(*ch))
        return false;

    for (++ch; ch != possible_variable_name.end(); ++ch) {
        if (not StringUtil::IsAlphanumeric(*ch) and *ch != '-' and *ch != '_' and *ch != '.' and *ch != '/' and *ch != ':')
            return false;
    }

    return true;
}


std::string StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '\"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            if (inside_string_literal)
                continue;

            size_t comment_start_pos(std::distance(line->begin(), character));
            while (comment_start_pos > 0 and (*line)[comment_start_pos - 1] == ' ')
                --comment_start_pos;
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return *line;
        }
    }

    return *line;
}


} // unnamed namespace


void IniFile::processInclude(const std::string &line) {
    if (unlikely(line.find('=') != std::string::npos))
        throw std::runtime_error("in IniFile::processInclude: unexpected '=' on " + getCurrentPosition() + "!");

    std::string include_filename(line.substr(__builtin_strlen("include")));
    StringUtil::Trim(" \t", &include_filename);
    if (not include_filename.empty() and include_filename[0] == '"') {
        if (not Unquote(include_filename, &include_filename) or include_filename.empty())
            throw std::runtime_error("in IniFile::processInclude: garbled include file name on " + getCurrentPosition() + "!");
    }

    if (include_filename[0] != '/')
        include_filename = GetDirname(getCurrentFile()) + include_filename;

    if (not FileExists(include_filename) and ignore_failed_includes_) {
        LOG_WARNING("skipping missing include file \"" + include_filename + "\"!");
        return;
    }
    processFile(include_filename);
}


void IniFile::processInherit(const std::string &line, Section * const current_section) {
    std::string section_name;
    if (not StringUtil::StartsWith(line, "@inherit ")
        or not Unquote(StringUtil::TrimWhite(line.substr(__builtin_strlen("@inherit "))), &section_name)
        or section_name.empty())
        throw std::runtime_error("in IniFile::processInherit: malformed @inherit statement on " + getCurrentPosition() + "!");

    section_name = StringUtil::CStyleUnescape(section_name);
    const auto section(getSection(section_name));
    if (unlikely(section == sections_.cend()))
        throw std::runtime_error("in IniFile::processInherit: unknown section name \"" + section_name + "\" in @inherit statement on "
                                 + getCurrentPosition() + "!");

    // Entries that were inherited may be overridden by later entries.
    for (const auto &entry : *section) {
        if (not entry.name_.empty())
            current_section->replace(entry.name_, entry.value_, entry.comment_);
    }
}


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // Not a normal "variable = value" type line.
        const std::string trimmed_line(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" on "
                                     + getCurrentPosition() + "!");

        sections_.back().replace(trimmed_line, "true", comment);
        return;
    }

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (variable_name.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable name on " + getCurrentPosition() + "!");
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on "
                                 + getCurrentPosition() + "!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value on " + getCurrentPosition() + "!");

    if (value[0] == '"') { // double-quoted string
        if (not Unquote(value, &value))
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on " + getCurrentPosition() + "!");

        try {
            value = StringUtil::CStyleUnescape(value);
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on " + getCurrentPosition() + "! ("
                                     + std::string(x.what()) + ")");
        }
    }

    sections_.back().replace(variable_name, value, comment);
}


void IniFile::processFile(const std::string &filename) {
    std::ifstream ini_file(filename.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + filename + "\"! (" + std::string(std::strerror(errno)) + ")");

    include_file_infos_.push(IncludeFileInfo(filename));

    std::string buf;
    while (std::getline(ini_file, buf)) {
        ++getCurrentLineNo();
        std::string line(StringUtil::Trim(buf, " \t\r"));

        // Join lines as long as they end in a backslash:
        while (not line.empty() and line[line.length() - 1] == '\\') {
            line = StringUtil::Trim(line.substr(0, line.length() - 1), " \t");
            if (not std::getline(ini_file, buf))
                break;
            ++getCurrentLineNo();
            line += StringUtil::Trim(buf, " \t\r");
        }

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty()) {
            if (sections_.empty())
                sections_.emplace_back(Section(""));
            sections_.back().insert("", "", comment);
            continue;
        }

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else if (line.length() > 7 and line.substr(0, 7) == "include" and (line[7] == ' ' or line[7] == '\t'))
            processInclude(line);
        else if (StringUtil::StartsWith(line, "@inherit")) {
            if (unlikely(sections_.empty() or sections_.back().getSectionName().empty()))
                throw std::runtime_error("in IniFile::processFile: @inherit in global section on " + getCurrentPosition() + "!");
            processInherit(line, &(sections_.back()));
        } else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back(Section(""));
            processSectionEntry(line, comment);
        }
    }

    include_file_infos_.pop();
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return false;

    return section->lookup(variable_name, s);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getUnsigned(variable_name);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    return variableIsDefined(section_name, variable_name) ? getUnsigned(section_name, variable_name) : default_value;
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getBool(variable_name);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    return variableIsDefined(section_name, variable_name) ? getBool(section_name, variable_name) : default_value;
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.getSectionName());

    return section_names;
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return getSection(section_name) != sections_.cend();
}


bool IniFile::variableIsDefined(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    return section != sections_.cend() and section->hasEntry(variable_name);
}
