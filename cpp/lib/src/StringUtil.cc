/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
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

#include "StringUtil.h"
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include "Compiler.h"


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (std::string::iterator ch(s->begin()); ch != s->end(); ++ch)
        *ch = static_cast<char>(std::tolower(static_cast<unsigned char>(*ch)));

    return *s;
}


std::string ToLower(const std::string &s) {
    std::string result(s);
    return ToLower(&result);
}


std::string ToUpper(std::string * const s) {
    for (std::string::iterator ch(s->begin()); ch != s->end(); ++ch)
        *ch = static_cast<char>(std::toupper(static_cast<unsigned char>(*ch)));

    return *s;
}


std::string ToUpper(const std::string &s) {
    std::string result(s);
    return ToUpper(&result);
}


std::string RightTrim(const std::string &trim_set, std::string * const s) {
    size_t trimmed_length(s->length());
    while (trimmed_length > 0 and trim_set.find((*s)[trimmed_length - 1]) != std::string::npos)
        --trimmed_length;

    if (trimmed_length < s->length())
        s->resize(trimmed_length);

    return *s;
}


std::string LeftTrim(const std::string &trim_set, std::string * const s) {
    size_t no_of_leading_trim_chars(0);
    while (no_of_leading_trim_chars < s->length() and trim_set.find((*s)[no_of_leading_trim_chars]) != std::string::npos)
        ++no_of_leading_trim_chars;

    if (no_of_leading_trim_chars > 0)
        s->erase(0, no_of_leading_trim_chars);

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    RightTrim(trim_set, s);
    return LeftTrim(trim_set, s);
}


std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


// ToUnsigned -- convert a string to an unsigned number.
//
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, static_cast<int>(base)));
    const bool success((*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX));
    errno = 0;
    if (success)
        *n = static_cast<unsigned>(ul);

    return success;
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0)
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0)
    {
        *b = false;
        return true;
    }

    return false;
}


static std::string::size_type FindText(const std::string &haystack, const std::string &needle,
                                       const std::string::size_type start_pos, const bool ignore_case)
{
    if (not ignore_case)
        return haystack.find(needle, start_pos);

    if (haystack.length() < needle.length())
        return std::string::npos;
    for (std::string::size_type pos(start_pos); pos <= haystack.length() - needle.length(); ++pos) {
        if (::strncasecmp(haystack.c_str() + pos, needle.c_str(), needle.length()) == 0)
            return pos;
    }

    return std::string::npos;
}


std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s,
                           const bool global, const bool ignore_case)
{
    const std::string::size_type old_text_length(old_text.length());
    if (old_text_length == 0)
        return *s;

    std::string::size_type old_text_start_pos(FindText(*s, old_text, 0, ignore_case));
    while (old_text_start_pos != std::string::npos) {
        s->replace(old_text_start_pos, old_text_length, new_text);
        if (not global)
            break;
        old_text_start_pos = FindText(*s, old_text, old_text_start_pos + new_text.length(), ignore_case);
    }

    return *s;
}


std::string &RemoveChars(const std::string &remove_set, std::string * const s) {
    std::string result;
    result.reserve(s->size());

    for (std::string::const_iterator ch(s->begin()); ch != s->end(); ++ch) {
        if (remove_set.find(*ch) == std::string::npos)
            result += *ch;
    }

    return *s = result;
}


bool IsUnsignedNumber(const std::string &s) {
    if (s.empty())
        return false;
    for (std::string::const_iterator ch(s.begin()); ch != s.end(); ++ch)
        if (not IsDigit(*ch))
            return false;

    return true;
}


std::string CStyleUnescape(const std::string &escaped_text) {
    std::string unescaped_text;
    bool backslash_seen(false);
    for (const char ch : escaped_text) {
        if (not backslash_seen) {
            if (ch == '\\')
                backslash_seen = true;
            else
                unescaped_text += ch;
            continue;
        }

        switch (ch) {
        case 'n':
            unescaped_text += '\n';
            break;
        case 't':
            unescaped_text += '\t';
            break;
        case 'r':
            unescaped_text += '\r';
            break;
        case '\\':
        case '"':
        case '\'':
        case '#':
            unescaped_text += ch;
            break;
        default:
            throw std::runtime_error("in StringUtil::CStyleUnescape: unknown escape sequence \\" + std::string(1, ch) + "!");
        }
        backslash_seen = false;
    }

    if (unlikely(backslash_seen))
        throw std::runtime_error("in StringUtil::CStyleUnescape: trailing backslash!");

    return unescaped_text;
}


} // namespace StringUtil
