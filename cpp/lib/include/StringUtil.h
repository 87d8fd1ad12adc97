/** \file    StringUtil.h
 *  \brief   Declarations of the string utility functions used by the ISPN library.
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


#include <string>
#include <cstring>
#include <strings.h>


/** \namespace  StringUtil
 *  \brief      Various string processing functions.
 */
namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Convert a string to lowercase (modifies its argument). */
std::string ToLower(std::string * const s);


/** \brief  Convert a string to lowercase (does not modify its agrument). */
std::string ToLower(const std::string &s);


/** \brief  Convert a string to uppercase (modifies its argument). */
std::string ToUpper(std::string * const s);


/** \brief  Convert a string to uppercase (does not modify its argument). */
std::string ToUpper(const std::string &s);


/** \brief   Remove all occurences of a set of characters from the end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string RightTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from the beginning of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string LeftTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   s         The string to trim (will not be modified).
 *  \param   trim_set  The set of characters to remove.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &s, const std::string &trim_set);


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s  The string to trim.
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(std::string * const s)
{
        return Trim(WHITE_SPACE, s);
}


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s  The string to trim (will not be modified).
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(const std::string &s)
{
        return Trim(s, WHITE_SPACE);
}


/** \brief  Convert a string to an unsigned number.
 *  \param  s     The string to convert.
 *  \param  n     Where to store the converted number.
 *  \param  base  The base of the number.
 *  \return True if the conversion succeeded, else false.
 *  \note   Leading whitespace is skipped but trailing garbage causes the conversion to fail.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \brief  Convert a string to a boolean.
 *  \param  value  "true", "yes", "on", "false", "no" or "off" (case-insensitive).
 *  \param  b      Where to store the converted value.
 *  \return True if "value" could be converted, else false.
 */
bool ToBool(const std::string &value, bool * const b);


/** \brief   Replaces one or all occurrences of "old_text" in "*s" with "new_text".
 *  \param   old_text     The text that should be replaced.
 *  \param   new_text     The text that should serve as replacement.
 *  \param   s            The string to work on.
 *  \param   global       If true all occurrences of "old_text" will be replaced with "new_text" otherwise
 *                        only the first occurrence will be replaced.
 *  \param   ignore_case  If true, "old_text" is matched in a case-insensitive manner.
 *  \return  A reference to the modified string.
 */
std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s,
                           const bool global = true, const bool ignore_case = false);


/** \brief   Removes all characters in a supplied set from a string.
 *  \param   remove_set  The "set" of characters that will be removed from "s".
 *  \param   s           A pointer to the string that is to be modified.
 *  \return  A reference to the modified string.
 */
std::string &RemoveChars(const std::string &remove_set, std::string * const s);


/** \brief   Checks whether "s" consists of decimal digits only.
 *  \param   s  The string to be tested.
 *  \return  True is "s" represents an unsigned integer number, false otherwise.
 *
 *  \note    Returns false for the empty string and for floating point numbers.
 */
bool IsUnsignedNumber(const std::string &s);


/** \brief  Replaces C-style backslash escapes like \n and \t in "escaped_text".
 *  \throws std::runtime_error if "escaped_text" contains an unknown escape or ends in a lone backslash.
 */
std::string CStyleUnescape(const std::string &escaped_text);


/** \brief  Split a string around a delimiter character.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  A list to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 */
template<typename InsertableContainer> unsigned Split(const std::string &source, const char delimiter,
                                                      InsertableContainer * const container,
                                                      const bool suppress_empty_components = true)
{
        container->clear();
        if (source.empty())
              return 0;

        unsigned count(0);
        std::string::size_type start(0);
        for (;;) {
                const std::string::size_type next_delimiter(source.find(delimiter, start));
                const std::string component(next_delimiter == std::string::npos ? source.substr(start)
                                                                                 : source.substr(start, next_delimiter - start));
                if (not suppress_empty_components or not component.empty()) {
                        container->insert(container->end(), component);
                        ++count;
                }

                if (next_delimiter == std::string::npos)
                        return count;
                start = next_delimiter + 1;
        }
}


/** \brief  Returns what isdigit would return in the "C" locale.
 *  \param  ch  The character to test.
 *  \return True if "ch" is an numeric character in the "C" locale, else false.
 */
inline bool IsDigit(const char ch)
{
        // Caution: the following code assumes a character set where 0-9 are consecutive, e.g. ANSI, ASCII
        //          or EBCDIC etc.
        return ch >= '0' and ch <= '9';
}


/** \brief  Returns what isalpha would return in the "C" locale. */
inline bool IsAsciiLetter(const char ch)
{
        // Caution: the following code assumes a character set where a-z and A-Z are consecutive, e.g. ANSI or ASCII but not EBCDIC.
        return (ch >= 'a' and ch <= 'z') or (ch >= 'A' and ch <= 'Z');
}


/** \brief  Returns what isalnum would return in the "C" locale. */
inline bool IsAlphanumeric(const char ch)
{
        return IsAsciiLetter(ch) or IsDigit(ch);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false)
{
        return prefix.empty()
                or (s.length() >= prefix.length()
                    and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                         : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


} // namespace StringUtil
