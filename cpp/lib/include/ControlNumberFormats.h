/** \file   ControlNumberFormats.h
 *  \brief  User-defined EAN-style number formats, loaded from an ini file.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <map>
#include <string>
#include <vector>
#include "ISPN.h"


class IniFile;


/** \class  ControlNumberFormats
 *  \brief  A set of number formats that are checked like EAN's but with user-supplied parameters.
 *
 *  Each named section of the ini file defines one format:
 *
 *      [ISIL-CHECK]
 *      length   = 9
 *      weights  = 2,1,2,1,2,1,2,1
 *      modulo   = 10
 *      subtract = 10
 *
 *  "subtract" is optional and defaults to 10.  The number of weights must be "length" - 1, in which case the last digit
 *  is the check digit, or "length", in which case the weighted sum over all digits must be divisible by "modulo".
 */
class ControlNumberFormats {
public:
    struct Format {
        std::string name_;
        unsigned length_;
        std::vector<unsigned> weights_;
        unsigned modulo_;
        unsigned subtract_;

    public:
        Format() = default;
        Format(const std::string &name, const unsigned length, const std::vector<unsigned> &weights, const unsigned modulo,
               const unsigned subtract)
            : name_(name), length_(length), weights_(weights), modulo_(modulo), subtract_(subtract) { }
    };

private:
    std::map<std::string, Format> names_to_formats_map_;

    void loadFromIni(const IniFile &config);
    const Format &find(const std::string &format_name) const;
public:
    // \throws std::runtime_error if a section does not contain a valid format definition.
    explicit ControlNumberFormats(const IniFile &config) { loadFromIni(config); }

    inline size_t size() const { return names_to_formats_map_.size(); }
    inline bool hasFormat(const std::string &format_name) const
        { return names_to_formats_map_.find(format_name) != names_to_formats_map_.cend(); }
    std::vector<std::string> getFormatNames() const;

    // \throws std::runtime_error if there is no format named "format_name".
    inline const Format &getFormat(const std::string &format_name) const { return find(format_name); }

    // \throws std::runtime_error if there is no format named "format_name".
    ISPN::ValidationResult validate(const std::string &format_name, const std::string &candidate) const;

    // \throws std::runtime_error if there is no format named "format_name".
    inline bool isValid(const std::string &format_name, const std::string &candidate) const
        { return validate(format_name, candidate) == ISPN::VALID; }
};
