/** \file   ControlNumberFormats.cc
 *  \brief  Implementation of class ControlNumberFormats.
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
#include "ControlNumberFormats.h"
#include <stdexcept>
#include "IniFile.h"
#include "StringUtil.h"
#include "util.h"


namespace {


const unsigned DEFAULT_SUBTRACT(10);


unsigned GetUnsignedOrThrow(const IniFile::Section &section, const std::string &entry_name) {
    std::string value;
    if (not section.lookup(entry_name, &value))
        throw std::runtime_error("missing \"" + entry_name + "\" in format section \"" + section.getSectionName() + "\"!");

    unsigned number;
    if (not StringUtil::ToUnsigned(value, &number))
        throw std::runtime_error("invalid \"" + entry_name + "\" value \"" + value + "\" in format section \""
                                 + section.getSectionName() + "\"!");

    return number;
}


std::vector<unsigned> ParseWeights(const IniFile::Section &section) {
    std::string weights_list;
    if (not section.lookup("weights", &weights_list))
        throw std::runtime_error("missing \"weights\" in format section \"" + section.getSectionName() + "\"!");

    std::vector<std::string> weights_as_strings;
    StringUtil::Split(weights_list, ',', &weights_as_strings, /* suppress_empty_components = */ false);

    std::vector<unsigned> weights;
    for (const auto &weight_as_string : weights_as_strings) {
        unsigned weight;
        if (not StringUtil::ToUnsigned(StringUtil::TrimWhite(weight_as_string), &weight))
            throw std::runtime_error("invalid weight \"" + weight_as_string + "\" in format section \"" + section.getSectionName()
                                     + "\"!");
        weights.emplace_back(weight);
    }

    return weights;
}


ControlNumberFormats::Format LoadFormat(const IniFile::Section &section) {
    const unsigned length(GetUnsignedOrThrow(section, "length"));
    if (length == 0)
        throw std::runtime_error("\"length\" must be positive in format section \"" + section.getSectionName() + "\"!");

    const std::vector<unsigned> weights(ParseWeights(section));
    if (weights.size() != length - 1 and weights.size() != length)
        throw std::runtime_error("format section \"" + section.getSectionName() + "\" has " + std::to_string(weights.size())
                                 + " weights but a length of " + std::to_string(length) + "!");

    const unsigned modulo(GetUnsignedOrThrow(section, "modulo"));
    if (modulo == 0)
        throw std::runtime_error("\"modulo\" must be positive in format section \"" + section.getSectionName() + "\"!");

    const unsigned subtract(section.hasEntry("subtract") ? GetUnsignedOrThrow(section, "subtract") : DEFAULT_SUBTRACT);

    return ControlNumberFormats::Format(section.getSectionName(), length, weights, modulo, subtract);
}


} // unnamed namespace


void ControlNumberFormats::loadFromIni(const IniFile &config) {
    for (const auto &section : config) {
        if (section.getSectionName().empty())
            continue;

        names_to_formats_map_[section.getSectionName()] = LoadFormat(section);
        LOG_DEBUG("loaded control number format \"" + section.getSectionName() + "\" from \"" + config.getFilename() + "\".");
    }
}


const ControlNumberFormats::Format &ControlNumberFormats::find(const std::string &format_name) const {
    const auto name_and_format(names_to_formats_map_.find(format_name));
    if (name_and_format == names_to_formats_map_.cend())
        throw std::runtime_error("unknown control number format \"" + format_name + "\"!");

    return name_and_format->second;
}


std::vector<std::string> ControlNumberFormats::getFormatNames() const {
    std::vector<std::string> format_names;
    for (const auto &name_and_format : names_to_formats_map_)
        format_names.emplace_back(name_and_format.first);

    return format_names;
}


ISPN::ValidationResult ControlNumberFormats::validate(const std::string &format_name, const std::string &candidate) const {
    const Format &format(find(format_name));
    const ISPN::ValidationResult validation_result(
        ISPN::ProcessWithReason(candidate, format.length_, format.weights_, format.modulo_, format.subtract_));
    if (validation_result != ISPN::VALID)
        LOG_DEBUG("rejected " + format_name + " candidate \"" + candidate + "\": " + ISPN::ValidationResultToString(validation_result));

    return validation_result;
}
