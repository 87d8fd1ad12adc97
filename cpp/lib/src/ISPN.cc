/** \file   ISPN.cc
 *  \brief  Implementation of the validation functions for International Standard Product Numbers.
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
#include "ISPN.h"
#include "Compiler.h"
#include "StringUtil.h"
#include "util.h"


namespace ISPN {


namespace {


const std::vector<FormatDescriptor> &GetFormatDescriptors() {
    // Must be in the same order as the Format enum!
    static const std::vector<FormatDescriptor> format_descriptors{
        { ISBN, "ISBN", 10, {}, 11, 0 },
        { ISSN, "ISSN", 8, { 8, 7, 6, 5, 4, 3, 2 }, 11, 11 },
        { ISMN, "ISMN", 10, { 3, 1, 3, 1, 3, 1, 3, 1, 3 }, 10, 10 },
        { EAN8, "EAN-8", 8, { 3, 1, 3, 1, 3, 1, 3 }, 10, 10 },
        { EAN13, "EAN-13", 13, { 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3 }, 10, 10 },
        { EAN14, "EAN-14", 14, { 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3 }, 10, 10 },
        { UCC12, "UCC-12", 12, { 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3 }, 10, 10 },
        { SSCC, "SSCC", 18, { 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3 }, 10, 10 },
    };

    return format_descriptors;
}


// Removes "text" case-insensitively until no occurrence is left.
void RemoveAll(const std::string &text, std::string * const s) {
    for (;;) {
        const auto original_length(s->length());
        StringUtil::ReplaceString(text, "", s, /* global = */ true, /* ignore_case = */ true);
        if (s->length() == original_length)
            return;
    }
}


// \return The value of a control character or -1 if "ch" is not a valid control character.
int ControlCharToValue(const char ch) {
    if (StringUtil::IsDigit(ch))
        return ch - '0';
    if (ch == 'X' or ch == 'x')
        return 10;
    return -1;
}


const std::string ISBN_CHARS("0123456789 IXSBN-");


ValidationResult ValidateISBN(const std::string &isbn_candidate) {
    if (isbn_candidate.find_first_not_of(ISBN_CHARS) != std::string::npos)
        return INVALID_CHARACTER;

    if (not StringUtil::StartsWith(isbn_candidate, "ISBN"))
        return MISSING_PREFIX;

    const std::string isbn(Normalise(ISBN, isbn_candidate));
    if (isbn.length() != 10)
        return WRONG_LENGTH;

    for (unsigned i(0); i < 9; ++i) {
        if (not StringUtil::IsDigit(isbn[i]))
            return NOT_NUMERIC;
    }
    if (not StringUtil::IsDigit(isbn[9]) and isbn[9] != 'X')
        return NOT_NUMERIC;

    // A valid ISBN has a weighted sum that is divisible by 11 once the check character has been added in.
    unsigned sum(0);
    for (unsigned i(0); i < 9; ++i)
        sum += (isbn[i] - '0') * (10 - i);
    sum += (isbn[9] == 'X') ? 10 : isbn[9] - '0';

    return (sum % 11 == 0) ? VALID : CHECKSUM_MISMATCH;
}


ValidationResult ValidateISSN(const std::string &issn_candidate) {
    const std::string issn(Normalise(ISSN, issn_candidate));

    // X's count as zeroes in the weighted positions and as 10 in the check position.
    std::string issn_digits(issn);
    StringUtil::ReplaceString("X", "0", &issn_digits);

    if (not StringUtil::IsUnsignedNumber(issn_digits))
        return NOT_NUMERIC;
    if (issn.length() != 8)
        return WRONG_LENGTH;

    const FormatDescriptor &descriptor(GetFormatDescriptor(ISSN));
    const int control_number(
        ComputeControlNumber(issn_digits, descriptor.weights_, descriptor.modulo_, descriptor.subtract_));
    return (control_number == ControlCharToValue(issn.back())) ? VALID : CHECKSUM_MISMATCH;
}


ValidationResult ValidateISMN(const std::string &ismn_candidate) {
    const std::string ismn(Normalise(ISMN, ismn_candidate));
    if (not StringUtil::IsUnsignedNumber(ismn))
        return NOT_NUMERIC;
    if (ismn.length() != 10)
        return WRONG_LENGTH;

    const FormatDescriptor &descriptor(GetFormatDescriptor(ISMN));
    return CheckControlNumber(ismn, descriptor.weights_, descriptor.modulo_, descriptor.subtract_) ? VALID : CHECKSUM_MISMATCH;
}


} // unnamed namespace


const FormatDescriptor &GetFormatDescriptor(const Format format) {
    const auto &format_descriptors(GetFormatDescriptors());
    if (unlikely(static_cast<size_t>(format) >= format_descriptors.size()))
        LOG_ERROR("unknown format " + std::to_string(format) + "!");

    return format_descriptors[format];
}


std::string FormatToString(const Format format) {
    return GetFormatDescriptor(format).name_;
}


bool StringToFormat(const std::string &format_name, Format * const format) {
    std::string canonical_name(StringUtil::ToUpper(format_name));
    StringUtil::RemoveChars("-_ ", &canonical_name);

    if (canonical_name == "UPC" or canonical_name == "UPCA") {
        *format = UCC12;
        return true;
    }

    for (const auto &descriptor : GetFormatDescriptors()) {
        std::string descriptor_name(descriptor.name_);
        if (StringUtil::RemoveChars("-", &descriptor_name) == canonical_name) {
            *format = descriptor.format_;
            return true;
        }
    }

    return false;
}


std::string ValidationResultToString(const ValidationResult validation_result) {
    switch (validation_result) {
    case VALID:
        return "valid";
    case EMPTY_INPUT:
        return "empty input";
    case INVALID_CHARACTER:
        return "invalid character";
    case MISSING_PREFIX:
        return "missing prefix";
    case WRONG_LENGTH:
        return "wrong length";
    case NOT_NUMERIC:
        return "not numeric";
    case CHECKSUM_MISMATCH:
        return "checksum mismatch";
    }

    LOG_ERROR("unknown validation result " + std::to_string(validation_result) + "!");
}


std::string StripFormattingChars(const std::string &candidate) {
    std::string stripped_candidate(candidate);
    return StringUtil::RemoveChars(FORMATTING_CHARS, &stripped_candidate);
}


std::string Normalise(const Format format, const std::string &candidate) {
    std::string normalised_candidate(StripFormattingChars(candidate));

    switch (format) {
    case ISBN:
        RemoveAll("ISBN", &normalised_candidate);
        break;
    case ISSN:
        StringUtil::ToUpper(&normalised_candidate);
        RemoveAll("ISSN", &normalised_candidate);
        break;
    case ISMN:
        RemoveAll("ISMN", &normalised_candidate);
        if (not normalised_candidate.empty() and (normalised_candidate[0] == 'M' or normalised_candidate[0] == 'm'))
            normalised_candidate[0] = '3';
        break;
    default:
        break;
    }

    return normalised_candidate;
}


int ComputeControlNumber(const std::string &digits, const std::vector<unsigned> &weights, const unsigned modulo,
                         const unsigned subtract)
{
    if (unlikely(modulo == 0))
        LOG_ERROR("modulo must not be zero!");

    if (digits.length() < weights.size())
        return -1;

    unsigned sum(0);
    for (unsigned i(0); i < weights.size(); ++i) {
        if (not StringUtil::IsDigit(digits[i]))
            return -1;
        sum += (digits[i] - '0') * weights[i];
    }

    const int remainder(static_cast<int>(sum % modulo));
    if (subtract == 0)
        return remainder;

    // "subtract" may be less than "remainder" for custom parameters.
    int control_number((static_cast<int>(subtract) - remainder) % static_cast<int>(modulo));
    if (control_number < 0)
        control_number += static_cast<int>(modulo);

    return control_number;
}


bool CheckControlNumber(const std::string &digits, const std::vector<unsigned> &weights, const unsigned modulo,
                        const unsigned subtract)
{
    if (digits.empty())
        return false;

    if (weights.size() == digits.length()) {
        if (unlikely(modulo == 0))
            LOG_ERROR("modulo must not be zero!");

        unsigned sum(0);
        for (unsigned i(0); i < digits.length() - 1; ++i) {
            if (not StringUtil::IsDigit(digits[i]))
                return false;
            sum += (digits[i] - '0') * weights[i];
        }
        const int last_value(ControlCharToValue(digits.back()));
        if (last_value == -1)
            return false;
        sum += static_cast<unsigned>(last_value) * weights.back();

        return sum % modulo == 0;
    }

    if (weights.size() + 1 != digits.length())
        return false;

    const int control_number(ComputeControlNumber(digits, weights, modulo, subtract));
    if (control_number == -1)
        return false;

    return control_number == ControlCharToValue(digits.back());
}


ValidationResult ProcessWithReason(const std::string &data, const unsigned length, const std::vector<unsigned> &weights,
                                   const unsigned modulo, const unsigned subtract)
{
    const std::string digits(StripFormattingChars(data));
    if (digits.empty())
        return EMPTY_INPUT;
    if (not StringUtil::IsUnsignedNumber(digits))
        return NOT_NUMERIC;
    if (digits.length() != length)
        return WRONG_LENGTH;

    return CheckControlNumber(digits, weights, modulo, subtract) ? VALID : CHECKSUM_MISMATCH;
}


ValidationResult Validate(const Format format, const std::string &candidate) {
    ValidationResult validation_result;
    if (candidate.empty())
        validation_result = EMPTY_INPUT;
    else if (format == ISBN)
        validation_result = ValidateISBN(candidate);
    else if (format == ISSN)
        validation_result = ValidateISSN(candidate);
    else if (format == ISMN)
        validation_result = ValidateISMN(candidate);
    else {
        const FormatDescriptor &descriptor(GetFormatDescriptor(format));
        validation_result = ProcessWithReason(candidate, descriptor.length_, descriptor.weights_, descriptor.modulo_,
                                              descriptor.subtract_);
    }

    if (validation_result != VALID)
        LOG_DEBUG("rejected " + FormatToString(format) + " candidate \"" + candidate + "\": "
                  + ValidationResultToString(validation_result));

    return validation_result;
}


bool NormaliseISSN(const std::string &issn_candidate, std::string * const normalised_issn) {
    if (Validate(ISSN, issn_candidate) != VALID)
        return false;

    const std::string issn(Normalise(ISSN, issn_candidate));
    *normalised_issn = issn.substr(0, 4) + '-' + issn.substr(4, 4);
    return true;
}


bool NormaliseISBN(const std::string &isbn_candidate, std::string * const normalised_isbn) {
    if (Validate(ISBN, isbn_candidate) != VALID)
        return false;

    *normalised_isbn = Normalise(ISBN, isbn_candidate);
    return true;
}


} // namespace ISPN
