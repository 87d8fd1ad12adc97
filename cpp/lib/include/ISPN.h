/** \file   ISPN.h
 *  \brief  Validation of International Standard Product Numbers, i.e. ISBN's, ISSN's, ISMN's and the EAN/UCC family
 *          of trade item codes.
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


#include <string>
#include <vector>


namespace ISPN {


enum Format { ISBN, ISSN, ISMN, EAN8, EAN13, EAN14, UCC12, SSCC };


// Why a candidate was rejected.  Anything but VALID means "invalid" for the boolean interface.
enum ValidationResult { VALID, EMPTY_INPUT, INVALID_CHARACTER, MISSING_PREFIX, WRONG_LENGTH, NOT_NUMERIC, CHECKSUM_MISMATCH };


struct FormatDescriptor {
    Format format_;
    std::string name_;
    unsigned length_;
    std::vector<unsigned> weights_; // Empty for ISBN which uses its own checksum.
    unsigned modulo_;
    unsigned subtract_;
};


// The characters that are removed from all candidates before validation.
const std::string FORMATTING_CHARS("-/ \t\n");


/** \return The immutable parameters of "format". */
const FormatDescriptor &GetFormatDescriptor(const Format format);


/** \return A canonical name like "EAN-13". */
std::string FormatToString(const Format format);


/** \brief Maps names like "ean-13", "EAN13", "ISSN" or "UPC" to the corresponding format.
 *  \return True if "format_name" was recognised, else false.
 */
bool StringToFormat(const std::string &format_name, Format * const format);


std::string ValidationResultToString(const ValidationResult validation_result);


/** \brief Removes hyphens, slashes, spaces, tabs and newlines. */
std::string StripFormattingChars(const std::string &candidate);


/** \brief Brings "candidate" into the form that will be validated for "format".
 *  \note  For ISBN, ISSN and ISMN the format name is removed (case-insensitively), ISSN's are upper-cased and for ISMN's
 *         the first 'M' is mapped to '3' so that the check digit can be calculated as for an EAN.  Normalising an
 *         already normalised string returns it unchanged.
 */
std::string Normalise(const Format format, const std::string &candidate);


/** \brief Calculates the check digit of "digits" according to "weights".
 *  \param digits    The digits to which the weights apply.  Characters beyond the weighted positions are ignored.
 *  \param weights   The multipliers for the leading positions of "digits".
 *  \param modulo    The modulus of the weighted sum.
 *  \param subtract  If non-zero the result is (subtract - sum % modulo) % modulo, otherwise sum % modulo.
 *  \return The check value (which may be 10 for modulo 11) or -1 if "digits" is too short or a weighted position is
 *          not a digit.
 */
int ComputeControlNumber(const std::string &digits, const std::vector<unsigned> &weights, const unsigned modulo,
                         const unsigned subtract);


/** \brief Checks the control character that follows the weighted positions of "digits".
 *  \note  An 'X' (either case) as the control character stands for 10.  If "weights" covers every position of "digits"
 *         the number is valid iff the weighted sum is divisible by "modulo".
 */
bool CheckControlNumber(const std::string &digits, const std::vector<unsigned> &weights, const unsigned modulo,
                        const unsigned subtract);


/** \brief Validates a generic EAN-style number.
 *  \param data      The candidate.  Formatting characters will be stripped.
 *  \param length    The required number of digits after stripping.
 *  \param weights   The weights passed on to CheckControlNumber().
 *  \return VALID or the reason for rejecting "data".
 */
ValidationResult ProcessWithReason(const std::string &data, const unsigned length, const std::vector<unsigned> &weights,
                                   const unsigned modulo = 10, const unsigned subtract = 10);


inline bool Process(const std::string &data, const unsigned length, const std::vector<unsigned> &weights,
                    const unsigned modulo = 10, const unsigned subtract = 10)
{
    return ProcessWithReason(data, length, weights, modulo, subtract) == VALID;
}


/** \return VALID if "candidate" is a valid number in the given "format", else the reason for rejecting it. */
ValidationResult Validate(const Format format, const std::string &candidate);


inline bool IsValid(const Format format, const std::string &candidate) {
    return Validate(format, candidate) == VALID;
}


/** \brief Validates a 10-digit ISBN.
 *  \note  The candidate must start with the literal "ISBN" and may only contain digits, spaces, hyphens and the letters of
 *         "ISBN" and 'X', e.g. "ISBN 0-306-40615-2".
 */
inline bool IsValidISBN(const std::string &isbn_candidate) { return IsValid(ISBN, isbn_candidate); }

// An ISSN like "0317-8471", optionally prefixed with "ISSN".
inline bool IsValidISSN(const std::string &issn_candidate) { return IsValid(ISSN, issn_candidate); }

// An ISMN like "ISMN M-2306-7118-7".
inline bool IsValidISMN(const std::string &ismn_candidate) { return IsValid(ISMN, ismn_candidate); }

inline bool IsValidEAN8(const std::string &ean_candidate) { return IsValid(EAN8, ean_candidate); }
inline bool IsValidEAN13(const std::string &ean_candidate) { return IsValid(EAN13, ean_candidate); }
inline bool IsValidEAN14(const std::string &ean_candidate) { return IsValid(EAN14, ean_candidate); }

// UCC-12 a.k.a. U.P.C.
inline bool IsValidUCC12(const std::string &ucc_candidate) { return IsValid(UCC12, ucc_candidate); }

// Serial Shipping Container Code.
inline bool IsValidSSCC(const std::string &sscc_candidate) { return IsValid(SSCC, sscc_candidate); }


/** \brief Converts a valid ISSN to the NNNN-NNNC format.
 *  \return False if "issn_candidate" is not a valid ISSN, in which case "normalised_issn" is not modified.
 */
bool NormaliseISSN(const std::string &issn_candidate, std::string * const normalised_issn);


/** \brief Converts a valid ISBN to its 10 bare characters.
 *  \return False if "isbn_candidate" is not a valid ISBN, in which case "normalised_isbn" is not modified.
 */
bool NormaliseISBN(const std::string &isbn_candidate, std::string * const normalised_isbn);


} // namespace ISPN
