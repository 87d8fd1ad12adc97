/** \brief Test cases for the ISPN validation functions.
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
#include <string>
#include <vector>
#include "ISPN.h"
#include "UnitTest.h"


namespace {


const std::vector<ISPN::Format> ALL_FORMATS{ ISPN::ISBN,  ISPN::ISSN,  ISPN::ISMN,  ISPN::EAN8,
                                             ISPN::EAN13, ISPN::EAN14, ISPN::UCC12, ISPN::SSCC };


// Known good numbers, one per format.
const std::vector<std::pair<ISPN::Format, std::string>> VALID_SAMPLES{
    { ISPN::ISBN, "ISBN 0-306-40615-2" },   { ISPN::ISSN, "0317-8471" },         { ISPN::ISMN, "ISMN M-2306-7118-7" },
    { ISPN::EAN8, "96385074" },             { ISPN::EAN13, "4006381333931" },    { ISPN::EAN14, "10012345678902" },
    { ISPN::UCC12, "036000291452" },        { ISPN::SSCC, "106141411234567897" },
};


} // unnamed namespace


TEST(isbn) {
    CHECK_TRUE(ISPN::IsValidISBN("ISBN 0-306-40615-2"));
    CHECK_TRUE(ISPN::IsValidISBN("ISBN 0306406152"));
    CHECK_TRUE(ISPN::IsValidISBN("ISBN0306406152"));
    CHECK_TRUE(ISPN::IsValidISBN("ISBN 0-8044-2957-X"));
    CHECK_FALSE(ISPN::IsValidISBN("ISBN 0-306-40615-3"));
    CHECK_FALSE(ISPN::IsValidISBN("0-306-40615-2"));
    CHECK_FALSE(ISPN::IsValidISBN("isbn 0-306-40615-2"));
    CHECK_FALSE(ISPN::IsValidISBN("ISBN 0-306-40615-2/"));
    CHECK_FALSE(ISPN::IsValidISBN("ISBN 0-306-4061"));
    CHECK_FALSE(ISPN::IsValidISBN("ISBN 0-306-40615-23"));
    CHECK_FALSE(ISPN::IsValidISBN("ISBN X-306-40615-2"));
    CHECK_FALSE(ISPN::IsValidISBN(""));
}


TEST(isbnAllZeroes) {
    // The weighted sum of all zeroes is divisible by 11.
    CHECK_TRUE(ISPN::IsValidISBN("ISBN 0000000000"));
    CHECK_TRUE(ISPN::IsValidISBN("ISBN 0-00-000000-0"));
}


TEST(issn) {
    CHECK_TRUE(ISPN::IsValidISSN("0317-8471"));
    CHECK_TRUE(ISPN::IsValidISSN("03178471"));
    CHECK_TRUE(ISPN::IsValidISSN("ISSN 0317-8471"));
    CHECK_TRUE(ISPN::IsValidISSN("issn 0317-8471"));
    CHECK_TRUE(ISPN::IsValidISSN("2434-561X"));
    CHECK_TRUE(ISPN::IsValidISSN("2434-561x"));
    CHECK_TRUE(ISPN::IsValidISSN("0317/8471\n"));
    CHECK_FALSE(ISPN::IsValidISSN("0317-8472"));
    CHECK_FALSE(ISPN::IsValidISSN("0317-847"));
    CHECK_FALSE(ISPN::IsValidISSN("0317-84711"));
    CHECK_FALSE(ISPN::IsValidISSN("03A7-8471"));
    CHECK_FALSE(ISPN::IsValidISSN("2434-5610"));
    CHECK_FALSE(ISPN::IsValidISSN("0317-847X"));

    // An X in a weighted position counts as zero.
    CHECK_TRUE(ISPN::IsValidISSN("0X17-8470"));
    CHECK_TRUE(ISPN::IsValidISSN("X317-8471"));
    CHECK_TRUE(ISPN::IsValidISSN("0x17-8470"));
    CHECK_FALSE(ISPN::IsValidISSN("0X17-8471"));
    CHECK_EQ(ISPN::Validate(ISPN::ISSN, "0X17-847"), ISPN::WRONG_LENGTH);
}


TEST(ismn) {
    CHECK_TRUE(ISPN::IsValidISMN("ISMN M-2306-7118-7"));
    CHECK_TRUE(ISPN::IsValidISMN("M-2306-7118-7"));
    CHECK_TRUE(ISPN::IsValidISMN("ismn m 2306 7118 7"));
    CHECK_TRUE(ISPN::IsValidISMN("3230671187"));
    CHECK_FALSE(ISPN::IsValidISMN("ISMN M-2306-7118-8"));
    CHECK_FALSE(ISPN::IsValidISMN("ISMN M-2306-7118"));
    CHECK_FALSE(ISPN::IsValidISMN("ISMN 2306-7118-7"));
    CHECK_FALSE(ISPN::IsValidISMN("ISMN M-2306-M118-7"));
}


TEST(eanFamily) {
    CHECK_TRUE(ISPN::IsValidEAN8("96385074"));
    CHECK_TRUE(ISPN::IsValidEAN8("9638-5074"));
    CHECK_FALSE(ISPN::IsValidEAN8("96385075"));

    CHECK_TRUE(ISPN::IsValidEAN13("4006381333931"));
    CHECK_TRUE(ISPN::IsValidEAN13("400-6381 333931"));
    CHECK_TRUE(ISPN::IsValidEAN13("978-0-306-40615-7"));
    CHECK_FALSE(ISPN::IsValidEAN13("4006381333932"));

    CHECK_TRUE(ISPN::IsValidEAN14("10012345678902"));
    CHECK_FALSE(ISPN::IsValidEAN14("10012345678903"));

    CHECK_TRUE(ISPN::IsValidUCC12("036000291452"));
    CHECK_TRUE(ISPN::IsValidUCC12("0 36000 29145 2"));
    CHECK_FALSE(ISPN::IsValidUCC12("036000291453"));

    CHECK_TRUE(ISPN::IsValidSSCC("106141411234567897"));
    CHECK_TRUE(ISPN::IsValidSSCC("1 0614141 123456789 7"));
    CHECK_FALSE(ISPN::IsValidSSCC("106141411234567898"));
}


TEST(wrongDigitCounts) {
    CHECK_FALSE(ISPN::IsValidUCC12("03600029145"));
    CHECK_FALSE(ISPN::IsValidUCC12("0360002914520"));
    CHECK_FALSE(ISPN::IsValidSSCC("10614141123456789"));
    CHECK_FALSE(ISPN::IsValidSSCC("1061414112345678970"));
    CHECK_FALSE(ISPN::IsValidEAN8("0000000"));
    CHECK_FALSE(ISPN::IsValidEAN13("000000000000"));
    CHECK_FALSE(ISPN::IsValidEAN14("000000000000000"));
}


TEST(lettersAreRejected) {
    for (const auto &format : ALL_FORMATS) {
        CHECK_FALSE(ISPN::IsValid(format, "ABCDEFGHIJKLMNOPQR"));
        CHECK_FALSE(ISPN::IsValid(format, "12345678901234567Q"));
    }

    for (const auto &format_and_sample : VALID_SAMPLES) {
        std::string mutated_sample(format_and_sample.second);
        mutated_sample.back() = 'Q';
        CHECK_FALSE(ISPN::IsValid(format_and_sample.first, mutated_sample));
    }
}


TEST(validSamples) {
    for (const auto &format_and_sample : VALID_SAMPLES)
        CHECK_EQ(ISPN::Validate(format_and_sample.first, format_and_sample.second), ISPN::VALID);
}


TEST(singleDigitSubstitutions) {
    for (const auto &format_and_sample : VALID_SAMPLES) {
        const std::string &sample(format_and_sample.second);
        for (size_t pos(0); pos < sample.length(); ++pos) {
            if (sample[pos] < '0' or sample[pos] > '9')
                continue;

            for (char digit('0'); digit <= '9'; ++digit) {
                if (digit == sample[pos])
                    continue;
                std::string mutated_sample(sample);
                mutated_sample[pos] = digit;
                CHECK_FALSE(ISPN::IsValid(format_and_sample.first, mutated_sample));
            }
        }
    }
}


TEST(validationResults) {
    CHECK_EQ(ISPN::Validate(ISPN::ISBN, ""), ISPN::EMPTY_INPUT);
    CHECK_EQ(ISPN::Validate(ISPN::ISBN, "isbn 0-306-40615-2"), ISPN::INVALID_CHARACTER);
    CHECK_EQ(ISPN::Validate(ISPN::ISBN, "0-306-40615-2"), ISPN::MISSING_PREFIX);
    CHECK_EQ(ISPN::Validate(ISPN::ISBN, "ISBN 0-306-4061"), ISPN::WRONG_LENGTH);
    CHECK_EQ(ISPN::Validate(ISPN::ISBN, "ISBN X-306-40615-2"), ISPN::NOT_NUMERIC);
    CHECK_EQ(ISPN::Validate(ISPN::ISBN, "ISBN 0-306-40615-3"), ISPN::CHECKSUM_MISMATCH);

    CHECK_EQ(ISPN::Validate(ISPN::ISSN, "03A7-8471"), ISPN::NOT_NUMERIC);
    CHECK_EQ(ISPN::Validate(ISPN::ISSN, "0317-847"), ISPN::WRONG_LENGTH);
    CHECK_EQ(ISPN::Validate(ISPN::ISSN, "0317-8472"), ISPN::CHECKSUM_MISMATCH);

    CHECK_EQ(ISPN::Validate(ISPN::EAN13, "---"), ISPN::EMPTY_INPUT);
    CHECK_EQ(ISPN::Validate(ISPN::EAN13, "40063813339A1"), ISPN::NOT_NUMERIC);
    CHECK_EQ(ISPN::Validate(ISPN::EAN13, "123"), ISPN::WRONG_LENGTH);
    CHECK_EQ(ISPN::Validate(ISPN::EAN13, "4006381333932"), ISPN::CHECKSUM_MISMATCH);

    CHECK_EQ(ISPN::ValidationResultToString(ISPN::VALID), "valid");
    CHECK_EQ(ISPN::ValidationResultToString(ISPN::CHECKSUM_MISMATCH), "checksum mismatch");
}


TEST(normalise) {
    CHECK_EQ(ISPN::StripFormattingChars(" 400-6381/333931\t\n"), "4006381333931");
    CHECK_EQ(ISPN::Normalise(ISPN::ISBN, "ISBN 0-306-40615-2"), "0306406152");
    CHECK_EQ(ISPN::Normalise(ISPN::ISSN, "issn 2434-561x"), "2434561X");
    CHECK_EQ(ISPN::Normalise(ISPN::ISMN, "ISMN M-2306-7118-7"), "3230671187");
    CHECK_EQ(ISPN::Normalise(ISPN::EAN13, "ISBN 978-0"), "ISBN9780");

    // Format names are removed after the formatting characters, and repeatedly.
    CHECK_EQ(ISPN::Normalise(ISPN::ISSN, "IS-SN0317-8471"), "03178471");
    CHECK_EQ(ISPN::Normalise(ISPN::ISBN, "ISBNISBN0306406152"), "0306406152");
    CHECK_TRUE(ISPN::IsValidISSN("IS-SN0317-8471"));
    CHECK_TRUE(ISPN::IsValidISBN("ISBNISBN0306406152"));
}


TEST(normaliseIsIdempotent) {
    const std::vector<std::string> candidates{ "ISBN 0-306-40615-2", "issn 0317-8471", "ISMN M-2306-7118-7", "m 2306 7118 7",
                                               "IS SN0317-8471",     "ISISSNSN",       "ISISMNMN",           "MM12",
                                               " 400-6381/333931\n", "",               "isbnISBN0-306" };
    for (const auto &format : ALL_FORMATS) {
        for (const auto &candidate : candidates) {
            const std::string normalised_candidate(ISPN::Normalise(format, candidate));
            CHECK_EQ(ISPN::Normalise(format, normalised_candidate), normalised_candidate);
        }
    }
}


TEST(process) {
    const std::vector<unsigned> ean13_weights{ 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3 };
    CHECK_TRUE(ISPN::Process("4006381333931", 13, ean13_weights));
    CHECK_TRUE(ISPN::Process("4006381333931", 13, ean13_weights, 10, 10));
    CHECK_FALSE(ISPN::Process("4006381333931", 12, ean13_weights));
    CHECK_FALSE(ISPN::Process("4006381333931", 14, ean13_weights));

    // All zeroes pass the checksum, so only the length decides.
    for (unsigned length(1); length <= 20; ++length)
        CHECK_EQ(ISPN::Process(std::string(length, '0'), 13, ean13_weights), length == 13);

    CHECK_EQ(ISPN::ProcessWithReason("", 13, ean13_weights), ISPN::EMPTY_INPUT);
    CHECK_EQ(ISPN::ProcessWithReason("400638133393", 13, ean13_weights), ISPN::WRONG_LENGTH);
}


TEST(computeControlNumber) {
    const std::vector<unsigned> ean13_weights{ 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3 };
    CHECK_EQ(ISPN::ComputeControlNumber("400638133393", ean13_weights, 10, 10), 1);
    CHECK_EQ(ISPN::ComputeControlNumber("4006381333931", ean13_weights, 10, 10), 1);

    const std::vector<unsigned> issn_weights{ 8, 7, 6, 5, 4, 3, 2 };
    CHECK_EQ(ISPN::ComputeControlNumber("0317847", issn_weights, 11, 11), 1);
    CHECK_EQ(ISPN::ComputeControlNumber("2434561", issn_weights, 11, 11), 10);

    // Without "subtract" the remainder itself is the control number.
    CHECK_EQ(ISPN::ComputeControlNumber("400638133393", ean13_weights, 10, 0), 9);

    // "subtract" smaller than the remainder.
    CHECK_EQ(ISPN::ComputeControlNumber("9", std::vector<unsigned>{ 1 }, 10, 3), 4);

    CHECK_EQ(ISPN::ComputeControlNumber("40063813339", ean13_weights, 10, 10), -1);
    CHECK_EQ(ISPN::ComputeControlNumber("40063813339A", ean13_weights, 10, 10), -1);
}


TEST(checkControlNumber) {
    const std::vector<unsigned> issn_weights{ 8, 7, 6, 5, 4, 3, 2 };
    CHECK_TRUE(ISPN::CheckControlNumber("03178471", issn_weights, 11, 11));
    CHECK_TRUE(ISPN::CheckControlNumber("2434561X", issn_weights, 11, 11));
    CHECK_TRUE(ISPN::CheckControlNumber("2434561x", issn_weights, 11, 11));
    CHECK_FALSE(ISPN::CheckControlNumber("24345610", issn_weights, 11, 11));
    CHECK_FALSE(ISPN::CheckControlNumber("0317847", issn_weights, 11, 11));
    CHECK_FALSE(ISPN::CheckControlNumber("031784711", issn_weights, 11, 11));
    CHECK_FALSE(ISPN::CheckControlNumber("", issn_weights, 11, 11));

    // The weights cover every position including the check digit.
    const std::vector<unsigned> full_ean13_weights{ 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1, 3, 1 };
    CHECK_TRUE(ISPN::CheckControlNumber("4006381333931", full_ean13_weights, 10, 10));
    CHECK_FALSE(ISPN::CheckControlNumber("4006381333932", full_ean13_weights, 10, 10));
}


TEST(formats) {
    CHECK_EQ(ISPN::FormatToString(ISPN::EAN13), "EAN-13");
    CHECK_EQ(ISPN::FormatToString(ISPN::SSCC), "SSCC");
    CHECK_EQ(ISPN::GetFormatDescriptor(ISPN::UCC12).length_, 12u);
    CHECK_EQ(ISPN::GetFormatDescriptor(ISPN::SSCC).weights_.size(), 17u);

    for (const auto &format : ALL_FORMATS) {
        const ISPN::FormatDescriptor &descriptor(ISPN::GetFormatDescriptor(format));
        CHECK_EQ(descriptor.format_, format);
        if (format != ISPN::ISBN)
            CHECK_EQ(descriptor.weights_.size() + 1, descriptor.length_);
    }

    ISPN::Format format;
    CHECK_TRUE(ISPN::StringToFormat("ean-13", &format));
    CHECK_EQ(format, ISPN::EAN13);
    CHECK_TRUE(ISPN::StringToFormat("EAN8", &format));
    CHECK_EQ(format, ISPN::EAN8);
    CHECK_TRUE(ISPN::StringToFormat("upc", &format));
    CHECK_EQ(format, ISPN::UCC12);
    CHECK_TRUE(ISPN::StringToFormat("Issn", &format));
    CHECK_EQ(format, ISPN::ISSN);
    CHECK_FALSE(ISPN::StringToFormat("EAN-15", &format));
    CHECK_FALSE(ISPN::StringToFormat("", &format));
}


TEST(canonicalForms) {
    std::string normalised;
    CHECK_TRUE(ISPN::NormaliseISSN("issn 2434561x", &normalised));
    CHECK_EQ(normalised, "2434-561X");
    CHECK_TRUE(ISPN::NormaliseISSN("0317-8471", &normalised));
    CHECK_EQ(normalised, "0317-8471");
    CHECK_FALSE(ISPN::NormaliseISSN("0317-8472", &normalised));
    CHECK_EQ(normalised, "0317-8471");

    CHECK_TRUE(ISPN::NormaliseISBN("ISBN 0-8044-2957-X", &normalised));
    CHECK_EQ(normalised, "080442957X");
    CHECK_FALSE(ISPN::NormaliseISBN("ISBN 0-8044-2957-1", &normalised));
}


TEST_MAIN(ISPN)
