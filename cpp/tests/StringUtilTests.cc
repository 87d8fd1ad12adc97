/** \brief Test cases for the StringUtil functions used by the validators and the config file parser.
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
#include <stdexcept>
#include <string>
#include <vector>
#include "StringUtil.h"
#include "UnitTest.h"


TEST(ReplaceString) {
    std::string s("isbnISBN0306");
    StringUtil::ReplaceString("ISBN", "", &s, /* global = */ true, /* ignore_case = */ true);
    CHECK_EQ(s, "0306");

    s = "isbnISBN0306";
    StringUtil::ReplaceString("ISBN", "", &s);
    CHECK_EQ(s, "isbn0306");

    s = "a-b-c";
    StringUtil::ReplaceString("-", "+", &s, /* global = */ false);
    CHECK_EQ(s, "a+b-c");

    s = "aaa";
    StringUtil::ReplaceString("a", "aa", &s);
    CHECK_EQ(s, "aaaaaa");
}


TEST(RemoveChars) {
    std::string s(" 400-6381/333931\t\n");
    CHECK_EQ(StringUtil::RemoveChars("-/ \t\n", &s), "4006381333931");
    CHECK_EQ(s, "4006381333931");
}


TEST(Trim) {
    CHECK_EQ(StringUtil::TrimWhite("  \tabc \n"), "abc");
    CHECK_EQ(StringUtil::Trim("xxabcxx", "x"), "abc");
    CHECK_EQ(StringUtil::TrimWhite("   "), "");
}


TEST(ToUnsigned) {
    unsigned n;
    CHECK_TRUE(StringUtil::ToUnsigned("42", &n));
    CHECK_EQ(n, 42u);
    CHECK_TRUE(StringUtil::ToUnsigned(" 7", &n));
    CHECK_EQ(n, 7u);
    CHECK_FALSE(StringUtil::ToUnsigned("", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("-1", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("12a", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("99999999999", &n));
}


TEST(ToBool) {
    bool b(false);
    CHECK_TRUE(StringUtil::ToBool("Yes", &b));
    CHECK_TRUE(b);
    CHECK_TRUE(StringUtil::ToBool("off", &b));
    CHECK_FALSE(b);
    CHECK_FALSE(StringUtil::ToBool("maybe", &b));
}


TEST(IsUnsignedNumber) {
    CHECK_TRUE(StringUtil::IsUnsignedNumber("0123456789"));
    CHECK_FALSE(StringUtil::IsUnsignedNumber(""));
    CHECK_FALSE(StringUtil::IsUnsignedNumber("12X"));
    CHECK_FALSE(StringUtil::IsUnsignedNumber("1.5"));
}


TEST(CStyleUnescape) {
    CHECK_EQ(StringUtil::CStyleUnescape("a\\tb\\nc\\\\"), "a\tb\nc\\");
    CHECK_EQ(StringUtil::CStyleUnescape("\\#\\\""), "#\"");
    CHECK_THROWS(StringUtil::CStyleUnescape("\\q"), std::runtime_error);
    CHECK_THROWS(StringUtil::CStyleUnescape("abc\\"), std::runtime_error);
}


TEST(Split) {
    std::vector<std::string> components;
    CHECK_EQ(StringUtil::Split("3,1,,3", ',', &components), 3u);
    CHECK_EQ(components.size(), 3u);
    CHECK_EQ(components[2], "3");

    CHECK_EQ(StringUtil::Split("3,1,,3", ',', &components, /* suppress_empty_components = */ false), 4u);
    CHECK_TRUE(components[2].empty());

    CHECK_EQ(StringUtil::Split("", ',', &components), 0u);
    CHECK_TRUE(components.empty());
}


TEST(StartsWith) {
    CHECK_TRUE(StringUtil::StartsWith("ISBN 0-306", "ISBN"));
    CHECK_FALSE(StringUtil::StartsWith("isbn 0-306", "ISBN"));
    CHECK_TRUE(StringUtil::StartsWith("isbn 0-306", "ISBN", /* ignore_case = */ true));
    CHECK_FALSE(StringUtil::StartsWith("ISB", "ISBN"));
    CHECK_TRUE(StringUtil::StartsWith("anything", ""));
}


TEST(ToUpper) {
    CHECK_EQ(StringUtil::ToUpper("issn 2434-561x"), "ISSN 2434-561X");
    CHECK_EQ(StringUtil::ToLower("ISMN M"), "ismn m");
}


TEST_MAIN(StringUtil)
