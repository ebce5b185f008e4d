/** \brief Test cases for JsonTranslationLoader
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
#define BOOST_TEST_MODULE JsonTranslationLoader
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include "JsonTranslationLoader.h"


namespace {


TranslationInfo MakeInfo(const std::string &id, const std::string &file) {
    return TranslationInfo(id, id, id, file, Versification::ENGLISH);
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(NestedDocument) {
    JsonTranslationLoader loader("data");
    const auto table(loader.load(MakeInfo("kjv", "kjv-sample.json")));
    BOOST_REQUIRE(table != nullptr);
    BOOST_CHECK_EQUAL(table->getTranslationId(), "kjv");
    BOOST_CHECK_EQUAL(table->getBookCount(), 3u);
    BOOST_CHECK_EQUAL(table->getVerseCount(), 5u); // The empty Genesis 1:3 is skipped.

    std::string text;
    BOOST_CHECK(table->lookup("genesis", 1, 1, &text));
    BOOST_CHECK_EQUAL(text, "In the beginning God created the heaven and the earth.");
    BOOST_CHECK(not table->lookup("genesis", 1, 3, &text));

    // Chapter and verse numbers given as strings:
    BOOST_CHECK(table->lookup("1-samuel", 3, 4, &text));
    BOOST_CHECK(table->hasBook("psalms"));
    BOOST_CHECK_EQUAL(table->getHighestVerseNumber("psalms", 3), 2u);
    BOOST_CHECK_EQUAL(table->getHighestVerseNumber("psalms", 4), 0u);
}


BOOST_AUTO_TEST_CASE(FlatDocument) {
    JsonTranslationLoader loader("data");
    const auto table(loader.load(MakeInfo("web", "flat-sample.json")));
    BOOST_CHECK_EQUAL(table->getVerseCount(), 4u);

    std::string text;
    BOOST_CHECK(table->lookup("1-samuel", 3, 4, &text));
    BOOST_CHECK_EQUAL(text, "Then the LORD called Samuel, and he said, Here I am!");
    BOOST_CHECK(table->lookup("song-of-solomon", 1, 1, &text));
    BOOST_CHECK(table->lookup("john", 1, 1, &text));
    BOOST_CHECK(not table->hasBook("psalms"));
}


BOOST_AUTO_TEST_CASE(Errors) {
    JsonTranslationLoader loader("data");
    BOOST_CHECK_THROW(loader.load(MakeInfo("missing", "no-such-file.json")), std::runtime_error);
    BOOST_CHECK_THROW(loader.load(MakeInfo("malformed", "malformed.json")), std::runtime_error);
    BOOST_CHECK_THROW(loader.load(MakeInfo("bad-key", "bad-key.json")), std::runtime_error);
}


BOOST_AUTO_TEST_CASE(ParseDocument) {
    TranslationTable table("test");
    JsonTranslationLoader::ParseDocument(nlohmann::json::parse(R"({"books": [{"id": "1-kings", "chapters": [)"
                                                               R"({"chapter": 2, "verses": [{"verse": 3, "text": "x"}]}]}]})"),
                                         &table);
    std::string text;
    BOOST_CHECK(table.lookup("1-kings", 2, 3, &text));
    BOOST_CHECK_EQUAL(text, "x");

    BOOST_CHECK_THROW(JsonTranslationLoader::ParseDocument(nlohmann::json::parse("[1, 2]"), &table), std::runtime_error);
    BOOST_CHECK_THROW(JsonTranslationLoader::ParseDocument(nlohmann::json::parse(R"({"genesis-1-1": 17})"), &table),
                      std::runtime_error);
}


BOOST_AUTO_TEST_CASE(VerseNumbersOutOfRange) {
    TranslationTable table("test");
    BOOST_CHECK_THROW(JsonTranslationLoader::ParseDocument(nlohmann::json::parse(R"({"books": [{"id": "genesis", "chapters": [)"
                                                                                 R"({"chapter": 1, "verses": [{"verse": 4294967297, "text": "x"}]}]}]})"),
                                                           &table),
                      std::runtime_error);
    BOOST_CHECK_THROW(JsonTranslationLoader::ParseDocument(nlohmann::json::parse(R"({"books": [{"id": "genesis", "chapters": [)"
                                                                                 R"({"chapter": "4294967296", "verses": []}]}]})"),
                                                           &table),
                      std::runtime_error);
    BOOST_CHECK_THROW(JsonTranslationLoader::ParseDocument(nlohmann::json::parse(R"({"books": [{"id": "genesis", "chapters": [)"
                                                                                 R"({"chapter": -1, "verses": []}]}]})"),
                                                           &table),
                      std::runtime_error);
    BOOST_CHECK_EQUAL(table.getVerseCount(), 0u);
}
