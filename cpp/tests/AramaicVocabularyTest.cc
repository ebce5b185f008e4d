/** \brief Test cases for the Aramaic vocabulary matcher
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
#define BOOST_TEST_MODULE AramaicVocabulary
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include "AramaicVocabulary.h"


BOOST_AUTO_TEST_CASE(NoMatch) {
    const auto match(AramaicVocabulary::MatchVocabulary("בְּרֵאשִׁית בָּרָא אֱלֹהִים"));
    BOOST_CHECK(not match.found_);
    BOOST_CHECK(match.words_.empty());
    BOOST_CHECK_EQUAL(match.confidence_, 0.0);

    BOOST_CHECK(not AramaicVocabulary::MatchVocabulary("").found_);
}


BOOST_AUTO_TEST_CASE(SingleMatch) {
    const std::string &word(AramaicVocabulary::GetVocabulary()[0]);
    const auto match(AramaicVocabulary::MatchVocabulary("שָׁלוֹם " + word));
    BOOST_CHECK(match.found_);
    BOOST_REQUIRE_EQUAL(match.words_.size(), 1u);
    BOOST_CHECK_EQUAL(match.words_[0], word);
    BOOST_CHECK_CLOSE(match.confidence_, 1.0 / 3.0, 0.001);
}


BOOST_AUTO_TEST_CASE(RepeatedWordCountsOnce) {
    const auto match(AramaicVocabulary::MatchVocabulary("מלכא מלכא מלכא"));
    BOOST_CHECK_EQUAL(match.words_.size(), 1u);
    BOOST_CHECK_CLOSE(match.confidence_, 1.0 / 3.0, 0.001);
}


BOOST_AUTO_TEST_CASE(ThreeMatchesSaturate) {
    const auto match(AramaicVocabulary::MatchVocabulary("מלכא די אלה"));
    BOOST_REQUIRE_EQUAL(match.words_.size(), 3u);
    // Reported in vocabulary order:
    BOOST_CHECK_EQUAL(match.words_[0], "די");
    BOOST_CHECK_EQUAL(match.words_[1], "מלכא");
    BOOST_CHECK_EQUAL(match.words_[2], "אלה");
    BOOST_CHECK_EQUAL(match.confidence_, 1.0);
}


BOOST_AUTO_TEST_CASE(ConfidenceIsCapped) {
    const auto match(AramaicVocabulary::MatchVocabulary("מלכא די אלה קדם כען"));
    BOOST_CHECK_EQUAL(match.words_.size(), 5u);
    BOOST_CHECK_EQUAL(match.confidence_, 1.0);
}


BOOST_AUTO_TEST_CASE(VocabularyHasBothSpellings) {
    BOOST_CHECK_EQUAL(AramaicVocabulary::GetVocabulary().size(), 12u);
}
