/** \file   AramaicVocabulary.h
 *  \brief  Detection of distinctively Aramaic words in Hebrew-script text.
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


namespace AramaicVocabulary {


/** The number of distinct vocabulary hits at which the confidence saturates at 1.0.  A heuristic, not a derived value. */
constexpr unsigned SATURATION_MATCH_COUNT(3);


struct VocabularyMatch {
    bool found_;
    std::vector<std::string> words_; // In vocabulary order.
    double confidence_;
public:
    VocabularyMatch(): found_(false), confidence_(0.0) { }
};


//* \return The vocalised and unvocalised spellings of the vocabulary entries.
const std::vector<std::string> &GetVocabulary();


/** \brief Looks for literal occurrences of each vocabulary entry in "utf8_text".
 *  \note  Each entry counts at most once.  confidence_ = min(number of distinct hits / SATURATION_MATCH_COUNT, 1.0).
 */
VocabularyMatch MatchVocabulary(const std::string &utf8_text);


} // namespace AramaicVocabulary
