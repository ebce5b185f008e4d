/** \file   ScriptClassifier.h
 *  \brief  Bucketing of text into Hebrew, Greek and Imperial Aramaic script runs.
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
#include <cstdint>


namespace ScriptClassifier {


struct CodePointRange {
    uint32_t start_, end_; // Both inclusive.
public:
    constexpr CodePointRange(const uint32_t start, const uint32_t end): start_(start), end_(end) { }
    constexpr bool contains(const uint32_t code_point) const { return code_point >= start_ and code_point <= end_; }
};


enum Script { HEBREW_SCRIPT, GREEK_SCRIPT, IMPERIAL_ARAMAIC_SCRIPT, OTHER_SCRIPT };


//* \return The script group "code_point" belongs to.  Greek and Greek Extended form a single group.
Script GetScript(const uint32_t code_point);


struct ScriptMatches {
    std::vector<std::string> hebrew_matches_;
    std::vector<std::string> greek_matches_;
    std::vector<std::string> imperial_aramaic_matches_;
};


/** \brief Collects maximal runs of code points belonging to the same script group.
 *  \note  Runs are reported in storage order, irrespective of the rendering direction.  Any code point outside the
 *         current run's group, including whitespace and punctuation, terminates the run.  Every match is non-empty.
 */
ScriptMatches Scan(const std::string &utf8_text);


bool ContainsHebrew(const std::string &utf8_text);
bool ContainsGreek(const std::string &utf8_text);
bool ContainsImperialAramaic(const std::string &utf8_text);


//* \return The Hebrew runs joined by single spaces.
std::string ExtractHebrew(const std::string &utf8_text);


//* \return The Greek runs joined by single spaces.
std::string ExtractGreek(const std::string &utf8_text);


/** \return The Hebrew and Imperial Aramaic runs joined by single spaces if the text contains any Imperial Aramaic at all,
 *          otherwise the empty string.
 */
std::string ExtractAramaic(const std::string &utf8_text);


} // namespace ScriptClassifier
