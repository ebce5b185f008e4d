/** \file   LanguageClassifier.h
 *  \brief  Rule-based identification of the ancient language (Hebrew, Aramaic or Greek) of a passage.
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


namespace LanguageClassifier {


enum Language { HEBREW, GREEK, ARAMAIC, UNKNOWN };


// Confidence assigned when a canonical reference marks the passage as Aramaic.
constexpr double KNOWN_PASSAGE_CONFIDENCE(0.95);

// Vocabulary evidence has to exceed this confidence before it overrides the Hebrew default.
constexpr double VOCABULARY_CONFIDENCE_THRESHOLD(0.5);


struct ClassificationResult {
    Language language_;
    double confidence_;
    std::vector<std::string> matched_spans_;
    unsigned hebrew_count_;
    unsigned greek_count_;
    unsigned aramaic_count_; // Number of Imperial Aramaic runs.
    std::vector<std::string> aramaic_words_;
    bool is_known_aramaic_passage_;
public:
    ClassificationResult()
        : language_(UNKNOWN), confidence_(0.0), hebrew_count_(0), greek_count_(0), aramaic_count_(0), is_known_aramaic_passage_(false) { }
};


/** \brief Classifies "utf8_text" without a canonical reference. */
ClassificationResult Classify(const std::string &utf8_text);


/** \brief Classifies "utf8_text", consulting the Aramaic passage index for the given reference.
 *  \note  The reference is ignored if "book" is empty or "chapter" or "verse" is 0.  Rules, first match wins:
 *         1. known Aramaic passage and at least one Hebrew run: ARAMAIC with KNOWN_PASSAGE_CONFIDENCE
 *         2. Imperial Aramaic runs: ARAMAIC with the Imperial Aramaic share of all runs
 *         3. vocabulary confidence above VOCABULARY_CONFIDENCE_THRESHOLD and at least one Hebrew run: ARAMAIC
 *         4. Hebrew runs: HEBREW with the Hebrew share of Hebrew and Greek runs
 *         5. Greek runs: GREEK with the Greek share of Hebrew and Greek runs
 *         6. otherwise UNKNOWN with confidence 0
 */
ClassificationResult Classify(const std::string &utf8_text, const std::string &book, const unsigned chapter, const unsigned verse);


std::string LanguageToString(const Language language);


//* \return UNKNOWN for anything that is not "hebrew", "greek" or "aramaic" (case insensitive).
Language StringToLanguage(const std::string &language_candidate);


} // namespace LanguageClassifier
