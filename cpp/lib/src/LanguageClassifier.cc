/** \file   LanguageClassifier.cc
 *  \brief  Implementation of the ancient language classifier.
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
#include "LanguageClassifier.h"
#include "AramaicPassages.h"
#include "AramaicVocabulary.h"
#include "ScriptClassifier.h"
#include "StringUtil.h"
#include "util.h"


namespace LanguageClassifier {


ClassificationResult Classify(const std::string &utf8_text) {
    return Classify(utf8_text, "", 0, 0);
}


ClassificationResult Classify(const std::string &utf8_text, const std::string &book, const unsigned chapter, const unsigned verse) {
    ClassificationResult result;
    if (utf8_text.empty())
        return result;

    const ScriptClassifier::ScriptMatches matches(ScriptClassifier::Scan(utf8_text));
    result.hebrew_count_  = matches.hebrew_matches_.size();
    result.greek_count_   = matches.greek_matches_.size();
    result.aramaic_count_ = matches.imperial_aramaic_matches_.size();

    const bool have_reference(not book.empty() and chapter > 0 and verse > 0);
    result.is_known_aramaic_passage_ = have_reference and AramaicPassageIndex::GetDefault().isAramaicPassage(book, chapter, verse);

    const AramaicVocabulary::VocabularyMatch vocabulary_match(AramaicVocabulary::MatchVocabulary(utf8_text));
    result.aramaic_words_ = vocabulary_match.words_;

    if (result.is_known_aramaic_passage_ and result.hebrew_count_ > 0) {
        result.language_ = ARAMAIC;
        result.confidence_ = KNOWN_PASSAGE_CONFIDENCE;
        result.matched_spans_ = matches.hebrew_matches_;
    } else if (result.aramaic_count_ > 0) {
        result.language_ = ARAMAIC;
        result.confidence_ = static_cast<double>(result.aramaic_count_)
                             / (result.hebrew_count_ + result.greek_count_ + result.aramaic_count_);
        result.matched_spans_ = matches.hebrew_matches_;
        result.matched_spans_.insert(result.matched_spans_.end(), matches.imperial_aramaic_matches_.cbegin(),
                                     matches.imperial_aramaic_matches_.cend());
    } else if (vocabulary_match.confidence_ > VOCABULARY_CONFIDENCE_THRESHOLD and result.hebrew_count_ > 0) {
        result.language_ = ARAMAIC;
        result.confidence_ = vocabulary_match.confidence_;
        result.matched_spans_ = matches.hebrew_matches_;
    } else if (result.hebrew_count_ > 0) {
        result.language_ = HEBREW;
        result.confidence_ = static_cast<double>(result.hebrew_count_) / (result.hebrew_count_ + result.greek_count_);
        result.matched_spans_ = matches.hebrew_matches_;
    } else if (result.greek_count_ > 0) {
        result.language_ = GREEK;
        result.confidence_ = static_cast<double>(result.greek_count_) / (result.hebrew_count_ + result.greek_count_);
        result.matched_spans_ = matches.greek_matches_;
    }

    if (logger->getMinimumLogLevel() >= Logger::LL_DEBUG)
        LOG_DEBUG(LanguageToString(result.language_) + " (" + std::to_string(result.confidence_) + ") for "
                  + std::to_string(utf8_text.size()) + " bytes of text");
    return result;
}


std::string LanguageToString(const Language language) {
    switch (language) {
    case HEBREW:
        return "hebrew";
    case GREEK:
        return "greek";
    case ARAMAIC:
        return "aramaic";
    case UNKNOWN:
        return "unknown";
    }

    LOG_ERROR("unknown language " + std::to_string(language) + "!");
}


Language StringToLanguage(const std::string &language_candidate) {
    const std::string language(StringUtil::ASCIIToLower(language_candidate));
    if (language == "hebrew")
        return HEBREW;
    if (language == "greek")
        return GREEK;
    if (language == "aramaic")
        return ARAMAIC;
    return UNKNOWN;
}


} // namespace LanguageClassifier
