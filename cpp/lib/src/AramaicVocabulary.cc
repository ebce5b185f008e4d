/** \file   AramaicVocabulary.cc
 *  \brief  Implementation of the Aramaic vocabulary matcher.
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
#include "AramaicVocabulary.h"
#include <algorithm>


namespace AramaicVocabulary {


const std::vector<std::string> &GetVocabulary() {
    static const std::vector<std::string> vocabulary{
        "דִּי", "די",         // relative particle "which, that"
        "מַלְכָּא", "מלכא",   // "the king"
        "אֱלָהּ", "אלה",      // "God"
        "קֳדָם", "קדם",       // "before"
        "כְּעַן", "כען",      // "now"
        "הֲוָא", "הוא",       // "was"
    };

    return vocabulary;
}


VocabularyMatch MatchVocabulary(const std::string &utf8_text) {
    VocabularyMatch match;
    if (utf8_text.empty())
        return match;

    for (const auto &word : GetVocabulary()) {
        if (utf8_text.find(word) != std::string::npos)
            match.words_.emplace_back(word);
    }

    match.found_ = not match.words_.empty();
    match.confidence_ = std::min(static_cast<double>(match.words_.size()) / SATURATION_MATCH_COUNT, 1.0);
    return match;
}


} // namespace AramaicVocabulary
