/** \file   AramaicPassages.cc
 *  \brief  Implementation of the Aramaic passage index.
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
#include "AramaicPassages.h"
#include "BibleUtil.h"


bool VerseRange::contains(const unsigned chapter, const unsigned verse) const {
    if (chapter < chapter_start_ or chapter > chapter_end_)
        return false;
    if (chapter_start_ == chapter_end_)
        return verse >= verse_start_ and verse <= verse_end_;

    return (chapter == chapter_start_ and verse >= verse_start_) or (chapter == chapter_end_ and verse <= verse_end_)
           or (chapter > chapter_start_ and chapter < chapter_end_);
}


bool AramaicPassageRef::contains(const unsigned chapter, const unsigned verse) const {
    if (explicit_verses_.find(std::make_pair(chapter, verse)) != explicit_verses_.cend())
        return true;

    for (const auto &range : ranges_) {
        if (range.contains(chapter, verse))
            return true;
    }

    return false;
}


bool AramaicPassageIndex::isAramaicPassage(const std::string &book, const unsigned chapter, const unsigned verse) const {
    if (chapter == 0 or verse == 0)
        return false;

    const auto book_key_and_passages(book_key_to_passages_map_.find(BibleUtil::NormaliseBookKey(book)));
    if (book_key_and_passages == book_key_to_passages_map_.cend())
        return false;

    return book_key_and_passages->second.contains(chapter, verse);
}


namespace {


void AddVerseSpan(const unsigned chapter, const unsigned first_verse, const unsigned last_verse, AramaicPassageRef * const passages) {
    for (unsigned verse(first_verse); verse <= last_verse; ++verse)
        passages->explicit_verses_.emplace(chapter, verse);
}


AramaicPassageIndex BuildDefaultIndex() {
    std::unordered_map<std::string, AramaicPassageRef> book_key_to_passages_map;

    // Daniel 2:4b-7:28
    book_key_to_passages_map["daniel"].ranges_.emplace_back(2, 4, 7, 28);

    // Ezra 4:8-6:18 and 7:12-26
    AramaicPassageRef &ezra(book_key_to_passages_map["ezra"]);
    AddVerseSpan(4, 8, 24, &ezra);
    AddVerseSpan(5, 1, 17, &ezra);
    AddVerseSpan(6, 1, 18, &ezra);
    AddVerseSpan(7, 12, 26, &ezra);

    book_key_to_passages_map["jeremiah"].explicit_verses_.emplace(10, 11);
    book_key_to_passages_map["genesis"].explicit_verses_.emplace(31, 47); // Jegar-sahadutha

    return AramaicPassageIndex(book_key_to_passages_map);
}


} // unnamed namespace


const AramaicPassageIndex &AramaicPassageIndex::GetDefault() {
    static const AramaicPassageIndex default_index(BuildDefaultIndex());
    return default_index;
}
