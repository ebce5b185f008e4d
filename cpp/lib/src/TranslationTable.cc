/** \file   TranslationTable.cc
 *  \brief  Implementation of class TranslationTable.
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
#include "TranslationTable.h"


void TranslationTable::addVerse(const std::string &book_id, const unsigned chapter, const unsigned verse, const std::string &text) {
    Verses &verses(book_id_to_chapters_map_[book_id][chapter]);
    if (verses.find(verse) == verses.end())
        ++verse_count_;
    verses[verse] = text;
}


const TranslationTable::Verses *TranslationTable::getChapter(const std::string &book_id, const unsigned chapter) const {
    const auto book_id_and_chapters(book_id_to_chapters_map_.find(book_id));
    if (book_id_and_chapters == book_id_to_chapters_map_.cend())
        return nullptr;

    const auto chapter_and_verses(book_id_and_chapters->second.find(chapter));
    return (chapter_and_verses == book_id_and_chapters->second.cend()) ? nullptr : &chapter_and_verses->second;
}


bool TranslationTable::lookup(const std::string &book_id, const unsigned chapter, const unsigned verse, std::string * const text) const {
    const auto verses(getChapter(book_id, chapter));
    if (verses == nullptr)
        return false;

    const auto verse_and_text(verses->find(verse));
    if (verse_and_text == verses->cend())
        return false;

    *text = verse_and_text->second;
    return true;
}


unsigned TranslationTable::getHighestVerseNumber(const std::string &book_id, const unsigned chapter) const {
    const auto verses(getChapter(book_id, chapter));
    return (verses == nullptr or verses->empty()) ? 0 : verses->crbegin()->first;
}
