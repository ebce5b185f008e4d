/** \file   BibleUtil.h
 *  \brief  The catalog of canonical bible books and book name normalisation.
 *
 *  \copyright 2014-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#ifndef BIBLE_UTIL_H
#define BIBLE_UTIL_H


#include <string>
#include <vector>


namespace BibleUtil {


enum Testament { OLD_TESTAMENT, NEW_TESTAMENT };


struct BibleBook {
    std::string id_;           // The canonical book identifier, e.g. "1-samuel".
    std::string name_;         // The display name, e.g. "1 Samuel".
    std::string abbreviation_; // E.g. "1 Sam".
    Testament testament_;
    std::string category_;     // E.g. "Law" or "Minor Prophets".
    unsigned chapter_count_;
public:
    BibleBook(const std::string &id, const std::string &name, const std::string &abbreviation, const Testament testament,
              const std::string &category, const unsigned chapter_count)
        : id_(id), name_(name), abbreviation_(abbreviation), testament_(testament), category_(category), chapter_count_(chapter_count) { }
};


//* \return The 66 canonical books in canonical order.
const std::vector<BibleBook> &GetBooks();


std::vector<const BibleBook *> GetBooksByTestament(const Testament testament);


/** \brief Maps a book name, abbreviation or identifier to its lookup key.
 *  \note  Lowercases ASCII letters and removes whitespace and hyphens.  Compound-numbered books get their number moved
 *         to the end, e.g. "1 Samuel" and "1-samuel" both become "samuel1".
 */
std::string NormaliseBookKey(const std::string &book);


/** \brief Locates a book by its identifier, display name or abbreviation.
 *  \return The book or nullptr if "book_candidate" is not in the catalog.
 */
const BibleBook *FindBook(const std::string &book_candidate);


/** \return The canonical identifier of the book or, if the book is not in the catalog, "book_name" lowercased with runs
 *          of whitespace replaced by hyphens.
 */
std::string BookNameToId(const std::string &book_name);


std::string TestamentToString(const Testament testament);


} // namespace BibleUtil


#endif // ifndef BIBLE_UTIL_H
