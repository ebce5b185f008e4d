/** \file   AramaicPassages.h
 *  \brief  Index of the biblical passages that are written in Aramaic using the Hebrew square script.
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


#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>


/** \brief A contiguous span of verses, inclusive on both ends. */
struct VerseRange {
    unsigned chapter_start_, verse_start_, chapter_end_, verse_end_;
public:
    VerseRange(const unsigned chapter_start, const unsigned verse_start, const unsigned chapter_end, const unsigned verse_end)
        : chapter_start_(chapter_start), verse_start_(verse_start), chapter_end_(chapter_end), verse_end_(verse_end) { }

    bool contains(const unsigned chapter, const unsigned verse) const;
};


/** \brief Per-book record of Aramaic verses.  A book lists scattered verses explicitly and contiguous spans as ranges. */
struct AramaicPassageRef {
    std::set<std::pair<unsigned, unsigned>> explicit_verses_; // (chapter, verse) pairs
    std::vector<VerseRange> ranges_;
public:
    bool contains(const unsigned chapter, const unsigned verse) const;
};


/** \brief Immutable lookup table of the passages known to be Aramaic.
 *  \note  Granularity is the whole verse, e.g. all of Daniel 2:4 counts as Aramaic.
 */
class AramaicPassageIndex {
    std::unordered_map<std::string, AramaicPassageRef> book_key_to_passages_map_;
public:
    /** \param book_key_to_passages_map  Keys must have been produced by BibleUtil::NormaliseBookKey(). */
    explicit AramaicPassageIndex(const std::unordered_map<std::string, AramaicPassageRef> &book_key_to_passages_map)
        : book_key_to_passages_map_(book_key_to_passages_map) { }

    /** \return True if the verse is registered as Aramaic.  Unknown books, chapter 0 and verse 0 are never Aramaic. */
    bool isAramaicPassage(const std::string &book, const unsigned chapter, const unsigned verse) const;

    //* \return The index of the Aramaic portions of Daniel, Ezra, Jeremiah and Genesis.
    static const AramaicPassageIndex &GetDefault();
};
