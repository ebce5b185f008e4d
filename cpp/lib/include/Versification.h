/** \file   Versification.h
 *  \brief  Alignment of Masoretic (Hebrew) and English verse numbering.
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


#include <optional>
#include <string>


namespace Versification {


/** ENGLISH: the logical (KJV) numbering.  MASORETIC: Psalm superscriptions are counted as verses, i.e. the physical
    verse numbers are shifted by the chapter's offset. */
enum Numbering { ENGLISH, MASORETIC };


constexpr unsigned MAX_OFFSET(2);


/** \brief Computes by how many verses the source (Hebrew) numbering of a chapter runs ahead of the destination
 *         (English) numbering due to unnumbered superscriptions.
 *  \param book_name  Any form accepted by BibleUtil::FindBook().  Books not in the catalog get an offset of 0.
 *  \return source_verse_count - dest_verse_count if that difference is 1 or 2 and the book is Psalms, else 0.
 */
unsigned ComputeOffset(const std::string &book_name, const unsigned chapter, const unsigned source_verse_count,
                       const unsigned dest_verse_count);


//* \return The physical source verse number of the logical verse "dest_verse".
inline unsigned ResolveSourceVerse(const unsigned dest_verse, const unsigned offset) { return dest_verse + offset; }


//* \return The logical verse number of "source_verse" or an empty optional if "source_verse" is part of the superscription.
std::optional<unsigned> ResolveDestVerse(const unsigned source_verse, const unsigned offset);


//* \return The physical verse to read from a table with numbering "numbering" for the logical verse "logical_verse".
inline unsigned PhysicalVerse(const Numbering numbering, const unsigned logical_verse, const unsigned offset) {
    return (numbering == MASORETIC) ? ResolveSourceVerse(logical_verse, offset) : logical_verse;
}


std::string NumberingToString(const Numbering numbering);


} // namespace Versification
