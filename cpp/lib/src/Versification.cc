/** \file   Versification.cc
 *  \brief  Implementation of the verse numbering alignment.
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
#include "Versification.h"
#include "BibleUtil.h"
#include "util.h"


namespace Versification {


unsigned ComputeOffset(const std::string &book_name, const unsigned chapter, const unsigned source_verse_count,
                       const unsigned dest_verse_count)
{
    const auto book(BibleUtil::FindBook(book_name));
    if (book == nullptr or book->id_ != "psalms")
        return 0;

    if (source_verse_count <= dest_verse_count)
        return 0;

    const unsigned difference(source_verse_count - dest_verse_count);
    if (difference > MAX_OFFSET) {
        LOG_DEBUG("Psalm " + std::to_string(chapter) + ": verse count difference of " + std::to_string(difference)
                  + " is not a superscription offset");
        return 0;
    }

    return difference;
}


std::optional<unsigned> ResolveDestVerse(const unsigned source_verse, const unsigned offset) {
    if (source_verse <= offset)
        return std::nullopt;
    return source_verse - offset;
}


std::string NumberingToString(const Numbering numbering) {
    switch (numbering) {
    case ENGLISH:
        return "english";
    case MASORETIC:
        return "masoretic";
    }

    LOG_ERROR("unknown numbering " + std::to_string(numbering) + "!");
}


} // namespace Versification
