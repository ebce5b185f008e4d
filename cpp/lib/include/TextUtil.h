/** \file    TextUtil.h
 *  \brief   Declarations of UTF-8 and UTF-32 conversion utilities.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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


namespace TextUtil {


constexpr uint32_t REPLACEMENT_CHARACTER(0xFFFDu);


/** \brief  A byte-at-a-time UTF-8 decoder.
 *  \note   Feed bytes via addByte() until it returns false, then collect the code point with getUTF32Char().
 */
class UTF8ToUTF32Decoder {
    int required_count_;
    uint32_t utf32_char_;
    bool permissive_;
public:
    enum State { NO_CHARACTER_PENDING, CHARACTER_INCOMPLETE, CHARACTER_PENDING };
public:
    /** \param permissive  If false, we throw a std::runtime_error on encoding errors, if true we return Unicode replacement
     *                     characters.
     */
    explicit UTF8ToUTF32Decoder(const bool permissive = true): required_count_(-1), utf32_char_(0), permissive_(permissive) { }

    /** \return True if more bytes are needed to complete the current character, else false. */
    bool addByte(const char ch);

    State getState() const {
        return (required_count_ == -1) ? NO_CHARACTER_PENDING : ((required_count_ > 0) ? CHARACTER_INCOMPLETE : CHARACTER_PENDING);
    }

    uint32_t getUTF32Char() { required_count_ = -1; return utf32_char_; }
};


/** \brief  Converts UTF-8 to a sequence of code points.  Invalid lead bytes become REPLACEMENT_CHARACTER.
 *  \return False if the input ended inside an incomplete multibyte sequence, else true.
 */
bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars);


std::string UTF32ToUTF8(const uint32_t code_point);


std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points);


} // namespace TextUtil
