/** \file    TextUtil.cc
 *  \brief   Implementation of UTF-8 and UTF-32 conversion utilities.
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
#include "TextUtil.h"
#include <stdexcept>
#include "Compiler.h"


namespace TextUtil {


bool UTF8ToUTF32Decoder::addByte(const char ch) {
    const unsigned char uch(static_cast<unsigned char>(ch));

    if (required_count_ == -1) {
        if ((uch & 0b10000000) == 0b00000000) {
            utf32_char_ = uch;
            required_count_ = 0;
        } else if ((uch & 0b11100000) == 0b11000000) {
            utf32_char_ = uch & 0b11111;
            required_count_ = 1;
        } else if ((uch & 0b11110000) == 0b11100000) {
            utf32_char_ = uch & 0b1111;
            required_count_ = 2;
        } else if ((uch & 0b11111000) == 0b11110000) {
            utf32_char_ = uch & 0b111;
            required_count_ = 3;
        } else if (permissive_) {
            utf32_char_ = REPLACEMENT_CHARACTER;
            required_count_ = 0;
        } else
            throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: bad UTF-8 lead byte 0x" + std::to_string(uch) + "!");
    } else if (required_count_ > 0) {
        if (unlikely((uch & 0b11000000) != 0b10000000)) {
            if (not permissive_)
                throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: bad UTF-8 continuation byte!");
            utf32_char_ = REPLACEMENT_CHARACTER;
            required_count_ = 0;
        } else {
            --required_count_;
            utf32_char_ <<= 6u;
            utf32_char_ |= (uch & 0b00111111);
        }
    }

    return required_count_ != 0;
}


bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars) {
    utf32_chars->clear();

    UTF8ToUTF32Decoder decoder;
    bool last_addByte_retval(false);
    for (const char ch : utf8_string) {
        if (not (last_addByte_retval = decoder.addByte(ch)))
            utf32_chars->emplace_back(decoder.getUTF32Char());
    }

    return not last_addByte_retval;
}


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFFu) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0x10FFFFu) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid code point " + std::to_string(code_point) + "!");

    return utf8;
}


std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points) {
    std::string utf8;
    for (const auto code_point : code_points)
        utf8 += UTF32ToUTF8(code_point);

    return utf8;
}


} // namespace TextUtil
