/** \file    StringUtil.h
 *  \brief   Declarations of string-related utility functions.
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen
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


namespace StringUtil {


extern const std::string WHITE_SPACE;


/** \brief  Converts ASCII upper-case letters to lower-case; all other bytes, including those of multibyte UTF-8
 *          sequences, are left untouched.
 */
std::string ASCIIToLower(std::string s);


/** \brief  Removes all occurrences of the characters in "remove_set" from "s". */
std::string RemoveChars(const std::string &remove_set, std::string s);


/** \brief  Removes leading and trailing characters in "trim_set" from "s". */
std::string &Trim(const std::string &trim_set, std::string * const s);
inline std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string copy(s);
    return Trim(trim_set, &copy);
}


inline std::string TrimWhite(const std::string &s) { return Trim(s, WHITE_SPACE); }


inline bool StartsWith(const std::string &s, const std::string &prefix) {
    return s.length() >= prefix.length() and s.compare(0, prefix.length(), prefix) == 0;
}


inline bool IsDigit(const char ch) { return ch >= '0' and ch <= '9'; }


/** \brief  Splits "source" at each occurrence of "delimiter".
 *  \return The number of extracted components.
 */
unsigned Split(const std::string &source, const char delimiter, std::vector<std::string> * const components,
               const bool suppress_empty_components = true);


/** \brief  Splits "source" at runs of ASCII whitespace, never producing empty components. */
unsigned WhiteSpaceSplit(const std::string &source, std::vector<std::string> * const components);


std::string Join(const std::vector<std::string> &components, const std::string &separator);


/** \brief  Converts a string of decimal digits to an unsigned number.
 *  \return False if "s" is empty, contains anything other than digits or would overflow, else true.
 */
bool ToUnsigned(const std::string &s, unsigned * const n);


} // namespace StringUtil
