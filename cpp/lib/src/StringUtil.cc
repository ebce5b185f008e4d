/** \file    StringUtil.cc
 *  \brief   Implementation of string-related utility functions.
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
#include "StringUtil.h"
#include <limits>
#include "Compiler.h"


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\f\r");


std::string ASCIIToLower(std::string s) {
    for (auto &ch : s) {
        if (ch >= 'A' and ch <= 'Z')
            ch = static_cast<char>(ch - 'A' + 'a');
    }

    return s;
}


std::string RemoveChars(const std::string &remove_set, std::string s) {
    std::string::size_type write_pos(0);
    for (const char ch : s) {
        if (remove_set.find(ch) == std::string::npos)
            s[write_pos++] = ch;
    }
    s.resize(write_pos);

    return s;
}


std::string &Trim(const std::string &trim_set, std::string * const s) {
    const auto first(s->find_first_not_of(trim_set));
    if (first == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last(s->find_last_not_of(trim_set));
    *s = s->substr(first, last - first + 1);
    return *s;
}


unsigned Split(const std::string &source, const char delimiter, std::vector<std::string> * const components,
               const bool suppress_empty_components)
{
    components->clear();

    std::string::size_type start(0);
    for (;;) {
        const auto end(source.find(delimiter, start));
        const std::string component(source.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (not component.empty() or not suppress_empty_components)
            components->emplace_back(component);
        if (end == std::string::npos)
            break;
        start = end + 1;
    }

    return components->size();
}


unsigned WhiteSpaceSplit(const std::string &source, std::vector<std::string> * const components) {
    components->clear();

    std::string::size_type start(source.find_first_not_of(WHITE_SPACE));
    while (start != std::string::npos) {
        const auto end(source.find_first_of(WHITE_SPACE, start));
        components->emplace_back(source.substr(start, end == std::string::npos ? std::string::npos : end - start));
        start = (end == std::string::npos) ? end : source.find_first_not_of(WHITE_SPACE, end);
    }

    return components->size();
}


std::string Join(const std::vector<std::string> &components, const std::string &separator) {
    std::string joined;
    for (auto component(components.cbegin()); component != components.cend(); ++component) {
        if (component != components.cbegin())
            joined += separator;
        joined += *component;
    }

    return joined;
}


bool ToUnsigned(const std::string &s, unsigned * const n) {
    if (unlikely(s.empty()))
        return false;

    unsigned long value(0);
    for (const char ch : s) {
        if (not IsDigit(ch))
            return false;
        value = value * 10 + static_cast<unsigned>(ch - '0');
        if (unlikely(value > std::numeric_limits<unsigned>::max()))
            return false;
    }

    *n = static_cast<unsigned>(value);
    return true;
}


} // namespace StringUtil
