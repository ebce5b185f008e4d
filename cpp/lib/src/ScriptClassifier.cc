/** \file   ScriptClassifier.cc
 *  \brief  Implementation of the script run scanner.
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
#include "ScriptClassifier.h"
#include "StringUtil.h"
#include "TextUtil.h"


namespace ScriptClassifier {


namespace {


constexpr CodePointRange HEBREW_RANGES[] = {
    { 0x0590u, 0x05FFu }, // Hebrew
};


constexpr CodePointRange GREEK_RANGES[] = {
    { 0x0370u, 0x03FFu }, // Greek and Coptic
    { 0x1F00u, 0x1FFFu }, // Greek Extended
};


constexpr CodePointRange IMPERIAL_ARAMAIC_RANGES[] = {
    { 0x10840u, 0x1085Fu }, // Imperial Aramaic
};


template<size_t N> bool InRanges(const CodePointRange (&ranges)[N], const uint32_t code_point) {
    for (const auto &range : ranges) {
        if (range.contains(code_point))
            return true;
    }

    return false;
}


void FlushRun(const Script script, std::vector<uint32_t> * const run, ScriptMatches * const matches) {
    if (run->empty())
        return;

    const std::string match(TextUtil::UTF32ToUTF8(*run));
    run->clear();
    switch (script) {
    case HEBREW_SCRIPT:
        matches->hebrew_matches_.emplace_back(match);
        break;
    case GREEK_SCRIPT:
        matches->greek_matches_.emplace_back(match);
        break;
    case IMPERIAL_ARAMAIC_SCRIPT:
        matches->imperial_aramaic_matches_.emplace_back(match);
        break;
    case OTHER_SCRIPT:
        break;
    }
}


} // unnamed namespace


Script GetScript(const uint32_t code_point) {
    if (InRanges(HEBREW_RANGES, code_point))
        return HEBREW_SCRIPT;
    if (InRanges(GREEK_RANGES, code_point))
        return GREEK_SCRIPT;
    if (InRanges(IMPERIAL_ARAMAIC_RANGES, code_point))
        return IMPERIAL_ARAMAIC_SCRIPT;
    return OTHER_SCRIPT;
}


ScriptMatches Scan(const std::string &utf8_text) {
    ScriptMatches matches;

    std::vector<uint32_t> code_points;
    TextUtil::UTF8ToUTF32(utf8_text, &code_points);

    Script current_script(OTHER_SCRIPT);
    std::vector<uint32_t> current_run;
    for (const auto code_point : code_points) {
        const Script script(GetScript(code_point));
        if (script != current_script) {
            FlushRun(current_script, &current_run, &matches);
            current_script = script;
        }
        if (script != OTHER_SCRIPT)
            current_run.emplace_back(code_point);
    }
    FlushRun(current_script, &current_run, &matches);

    return matches;
}


namespace {


bool ContainsScript(const std::string &utf8_text, const Script script) {
    std::vector<uint32_t> code_points;
    TextUtil::UTF8ToUTF32(utf8_text, &code_points);
    for (const auto code_point : code_points) {
        if (GetScript(code_point) == script)
            return true;
    }

    return false;
}


} // unnamed namespace


bool ContainsHebrew(const std::string &utf8_text) {
    return ContainsScript(utf8_text, HEBREW_SCRIPT);
}


bool ContainsGreek(const std::string &utf8_text) {
    return ContainsScript(utf8_text, GREEK_SCRIPT);
}


bool ContainsImperialAramaic(const std::string &utf8_text) {
    return ContainsScript(utf8_text, IMPERIAL_ARAMAIC_SCRIPT);
}


std::string ExtractHebrew(const std::string &utf8_text) {
    return StringUtil::Join(Scan(utf8_text).hebrew_matches_, " ");
}


std::string ExtractGreek(const std::string &utf8_text) {
    return StringUtil::Join(Scan(utf8_text).greek_matches_, " ");
}


std::string ExtractAramaic(const std::string &utf8_text) {
    const ScriptMatches matches(Scan(utf8_text));
    if (matches.imperial_aramaic_matches_.empty())
        return "";

    std::vector<std::string> aramaic_matches(matches.hebrew_matches_);
    aramaic_matches.insert(aramaic_matches.end(), matches.imperial_aramaic_matches_.cbegin(), matches.imperial_aramaic_matches_.cend());
    return StringUtil::Join(aramaic_matches, " ");
}


} // namespace ScriptClassifier
