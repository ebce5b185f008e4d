/** \brief Utility for determining whether a biblical passage is Hebrew, Aramaic or Greek.
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

#include <iostream>
#include <cstdlib>
#include "FileUtil.h"
#include "LanguageClassifier.h"
#include "StringUtil.h"
#include "util.h"


namespace {


void PrintList(const std::string &label, const std::vector<std::string> &list) {
    if (not list.empty())
        std::cout << label << ": " << StringUtil::Join(list, ", ") << '\n';
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc != 2 and argc != 5)
        ::Usage("text | --file=filename [book chapter verse]");

    std::string text;
    if (StringUtil::StartsWith(argv[1], "--file="))
        text = FileUtil::ReadStringOrDie(argv[1] + __builtin_strlen("--file="));
    else
        text = argv[1];

    LanguageClassifier::ClassificationResult result;
    if (argc == 5) {
        unsigned chapter, verse;
        if (not StringUtil::ToUnsigned(argv[3], &chapter))
            LOG_ERROR("bad chapter number \"" + std::string(argv[3]) + "\"!");
        if (not StringUtil::ToUnsigned(argv[4], &verse))
            LOG_ERROR("bad verse number \"" + std::string(argv[4]) + "\"!");
        result = LanguageClassifier::Classify(text, argv[2], chapter, verse);
    } else
        result = LanguageClassifier::Classify(text);

    std::cout << LanguageClassifier::LanguageToString(result.language_) << " (" << result.confidence_ << ")" << '\n';
    std::cout << "hebrew runs: " << result.hebrew_count_ << ", greek runs: " << result.greek_count_
              << ", imperial aramaic runs: " << result.aramaic_count_ << '\n';
    if (result.is_known_aramaic_passage_)
        std::cout << "known Aramaic passage\n";
    PrintList("matches", result.matched_spans_);
    PrintList("aramaic vocabulary", result.aramaic_words_);

    return EXIT_SUCCESS;
}
