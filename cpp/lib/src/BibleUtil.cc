/** \file   BibleUtil.cc
 *  \brief  Implementation of the canonical bible book catalog.
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
#include "BibleUtil.h"
#include <unordered_map>
#include "StringUtil.h"
#include "util.h"


namespace BibleUtil {


const std::vector<BibleBook> &GetBooks() {
    static const std::vector<BibleBook> books{
        { "genesis", "Genesis", "Gen", OLD_TESTAMENT, "Law", 50 },
        { "exodus", "Exodus", "Exod", OLD_TESTAMENT, "Law", 40 },
        { "leviticus", "Leviticus", "Lev", OLD_TESTAMENT, "Law", 27 },
        { "numbers", "Numbers", "Num", OLD_TESTAMENT, "Law", 36 },
        { "deuteronomy", "Deuteronomy", "Deut", OLD_TESTAMENT, "Law", 34 },
        { "joshua", "Joshua", "Josh", OLD_TESTAMENT, "History", 24 },
        { "judges", "Judges", "Judg", OLD_TESTAMENT, "History", 21 },
        { "ruth", "Ruth", "Ruth", OLD_TESTAMENT, "History", 4 },
        { "1-samuel", "1 Samuel", "1 Sam", OLD_TESTAMENT, "History", 31 },
        { "2-samuel", "2 Samuel", "2 Sam", OLD_TESTAMENT, "History", 24 },
        { "1-kings", "1 Kings", "1 Kgs", OLD_TESTAMENT, "History", 22 },
        { "2-kings", "2 Kings", "2 Kgs", OLD_TESTAMENT, "History", 25 },
        { "1-chronicles", "1 Chronicles", "1 Chr", OLD_TESTAMENT, "History", 29 },
        { "2-chronicles", "2 Chronicles", "2 Chr", OLD_TESTAMENT, "History", 36 },
        { "ezra", "Ezra", "Ezra", OLD_TESTAMENT, "History", 10 },
        { "nehemiah", "Nehemiah", "Neh", OLD_TESTAMENT, "History", 13 },
        { "esther", "Esther", "Esth", OLD_TESTAMENT, "History", 10 },
        { "job", "Job", "Job", OLD_TESTAMENT, "Poetry", 42 },
        { "psalms", "Psalms", "Ps", OLD_TESTAMENT, "Poetry", 150 },
        { "proverbs", "Proverbs", "Prov", OLD_TESTAMENT, "Poetry", 31 },
        { "ecclesiastes", "Ecclesiastes", "Eccl", OLD_TESTAMENT, "Poetry", 12 },
        { "song-of-solomon", "Song of Solomon", "Song", OLD_TESTAMENT, "Poetry", 8 },
        { "isaiah", "Isaiah", "Isa", OLD_TESTAMENT, "Major Prophets", 66 },
        { "jeremiah", "Jeremiah", "Jer", OLD_TESTAMENT, "Major Prophets", 52 },
        { "lamentations", "Lamentations", "Lam", OLD_TESTAMENT, "Major Prophets", 5 },
        { "ezekiel", "Ezekiel", "Ezek", OLD_TESTAMENT, "Major Prophets", 48 },
        { "daniel", "Daniel", "Dan", OLD_TESTAMENT, "Major Prophets", 12 },
        { "hosea", "Hosea", "Hos", OLD_TESTAMENT, "Minor Prophets", 14 },
        { "joel", "Joel", "Joel", OLD_TESTAMENT, "Minor Prophets", 3 },
        { "amos", "Amos", "Amos", OLD_TESTAMENT, "Minor Prophets", 9 },
        { "obadiah", "Obadiah", "Obad", OLD_TESTAMENT, "Minor Prophets", 1 },
        { "jonah", "Jonah", "Jonah", OLD_TESTAMENT, "Minor Prophets", 4 },
        { "micah", "Micah", "Mic", OLD_TESTAMENT, "Minor Prophets", 7 },
        { "nahum", "Nahum", "Nah", OLD_TESTAMENT, "Minor Prophets", 3 },
        { "habakkuk", "Habakkuk", "Hab", OLD_TESTAMENT, "Minor Prophets", 3 },
        { "zephaniah", "Zephaniah", "Zeph", OLD_TESTAMENT, "Minor Prophets", 3 },
        { "haggai", "Haggai", "Hag", OLD_TESTAMENT, "Minor Prophets", 2 },
        { "zechariah", "Zechariah", "Zech", OLD_TESTAMENT, "Minor Prophets", 14 },
        { "malachi", "Malachi", "Mal", OLD_TESTAMENT, "Minor Prophets", 4 },
        { "matthew", "Matthew", "Matt", NEW_TESTAMENT, "Gospel", 28 },
        { "mark", "Mark", "Mark", NEW_TESTAMENT, "Gospel", 16 },
        { "luke", "Luke", "Luke", NEW_TESTAMENT, "Gospel", 24 },
        { "john", "John", "John", NEW_TESTAMENT, "Gospel", 21 },
        { "acts", "Acts", "Acts", NEW_TESTAMENT, "History", 28 },
        { "romans", "Romans", "Rom", NEW_TESTAMENT, "Epistle", 16 },
        { "1-corinthians", "1 Corinthians", "1 Cor", NEW_TESTAMENT, "Epistle", 16 },
        { "2-corinthians", "2 Corinthians", "2 Cor", NEW_TESTAMENT, "Epistle", 13 },
        { "galatians", "Galatians", "Gal", NEW_TESTAMENT, "Epistle", 6 },
        { "ephesians", "Ephesians", "Eph", NEW_TESTAMENT, "Epistle", 6 },
        { "philippians", "Philippians", "Phil", NEW_TESTAMENT, "Epistle", 4 },
        { "colossians", "Colossians", "Col", NEW_TESTAMENT, "Epistle", 4 },
        { "1-thessalonians", "1 Thessalonians", "1 Thess", NEW_TESTAMENT, "Epistle", 5 },
        { "2-thessalonians", "2 Thessalonians", "2 Thess", NEW_TESTAMENT, "Epistle", 3 },
        { "1-timothy", "1 Timothy", "1 Tim", NEW_TESTAMENT, "Epistle", 6 },
        { "2-timothy", "2 Timothy", "2 Tim", NEW_TESTAMENT, "Epistle", 4 },
        { "titus", "Titus", "Titus", NEW_TESTAMENT, "Epistle", 3 },
        { "philemon", "Philemon", "Phlm", NEW_TESTAMENT, "Epistle", 1 },
        { "hebrews", "Hebrews", "Heb", NEW_TESTAMENT, "Epistle", 13 },
        { "james", "James", "Jas", NEW_TESTAMENT, "Epistle", 5 },
        { "1-peter", "1 Peter", "1 Pet", NEW_TESTAMENT, "Epistle", 5 },
        { "2-peter", "2 Peter", "2 Pet", NEW_TESTAMENT, "Epistle", 3 },
        { "1-john", "1 John", "1 John", NEW_TESTAMENT, "Epistle", 5 },
        { "2-john", "2 John", "2 John", NEW_TESTAMENT, "Epistle", 1 },
        { "3-john", "3 John", "3 John", NEW_TESTAMENT, "Epistle", 1 },
        { "jude", "Jude", "Jude", NEW_TESTAMENT, "Epistle", 1 },
        { "revelation", "Revelation", "Rev", NEW_TESTAMENT, "Prophecy", 22 },
    };

    return books;
}


std::vector<const BibleBook *> GetBooksByTestament(const Testament testament) {
    std::vector<const BibleBook *> books;
    for (const auto &book : GetBooks()) {
        if (book.testament_ == testament)
            books.emplace_back(&book);
    }

    return books;
}


std::string NormaliseBookKey(const std::string &book) {
    static const std::unordered_map<std::string, std::string> compound_book_aliases{
        { "1samuel", "samuel1" },
        { "2samuel", "samuel2" },
        { "1kings", "kings1" },
        { "2kings", "kings2" },
        { "1chronicles", "chronicles1" },
        { "2chronicles", "chronicles2" },
    };

    const std::string key(StringUtil::RemoveChars(StringUtil::WHITE_SPACE + "-", StringUtil::ASCIIToLower(book)));
    const auto alias(compound_book_aliases.find(key));
    return (alias == compound_book_aliases.cend()) ? key : alias->second;
}


namespace {


std::unordered_map<std::string, const BibleBook *> BuildKeyToBookMap() {
    std::unordered_map<std::string, const BibleBook *> key_to_book_map;
    for (const auto &book : GetBooks()) {
        for (const auto &key : { NormaliseBookKey(book.id_), NormaliseBookKey(book.name_), NormaliseBookKey(book.abbreviation_) }) {
            const auto key_and_book(key_to_book_map.find(key));
            if (unlikely(key_and_book != key_to_book_map.cend() and key_and_book->second != &book))
                LOG_ERROR("book lookup key \"" + key + "\" is ambiguous!");
            key_to_book_map[key] = &book;
        }
    }

    return key_to_book_map;
}


} // unnamed namespace


const BibleBook *FindBook(const std::string &book_candidate) {
    static const std::unordered_map<std::string, const BibleBook *> key_to_book_map(BuildKeyToBookMap());

    const auto key_and_book(key_to_book_map.find(NormaliseBookKey(book_candidate)));
    return (key_and_book == key_to_book_map.cend()) ? nullptr : key_and_book->second;
}


std::string BookNameToId(const std::string &book_name) {
    const auto book(FindBook(book_name));
    if (book != nullptr)
        return book->id_;

    std::vector<std::string> words;
    StringUtil::WhiteSpaceSplit(StringUtil::ASCIIToLower(book_name), &words);
    return StringUtil::Join(words, "-");
}


std::string TestamentToString(const Testament testament) {
    switch (testament) {
    case OLD_TESTAMENT:
        return "OT";
    case NEW_TESTAMENT:
        return "NT";
    }

    LOG_ERROR("unknown testament " + std::to_string(testament) + "!");
}


} // namespace BibleUtil
