/** \file   JsonTranslationLoader.cc
 *  \brief  Implementation of class JsonTranslationLoader.
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
#include "JsonTranslationLoader.h"
#include <limits>
#include <stdexcept>
#include <vector>
#include <cstdint>
#include "BibleUtil.h"
#include "Compiler.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace {


// Verse and chapter numbers are sometimes stored as strings, e.g. "12" instead of 12.
unsigned GetJsonUnsignedValue(const nlohmann::json &json, const std::string &label) {
    if (not json.contains(label))
        throw std::runtime_error("missing key \"" + label + "\" in " + json.dump());

    const auto &child(json[label]);
    if (child.is_number_unsigned()) {
        const uint64_t number(child.get<uint64_t>());
        if (unlikely(number > std::numeric_limits<unsigned>::max()))
            throw std::runtime_error("\"" + label + "\" is out of range in " + json.dump());
        return static_cast<unsigned>(number);
    }
    if (child.is_string()) {
        unsigned number;
        if (StringUtil::ToUnsigned(child.get<std::string>(), &number))
            return number;
    }

    throw std::runtime_error("\"" + label + "\" is not an unsigned number in " + json.dump());
}


void ParseNestedDocument(const nlohmann::json &books, TranslationTable * const table) {
    if (not books.is_array())
        throw std::runtime_error("\"books\" is not an array");

    for (const auto &book : books) {
        std::string book_name;
        if (book.contains("id") and book["id"].is_string())
            book_name = book["id"].get<std::string>();
        else if (book.contains("name") and book["name"].is_string())
            book_name = book["name"].get<std::string>();
        else
            throw std::runtime_error("book without a name or id: " + book.dump());
        const std::string book_id(BibleUtil::BookNameToId(book_name));

        if (not book.contains("chapters") or not book["chapters"].is_array())
            throw std::runtime_error("book \"" + book_name + "\" has no chapters array");
        for (const auto &chapter : book["chapters"]) {
            const unsigned chapter_no(GetJsonUnsignedValue(chapter, "chapter"));
            if (not chapter.contains("verses") or not chapter["verses"].is_array())
                throw std::runtime_error(book_name + " " + std::to_string(chapter_no) + " has no verses array");
            for (const auto &verse : chapter["verses"]) {
                const unsigned verse_no(GetJsonUnsignedValue(verse, "verse"));
                if (not verse.contains("text") or not verse["text"].is_string())
                    continue;
                const std::string text(verse["text"].get<std::string>());
                if (not text.empty())
                    table->addVerse(book_id, chapter_no, verse_no, text);
            }
        }
    }
}


// Keys look like "genesis-1-1" or "1-samuel-3-4".
void ParseFlatDocument(const nlohmann::json &document, TranslationTable * const table) {
    for (const auto &[key, value] : document.items()) {
        if (not value.is_string())
            throw std::runtime_error("value for \"" + key + "\" is not a string");

        std::vector<std::string> key_parts;
        StringUtil::Split(key, '-', &key_parts, /* suppress_empty_components = */ false);
        unsigned chapter, verse;
        if (key_parts.size() < 3 or not StringUtil::ToUnsigned(key_parts[key_parts.size() - 2], &chapter)
            or not StringUtil::ToUnsigned(key_parts.back(), &verse))
            throw std::runtime_error("malformed verse key \"" + key + "\"");

        key_parts.resize(key_parts.size() - 2);
        const std::string text(value.get<std::string>());
        if (not text.empty())
            table->addVerse(BibleUtil::BookNameToId(StringUtil::Join(key_parts, "-")), chapter, verse, text);
    }
}


} // unnamed namespace


void JsonTranslationLoader::ParseDocument(const nlohmann::json &document, TranslationTable * const table) {
    if (not document.is_object())
        throw std::runtime_error("top level JSON value is not an object");

    if (document.contains("books"))
        ParseNestedDocument(document["books"], table);
    else
        ParseFlatDocument(document, table);
}


std::shared_ptr<const TranslationTable> JsonTranslationLoader::load(const TranslationInfo &translation_info) {
    const std::string path(FileUtil::MakeAbsolutePath(data_directory_, translation_info.file_));
    LOG_INFO("loading \"" + translation_info.id_ + "\" from \"" + path + "\"");

    std::string json_document;
    if (not FileUtil::ReadString(path, &json_document))
        throw std::runtime_error("in JsonTranslationLoader::load: failed to read \"" + path + "\"!");

    auto table(std::make_shared<TranslationTable>(translation_info.id_));
    try {
        ParseDocument(nlohmann::json::parse(json_document), table.get());
    } catch (const nlohmann::json::exception &x) {
        throw std::runtime_error("in JsonTranslationLoader::load: failed to parse \"" + path + "\"! (" + std::string(x.what()) + ")");
    } catch (const std::runtime_error &x) {
        throw std::runtime_error("in JsonTranslationLoader::load: unexpected structure in \"" + path + "\"! (" + std::string(x.what())
                                 + ")");
    }

    LOG_INFO("loaded " + std::to_string(table->getVerseCount()) + " verses of " + std::to_string(table->getBookCount())
             + " books for \"" + translation_info.id_ + "\"");
    return table;
}
