/** \file   TranslationTable.h
 *  \brief  In-memory verse tables of bible translations and original language texts and the interface for loading them.
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


#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include "Versification.h"


struct TranslationInfo {
    std::string id_;
    std::string name_;
    std::string abbreviation_;
    std::string file_; // Relative to the data directory unless absolute.
    Versification::Numbering numbering_;
public:
    TranslationInfo(): numbering_(Versification::ENGLISH) { }
    TranslationInfo(const std::string &id, const std::string &name, const std::string &abbreviation, const std::string &file,
                    const Versification::Numbering numbering)
        : id_(id), name_(name), abbreviation_(abbreviation), file_(file), numbering_(numbering) { }
};


/** \brief Maps book identifiers to chapters to physical verse numbers to verse texts.
 *  \note  Tables are filled by a loader and must not be modified once they have been handed to a TranslationResolver.
 */
class TranslationTable {
public:
    typedef std::map<unsigned, std::string> Verses;
    typedef std::map<unsigned, Verses> Chapters;
private:
    std::string translation_id_;
    std::unordered_map<std::string, Chapters> book_id_to_chapters_map_;
    size_t verse_count_;
public:
    explicit TranslationTable(const std::string &translation_id): translation_id_(translation_id), verse_count_(0) { }

    inline const std::string &getTranslationId() const { return translation_id_; }

    /** \param book_id  A canonical book identifier, e.g. "1-samuel".
     *  \note  Replaces an existing text for the same verse.
     */
    void addVerse(const std::string &book_id, const unsigned chapter, const unsigned verse, const std::string &text);

    //* \return True if the verse exists, in which case "text" will be set.
    bool lookup(const std::string &book_id, const unsigned chapter, const unsigned verse, std::string * const text) const;

    //* \return The chapter's verses or nullptr if the table has no such chapter.
    const Verses *getChapter(const std::string &book_id, const unsigned chapter) const;

    //* \return The highest verse number of the chapter or 0 if the table does not contain the chapter.
    unsigned getHighestVerseNumber(const std::string &book_id, const unsigned chapter) const;

    inline size_t getBookCount() const { return book_id_to_chapters_map_.size(); }
    inline size_t getVerseCount() const { return verse_count_; }
    inline bool hasBook(const std::string &book_id) const { return book_id_to_chapters_map_.find(book_id) != book_id_to_chapters_map_.cend(); }
};


/** \brief Interface for anything that can produce a TranslationTable.
 *  \note  Implementations signal failure by throwing a std::runtime_error.  load() is called on a background thread.
 */
class TranslationLoader {
public:
    virtual ~TranslationLoader() = default;

    virtual std::shared_ptr<const TranslationTable> load(const TranslationInfo &translation_info) = 0;
};
