/** \file   JsonTranslationLoader.h
 *  \brief  Loads translation verse tables from JSON documents.
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


#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "TranslationTable.h"


/** \brief Reads the documents named by TranslationInfo::file_ from a data directory.
 *
 *  Two document layouts are understood.  The nested layout
 *      {"translation": "KJV", "books": [{"name": "Genesis", "chapters": [{"chapter": 1, "verses": [{"verse": 1, "text": "..."}]}]}]}
 *  and the flat layout
 *      {"genesis-1-1": "...", "1-samuel-3-4": "..."}
 *  Book names and identifiers are mapped to canonical book identifiers.  Verses with empty texts are skipped.
 */
class JsonTranslationLoader : public TranslationLoader {
    std::string data_directory_;
public:
    explicit JsonTranslationLoader(const std::string &data_directory): data_directory_(data_directory) { }

    //* \throws std::runtime_error if the document can't be read or has an unexpected structure.
    std::shared_ptr<const TranslationTable> load(const TranslationInfo &translation_info) override;

    //* \brief Fills "table" from an already parsed document.
    static void ParseDocument(const nlohmann::json &document, TranslationTable * const table);
};
