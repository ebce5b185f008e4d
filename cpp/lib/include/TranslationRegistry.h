/** \file   TranslationRegistry.h
 *  \brief  The set of known translations and original language sources and the resolver settings.
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
#include <string>
#include <vector>
#include "TranslationTable.h"


class IniFile;


/** \brief Settings found in the [Resolver] section of the configuration file. */
struct ResolverSettings {
    static const std::string SECTION_NAME;
    static constexpr unsigned DEFAULT_LOAD_TIMEOUT = 30; // seconds

    std::string data_directory_;
    unsigned load_timeout_;
    std::string reference_translation_; // Supplies the logical verse counts and fallback texts.
    std::string hebrew_source_;         // Original language text of the Old Testament.
    std::string greek_source_;          // Original language text of the New Testament.
public:
    ResolverSettings()
        : load_timeout_(DEFAULT_LOAD_TIMEOUT), reference_translation_("kjv"), hebrew_source_("hebrew-ot"), greek_source_("greek-nt") { }
};


/** \brief Immutable catalog of translations.
 *
 *  Configuration file layout:
 *      [Resolver]
 *      data_directory        = /usr/local/var/lib/ancient_texts
 *      load_timeout          = 30
 *      reference_translation = kjv
 *      hebrew_source         = hebrew-ot
 *      greek_source          = greek-nt
 *
 *      [jps]
 *      name         = "Jewish Publication Society 1917"
 *      abbreviation = JPS
 *      file         = jps-bible.json
 *      numbering    = masoretic
 *  Every section other than [Resolver] describes one translation whose identifier is the section name.  "numbering" is
 *  optional and defaults to "english".  A translation with "enabled = no" is left out of the registry.  A relative data_directory is interpreted relative to the configuration file.
 */
class TranslationRegistry {
    ResolverSettings settings_;
    std::map<std::string, TranslationInfo> id_to_translation_info_map_;
public:
    explicit TranslationRegistry(const IniFile &ini_file);
    TranslationRegistry(const ResolverSettings &settings, const std::vector<TranslationInfo> &translations);

    inline const ResolverSettings &getSettings() const { return settings_; }

    //* \return The translation's description or nullptr if "translation_id" is unknown.
    const TranslationInfo *getTranslation(const std::string &translation_id) const;

    std::vector<std::string> getTranslationIds() const;
    inline size_t size() const { return id_to_translation_info_map_.size(); }

    /** \return The registry of the standard data set: the English translations, the JPS Tanakh (Masoretic numbering) and
     *          the Hebrew and Greek source texts.
     */
    static TranslationRegistry MakeDefault(const std::string &data_directory);
};
