/** \file   TranslationRegistry.cc
 *  \brief  Implementation of class TranslationRegistry.
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
#include "TranslationRegistry.h"
#include <stdexcept>
#include "FileUtil.h"
#include "IniFile.h"
#include "util.h"


const std::string ResolverSettings::SECTION_NAME("Resolver");


namespace {


const std::map<std::string, int> NUMBERING_NAMES_TO_VALUES_MAP{
    { "english", Versification::ENGLISH },
    { "masoretic", Versification::MASORETIC },
};


} // unnamed namespace


TranslationRegistry::TranslationRegistry(const IniFile &ini_file) {
    const ResolverSettings defaults;
    const std::string &section(ResolverSettings::SECTION_NAME);
    if (not ini_file.hasSection(section))
        LOG_WARNING("no [" + section + "] section in \"" + ini_file.getFilename() + "\", using the default settings");

    std::string config_directory, config_basename;
    FileUtil::DirnameAndBasename(ini_file.getFilename(), &config_directory, &config_basename);
    settings_.data_directory_ = FileUtil::MakeAbsolutePath(config_directory, ini_file.getString(section, "data_directory", "."));
    settings_.load_timeout_ = ini_file.getUnsigned(section, "load_timeout", defaults.load_timeout_);
    settings_.reference_translation_ = ini_file.getString(section, "reference_translation", defaults.reference_translation_);
    settings_.hebrew_source_ = ini_file.getString(section, "hebrew_source", defaults.hebrew_source_);
    settings_.greek_source_ = ini_file.getString(section, "greek_source", defaults.greek_source_);

    for (const auto &translation_section : ini_file) {
        const std::string &translation_id(translation_section.getSectionName());
        if (translation_id == section or translation_id.empty())
            continue;
        if (not translation_section.getBool("enabled", true)) {
            LOG_DEBUG("skipping disabled translation \"" + translation_id + "\"");
            continue;
        }

        const TranslationInfo translation_info(
            translation_id, translation_section.getString("name", translation_id), translation_section.getString("abbreviation", translation_id),
            translation_section.getString("file"),
            static_cast<Versification::Numbering>(translation_section.getEnum("numbering", NUMBERING_NAMES_TO_VALUES_MAP, Versification::ENGLISH)));
        id_to_translation_info_map_.emplace(translation_id, translation_info);
        LOG_DEBUG("registered translation \"" + translation_id + "\" (" + Versification::NumberingToString(translation_info.numbering_)
                  + " numbering)");
    }

    if (id_to_translation_info_map_.find(settings_.reference_translation_) == id_to_translation_info_map_.cend())
        throw std::runtime_error("in TranslationRegistry::TranslationRegistry: reference translation \"" + settings_.reference_translation_
                                 + "\" is not configured in \"" + ini_file.getFilename() + "\"!");
}


TranslationRegistry::TranslationRegistry(const ResolverSettings &settings, const std::vector<TranslationInfo> &translations)
    : settings_(settings)
{
    for (const auto &translation : translations)
        id_to_translation_info_map_.emplace(translation.id_, translation);
}


const TranslationInfo *TranslationRegistry::getTranslation(const std::string &translation_id) const {
    const auto id_and_translation_info(id_to_translation_info_map_.find(translation_id));
    return (id_and_translation_info == id_to_translation_info_map_.cend()) ? nullptr : &id_and_translation_info->second;
}


std::vector<std::string> TranslationRegistry::getTranslationIds() const {
    std::vector<std::string> translation_ids;
    for (const auto &id_and_translation_info : id_to_translation_info_map_)
        translation_ids.emplace_back(id_and_translation_info.first);

    return translation_ids;
}


TranslationRegistry TranslationRegistry::MakeDefault(const std::string &data_directory) {
    ResolverSettings settings;
    settings.data_directory_ = data_directory;

    const Versification::Numbering ENGLISH(Versification::ENGLISH), MASORETIC(Versification::MASORETIC);
    return TranslationRegistry(settings, {
        { "kjv", "King James Version", "KJV", "kjv-complete.json", ENGLISH },
        { "esv", "English Standard Version", "ESV", "esv-bible.json", ENGLISH },
        { "asv", "American Standard Version", "ASV", "asv-bible.json", ENGLISH },
        { "bsb", "Berean Standard Bible", "BSB", "bsb-bible.json", ENGLISH },
        { "net", "New English Translation", "NET", "net-bible.json", ENGLISH },
        { "bbe", "Bible in Basic English", "BBE", "bbe-bible.json", ENGLISH },
        { "darby", "Darby Translation", "Darby", "darby-bible.json", ENGLISH },
        { "drc", "Douay-Rheims Catholic", "DRC", "drc-bible.json", ENGLISH },
        { "geneva", "Geneva Bible 1599", "Geneva", "geneva-1599.json", ENGLISH },
        { "jps", "JPS Tanakh 1917", "JPS", "jps-bible.json", MASORETIC },
        { "jubilee", "Jubilee Bible", "JUB", "jubilee-bible.json", ENGLISH },
        { "leb", "Lexham English Bible", "LEB", "leb-bible.json", ENGLISH },
        { "litv", "Literal Translation", "LITV", "litv-bible.json", ENGLISH },
        { "mkjv", "Modern KJV", "MKJV", "mkjv-bible.json", ENGLISH },
        { "nheb", "New Heart English Bible", "NHEB", "nheb-bible.json", ENGLISH },
        { "webster", "Webster's Bible", "Webster", "webster-bible.json", ENGLISH },
        { "ylt", "Young's Literal Translation", "YLT", "ylt-bible.json", ENGLISH },
        { "akjv", "American KJV", "AKJV", "akjv-bible.json", ENGLISH },
        { "kjvpce", "KJV Pure Cambridge", "KJVPCE", "kjvpce-bible.json", ENGLISH },
        { "hebrew-ot", "Hebrew Old Testament", "WLC", "hebrew-ot-complete.json", MASORETIC },
        { "greek-nt", "Greek New Testament", "GNT", "greek-nt-clean.json", ENGLISH },
    });
}
