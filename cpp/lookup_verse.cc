/** \brief Utility for looking up a verse in one of the configured translations.
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

#include <chrono>
#include <iostream>
#include <memory>
#include <vector>
#include <cstdlib>
#include "IniFile.h"
#include "JsonTranslationLoader.h"
#include "StringUtil.h"
#include "TranslationRegistry.h"
#include "TranslationResolver.h"
#include "util.h"


namespace {


// resolveVerse() only reports LOADING for tables that have not been loaded yet, so we wait for all tables it needs.
VerseLookup ResolveWithWait(TranslationResolver * const resolver, const std::string &translation_id, const std::string &book,
                            const unsigned chapter, const unsigned verse)
{
    const TranslationRegistry &registry(resolver->getRegistry());
    const ResolverSettings &settings(registry.getSettings());
    const std::chrono::seconds max_wait((settings.load_timeout_ == 0) ? 24 * 3600 : settings.load_timeout_ + 1);

    std::vector<std::string> translation_ids{ translation_id };
    const TranslationInfo * const translation_info(registry.getTranslation(translation_id));
    if (translation_info != nullptr and translation_info->numbering_ == Versification::MASORETIC) {
        translation_ids.emplace_back(settings.reference_translation_);
        translation_ids.emplace_back(settings.hebrew_source_);
    }

    for (const auto &id : translation_ids) {
        if (registry.getTranslation(id) == nullptr)
            continue;

        const auto load_status(resolver->waitForLoad(id, max_wait));
        if (load_status != TranslationResolver::LOADED)
            LOG_WARNING("\"" + id + "\": " + TranslationResolver::LoadStatusToString(load_status) + " (" + resolver->getLoadError(id)
                        + ")");
    }

    return resolver->resolveVerse(translation_id, book, chapter, verse);
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc != 6)
        ::Usage("config_file translation_id book chapter verse");

    const IniFile ini_file(argv[1]);
    const TranslationRegistry registry(ini_file);
    const std::string translation_id(argv[2]), book(argv[3]);

    unsigned chapter, verse;
    if (not StringUtil::ToUnsigned(argv[4], &chapter))
        LOG_ERROR("bad chapter number \"" + std::string(argv[4]) + "\"!");
    if (not StringUtil::ToUnsigned(argv[5], &verse))
        LOG_ERROR("bad verse number \"" + std::string(argv[5]) + "\"!");

    TranslationResolver resolver(registry, std::make_shared<JsonTranslationLoader>(registry.getSettings().data_directory_));
    const VerseLookup verse_lookup(ResolveWithWait(&resolver, translation_id, book, chapter, verse));
    switch (verse_lookup.status_) {
    case VerseLookup::FOUND:
        if (verse_lookup.superscription_)
            std::cout << "[" << *verse_lookup.superscription_ << "]\n";
        std::cout << verse_lookup.text_ << '\n';
        return EXIT_SUCCESS;
    case VerseLookup::VERSE_NOT_FOUND:
        std::cerr << book << ' ' << chapter << ':' << verse << " is missing in \"" << translation_id << "\".\n";
        return EXIT_FAILURE;
    case VerseLookup::LOADING:
        LOG_ERROR("\"" + translation_id + "\" is still loading!");
    case VerseLookup::LOAD_FAILED:
        LOG_ERROR("failed to load \"" + translation_id + "\": " + resolver.getLoadError(translation_id));
    case VerseLookup::UNKNOWN_TRANSLATION:
        LOG_ERROR("unknown translation \"" + translation_id + "\"!");
    }

    return EXIT_FAILURE;
}
