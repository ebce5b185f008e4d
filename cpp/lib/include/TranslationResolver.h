/** \file   TranslationResolver.h
 *  \brief  Lazily loaded, cached access to verse texts with verse numbering alignment.
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


#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "TranslationRegistry.h"
#include "TranslationTable.h"


struct VerseLookup {
    enum Status {
        FOUND,
        VERSE_NOT_FOUND,    // The translation is loaded but lacks the verse.
        LOADING,            // The translation is being loaded, ask again later.
        LOAD_FAILED,        // See TranslationResolver::getLoadError().
        UNKNOWN_TRANSLATION // Not in the registry.
    };

    Status status_;
    std::string text_;
    std::optional<std::string> superscription_; // Only ever set for logical verse 1.
public:
    explicit VerseLookup(const Status status): status_(status) { }
    VerseLookup(const std::string &text, const std::optional<std::string> &superscription)
        : status_(FOUND), text_(text), superscription_(superscription) { }
};


struct AlignedVerse {
    unsigned verse_; // Logical, i.e. English, verse number.
    std::string original_text_;
    std::string translation_text_;
    std::optional<std::string> superscription_;             // Original language superscription, logical verse 1 only.
    std::optional<std::string> translation_superscription_; // Only for translations with Masoretic numbering.
public:
    explicit AlignedVerse(const unsigned verse): verse_(verse) { }
};


struct AlignedChapter {
    VerseLookup::Status status_; // FOUND or VERSE_NOT_FOUND if the reference translation lacks the chapter.
    unsigned offset_;
    std::vector<AlignedVerse> verses_;
public:
    explicit AlignedChapter(const VerseLookup::Status status): status_(status), offset_(0) { }
};


/** \brief Resolves verses of the translations listed in a TranslationRegistry.
 *
 *  Tables are loaded on first use by background threads owned by the resolver.  Concurrent requests for a translation
 *  that is not yet cached collapse into a single load.  A load that takes longer than the configured timeout is reported
 *  as failed; should it eventually succeed, its table is cached nevertheless.  Failed loads are never retried
 *  automatically, see retryLoad().  No member function throws because of a load failure.
 */
class TranslationResolver {
public:
    enum LoadStatus { NOT_LOADED, LOADING, LOADED, FAILED };
private:
    struct CacheEntry {
        LoadStatus status_;
        bool load_in_flight_;
        std::shared_ptr<const TranslationTable> table_;
        std::string error_message_;
        std::chrono::steady_clock::time_point deadline_;
        std::thread load_thread_; // The most recent load, joined before the next one is started.
    public:
        CacheEntry(): status_(NOT_LOADED), load_in_flight_(false) { }
    };

    const TranslationRegistry registry_;
    std::shared_ptr<TranslationLoader> loader_;
    std::chrono::seconds load_timeout_;
    mutable std::mutex mutex_;
    std::condition_variable load_finished_;
    std::unordered_map<std::string, CacheEntry> translation_id_to_cache_entry_map_;
public:
    /** \param loader  Used to load the tables.  A load timeout of 0 seconds in the registry's settings disables the
     *                 timeout.
     */
    TranslationResolver(const TranslationRegistry &registry, const std::shared_ptr<TranslationLoader> &loader);

    //* Waits for all loads that are still in progress.
    ~TranslationResolver();

    TranslationResolver(const TranslationResolver &) = delete;
    TranslationResolver &operator=(const TranslationResolver &) = delete;

    inline const TranslationRegistry &getRegistry() const { return registry_; }

    /** \brief Starts loading "translation_id" unless it is loaded, loading or failed.
     *  \return The status after the call or FAILED if "translation_id" is not in the registry.
     */
    LoadStatus requestLoad(const std::string &translation_id);

    /** \brief Starts a new load if the previous one failed.
     *  \return The status after the call or FAILED if "translation_id" is not in the registry.
     */
    LoadStatus retryLoad(const std::string &translation_id);

    LoadStatus getLoadStatus(const std::string &translation_id);

    //* \return The reason for the failure of the last load or the empty string.
    std::string getLoadError(const std::string &translation_id);

    /** \brief Requests a load if necessary and blocks until the load has finished, failed or timed out or until
     *         "max_wait" has elapsed, whichever comes first.
     */
    LoadStatus waitForLoad(const std::string &translation_id, const std::chrono::milliseconds max_wait);

    /** \brief Looks up a logical (English numbered) verse.
     *  \param chapter_offset  The superscription offset of the chapter, see Versification::ComputeOffset().  Only used for
     *                         translations with Masoretic numbering.
     *  \note  Returns LOADING and starts a load if the translation has not been loaded yet.
     */
    VerseLookup resolveVerse(const std::string &translation_id, const std::string &book, const unsigned chapter, const unsigned verse,
                             const unsigned chapter_offset);

    /** \brief Like the overload above, but computes the chapter offset from the Hebrew source and the reference translation.
     *  \note  Returns LOADING while either of those is still loading.  If either of them failed to load, an offset of 0 is
     *         assumed.
     */
    VerseLookup resolveVerse(const std::string &translation_id, const std::string &book, const unsigned chapter, const unsigned verse);

    /** \brief Aligns a chapter of "translation_id" with the original language text.
     *  \note  The number of verses is taken from the reference translation.  Translation verses that are missing are taken
     *         from the reference translation.  Old Testament books use the Hebrew source shifted by the chapter offset,
     *         New Testament books the Greek source.  If the original language source failed to load the original texts
     *         are left empty.
     */
    AlignedChapter getChapterVerses(const std::string &translation_id, const std::string &book, const unsigned chapter);

    //* \return The number of load threads that have been started but not yet joined, at most one per translation.
    size_t getUnjoinedLoadThreadCount() const;

    static std::string LoadStatusToString(const LoadStatus load_status);
private:
    void expireOverdueLoad(CacheEntry * const cache_entry, const std::string &translation_id);
    LoadStatus startLoadIfNotLoaded(const TranslationInfo &translation_info, CacheEntry * const cache_entry);
    void runLoad(const TranslationInfo translation_info);

    /** \brief Requests a load if necessary.
     *  \return The table if it has been loaded, otherwise nullptr.  "load_status" is set in either case.
     */
    std::shared_ptr<const TranslationTable> acquireTable(const std::string &translation_id, LoadStatus * const load_status);

    //* \return LOADING while a table needed to compute the offset is still loading, else LOADED.
    LoadStatus computeChapterOffset(const std::string &book_id, const unsigned chapter, unsigned * const offset);
};
