/** \file   TranslationResolver.cc
 *  \brief  Implementation of class TranslationResolver.
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
#include "TranslationResolver.h"
#include <stdexcept>
#include <system_error>
#include <utility>
#include "BibleUtil.h"
#include "Compiler.h"
#include "StringUtil.h"
#include "Versification.h"
#include "util.h"


namespace {


// Joins physical verses 1 through "offset", i.e. the superscription of a chapter with Hebrew numbering.
std::optional<std::string> GetSuperscription(const TranslationTable &table, const std::string &book_id, const unsigned chapter,
                                             const unsigned offset)
{
    std::vector<std::string> superscription_verses;
    for (unsigned verse(1); verse <= offset; ++verse) {
        std::string text;
        if (table.lookup(book_id, chapter, verse, &text))
            superscription_verses.emplace_back(text);
    }

    if (superscription_verses.empty())
        return std::nullopt;
    return StringUtil::Join(superscription_verses, " ");
}


VerseLookup LookupLogicalVerse(const TranslationTable &table, const Versification::Numbering numbering, const std::string &book_id,
                               const unsigned chapter, const unsigned verse, const unsigned chapter_offset)
{
    std::string text;
    if (not table.lookup(book_id, chapter, Versification::PhysicalVerse(numbering, verse, chapter_offset), &text))
        return VerseLookup(VerseLookup::VERSE_NOT_FOUND);

    if (verse == 1 and numbering == Versification::MASORETIC and chapter_offset > 0)
        return VerseLookup(text, GetSuperscription(table, book_id, chapter, chapter_offset));
    return VerseLookup(text, std::nullopt);
}


} // unnamed namespace


TranslationResolver::TranslationResolver(const TranslationRegistry &registry, const std::shared_ptr<TranslationLoader> &loader)
    : registry_(registry), loader_(loader), load_timeout_(registry.getSettings().load_timeout_)
{
    if (unlikely(loader_ == nullptr))
        throw std::runtime_error("in TranslationResolver::TranslationResolver: loader must not be NULL!");
}


TranslationResolver::~TranslationResolver() {
    std::vector<std::thread> load_threads;
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        for (auto &translation_id_and_cache_entry : translation_id_to_cache_entry_map_) {
            if (translation_id_and_cache_entry.second.load_thread_.joinable())
                load_threads.emplace_back(std::move(translation_id_and_cache_entry.second.load_thread_));
        }
    }

    for (auto &load_thread : load_threads)
        load_thread.join();
}


// mutex_ must be held by the caller.
void TranslationResolver::expireOverdueLoad(CacheEntry * const cache_entry, const std::string &translation_id) {
    if (cache_entry->status_ != LOADING or load_timeout_.count() == 0)
        return;
    if (std::chrono::steady_clock::now() < cache_entry->deadline_)
        return;

    cache_entry->status_ = FAILED;
    cache_entry->error_message_ = "load timed out after " + std::to_string(load_timeout_.count()) + " seconds";
    LOG_WARNING("loading of \"" + translation_id + "\" timed out");
}


// mutex_ must be held by the caller.
TranslationResolver::LoadStatus TranslationResolver::startLoadIfNotLoaded(const TranslationInfo &translation_info,
                                                                          CacheEntry * const cache_entry)
{
    expireOverdueLoad(cache_entry, translation_info.id_);
    if (cache_entry->status_ != NOT_LOADED)
        return cache_entry->status_;

    cache_entry->status_ = LOADING;
    cache_entry->deadline_ = std::chrono::steady_clock::now() + load_timeout_;

    // A load that timed out may still be running, in which case its result will be used.
    if (cache_entry->load_in_flight_)
        return LOADING;

    // The previous load has already published its result, so this only waits for its thread to exit.
    if (cache_entry->load_thread_.joinable())
        cache_entry->load_thread_.join();

    try {
        cache_entry->load_thread_ = std::thread(&TranslationResolver::runLoad, this, translation_info);
    } catch (const std::system_error &x) {
        cache_entry->status_ = FAILED;
        cache_entry->error_message_ = "failed to start a load thread: " + std::string(x.what());
        LOG_WARNING("can't load \"" + translation_info.id_ + "\": " + cache_entry->error_message_);
        return FAILED;
    }

    cache_entry->load_in_flight_ = true;
    LOG_DEBUG("started loading \"" + translation_info.id_ + "\"");
    return LOADING;
}


void TranslationResolver::runLoad(const TranslationInfo translation_info) {
    std::shared_ptr<const TranslationTable> table;
    std::string error_message;
    try {
        table = loader_->load(translation_info);
        if (table == nullptr)
            error_message = "the loader returned no table";
    } catch (const std::exception &x) {
        error_message = x.what();
    }

    std::unique_lock<std::mutex> mutex_locker(mutex_);
    CacheEntry &cache_entry(translation_id_to_cache_entry_map_[translation_info.id_]);
    cache_entry.load_in_flight_ = false;
    if (error_message.empty()) {
        if (cache_entry.status_ == FAILED)
            LOG_INFO("late load of \"" + translation_info.id_ + "\" succeeded");
        cache_entry.status_ = LOADED;
        cache_entry.table_ = table;
        cache_entry.error_message_.clear();
    } else {
        cache_entry.status_ = FAILED;
        cache_entry.error_message_ = error_message;
        LOG_WARNING("failed to load \"" + translation_info.id_ + "\": " + error_message);
    }
    mutex_locker.unlock();

    load_finished_.notify_all();
}


TranslationResolver::LoadStatus TranslationResolver::requestLoad(const std::string &translation_id) {
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr)
        return FAILED;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    return startLoadIfNotLoaded(*translation_info, &translation_id_to_cache_entry_map_[translation_id]);
}


TranslationResolver::LoadStatus TranslationResolver::retryLoad(const std::string &translation_id) {
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr)
        return FAILED;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    CacheEntry &cache_entry(translation_id_to_cache_entry_map_[translation_id]);
    expireOverdueLoad(&cache_entry, translation_id);
    if (cache_entry.status_ == FAILED) {
        LOG_INFO("retrying to load \"" + translation_id + "\" (" + cache_entry.error_message_ + ")");
        cache_entry.status_ = NOT_LOADED;
        cache_entry.error_message_.clear();
    }

    return startLoadIfNotLoaded(*translation_info, &cache_entry);
}


TranslationResolver::LoadStatus TranslationResolver::getLoadStatus(const std::string &translation_id) {
    if (registry_.getTranslation(translation_id) == nullptr)
        return FAILED;

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto translation_id_and_cache_entry(translation_id_to_cache_entry_map_.find(translation_id));
    if (translation_id_and_cache_entry == translation_id_to_cache_entry_map_.end())
        return NOT_LOADED;

    expireOverdueLoad(&translation_id_and_cache_entry->second, translation_id);
    return translation_id_and_cache_entry->second.status_;
}


std::string TranslationResolver::getLoadError(const std::string &translation_id) {
    if (registry_.getTranslation(translation_id) == nullptr)
        return "unknown translation \"" + translation_id + "\"";

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    const auto translation_id_and_cache_entry(translation_id_to_cache_entry_map_.find(translation_id));
    if (translation_id_and_cache_entry == translation_id_to_cache_entry_map_.end())
        return "";

    expireOverdueLoad(&translation_id_and_cache_entry->second, translation_id);
    return translation_id_and_cache_entry->second.error_message_;
}


TranslationResolver::LoadStatus TranslationResolver::waitForLoad(const std::string &translation_id, const std::chrono::milliseconds max_wait) {
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr)
        return FAILED;

    const auto wait_deadline(std::chrono::steady_clock::now() + max_wait);
    std::unique_lock<std::mutex> mutex_locker(mutex_);
    CacheEntry &cache_entry(translation_id_to_cache_entry_map_[translation_id]);
    for (;;) {
        const LoadStatus load_status(startLoadIfNotLoaded(*translation_info, &cache_entry));
        if (load_status != LOADING)
            return load_status;

        auto deadline(wait_deadline);
        if (load_timeout_.count() > 0 and cache_entry.deadline_ < deadline)
            deadline = cache_entry.deadline_;
        if (load_finished_.wait_until(mutex_locker, deadline) == std::cv_status::timeout
            and std::chrono::steady_clock::now() >= wait_deadline)
        {
            expireOverdueLoad(&cache_entry, translation_id);
            return cache_entry.status_;
        }
    }
}


// mutex_ must be held by the caller.
std::shared_ptr<const TranslationTable> TranslationResolver::acquireTable(const std::string &translation_id, LoadStatus * const load_status) {
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr) {
        *load_status = FAILED;
        return nullptr;
    }

    CacheEntry &cache_entry(translation_id_to_cache_entry_map_[translation_id]);
    *load_status = startLoadIfNotLoaded(*translation_info, &cache_entry);
    return (*load_status == LOADED) ? cache_entry.table_ : nullptr;
}


// mutex_ must be held by the caller.
TranslationResolver::LoadStatus TranslationResolver::computeChapterOffset(const std::string &book_id, const unsigned chapter,
                                                                          unsigned * const offset)
{
    *offset = 0;

    // Only Psalms have superscription offsets, so there is no need to load anything for other books.
    const BibleUtil::BibleBook * const book(BibleUtil::FindBook(book_id));
    if (book == nullptr or book->id_ != "psalms")
        return LOADED;

    const ResolverSettings &settings(registry_.getSettings());
    LoadStatus source_status, reference_status;
    const auto source(acquireTable(settings.hebrew_source_, &source_status));
    const auto reference(acquireTable(settings.reference_translation_, &reference_status));
    if (source_status == LOADING or reference_status == LOADING)
        return LOADING;

    if (source == nullptr or reference == nullptr)
        LOG_DEBUG("can't compute the offset of Psalm " + std::to_string(chapter) + ", assuming 0");
    else
        *offset = Versification::ComputeOffset(book_id, chapter, source->getHighestVerseNumber(book_id, chapter),
                                               reference->getHighestVerseNumber(book_id, chapter));
    return LOADED;
}


VerseLookup TranslationResolver::resolveVerse(const std::string &translation_id, const std::string &book, const unsigned chapter,
                                              const unsigned verse, const unsigned chapter_offset)
{
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr)
        return VerseLookup(VerseLookup::UNKNOWN_TRANSLATION);

    std::shared_ptr<const TranslationTable> table;
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        LoadStatus load_status;
        table = acquireTable(translation_id, &load_status);
        if (load_status == LOADING)
            return VerseLookup(VerseLookup::LOADING);
        if (table == nullptr)
            return VerseLookup(VerseLookup::LOAD_FAILED);
    }

    return LookupLogicalVerse(*table, translation_info->numbering_, BibleUtil::BookNameToId(book), chapter, verse, chapter_offset);
}


VerseLookup TranslationResolver::resolveVerse(const std::string &translation_id, const std::string &book, const unsigned chapter,
                                              const unsigned verse)
{
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr)
        return VerseLookup(VerseLookup::UNKNOWN_TRANSLATION);

    unsigned chapter_offset(0);
    if (translation_info->numbering_ == Versification::MASORETIC) {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        if (computeChapterOffset(BibleUtil::BookNameToId(book), chapter, &chapter_offset) == LOADING) {
            startLoadIfNotLoaded(*translation_info, &translation_id_to_cache_entry_map_[translation_id]);
            return VerseLookup(VerseLookup::LOADING);
        }
    }

    return resolveVerse(translation_id, book, chapter, verse, chapter_offset);
}


AlignedChapter TranslationResolver::getChapterVerses(const std::string &translation_id, const std::string &book, const unsigned chapter) {
    const TranslationInfo * const translation_info(registry_.getTranslation(translation_id));
    if (translation_info == nullptr)
        return AlignedChapter(VerseLookup::UNKNOWN_TRANSLATION);

    const std::string book_id(BibleUtil::BookNameToId(book));
    const BibleUtil::BibleBook * const bible_book(BibleUtil::FindBook(book));
    const bool is_old_testament(bible_book != nullptr and bible_book->testament_ == BibleUtil::OLD_TESTAMENT);

    const ResolverSettings &settings(registry_.getSettings());
    std::shared_ptr<const TranslationTable> translation, reference, source;
    unsigned offset(0);
    {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        LoadStatus translation_status, reference_status, source_status;
        translation = acquireTable(translation_id, &translation_status);
        reference = acquireTable(settings.reference_translation_, &reference_status);
        source = acquireTable(is_old_testament ? settings.hebrew_source_ : settings.greek_source_, &source_status);
        if (translation_status == LOADING or reference_status == LOADING or source_status == LOADING)
            return AlignedChapter(VerseLookup::LOADING);
        if (translation == nullptr or reference == nullptr)
            return AlignedChapter(VerseLookup::LOAD_FAILED);
    }

    const unsigned verse_count(reference->getHighestVerseNumber(book_id, chapter));
    if (verse_count == 0)
        return AlignedChapter(VerseLookup::VERSE_NOT_FOUND);

    if (is_old_testament and source != nullptr)
        offset = Versification::ComputeOffset(book_id, chapter, source->getHighestVerseNumber(book_id, chapter), verse_count);

    AlignedChapter aligned_chapter(VerseLookup::FOUND);
    aligned_chapter.offset_ = offset;
    for (unsigned verse(1); verse <= verse_count; ++verse) {
        AlignedVerse aligned_verse(verse);
        if (source != nullptr) {
            const unsigned source_verse(is_old_testament ? Versification::ResolveSourceVerse(verse, offset) : verse);
            source->lookup(book_id, chapter, source_verse, &aligned_verse.original_text_);
            if (verse == 1 and offset > 0)
                aligned_verse.superscription_ = GetSuperscription(*source, book_id, chapter, offset);
        }

        const VerseLookup verse_lookup(LookupLogicalVerse(*translation, translation_info->numbering_, book_id, chapter, verse, offset));
        if (verse_lookup.status_ == VerseLookup::FOUND) {
            aligned_verse.translation_text_ = verse_lookup.text_;
            aligned_verse.translation_superscription_ = verse_lookup.superscription_;
        } else
            reference->lookup(book_id, chapter, verse, &aligned_verse.translation_text_);

        aligned_chapter.verses_.emplace_back(aligned_verse);
    }

    return aligned_chapter;
}


size_t TranslationResolver::getUnjoinedLoadThreadCount() const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    size_t unjoined_load_thread_count(0);
    for (const auto &translation_id_and_cache_entry : translation_id_to_cache_entry_map_) {
        if (translation_id_and_cache_entry.second.load_thread_.joinable())
            ++unjoined_load_thread_count;
    }

    return unjoined_load_thread_count;
}


std::string TranslationResolver::LoadStatusToString(const LoadStatus load_status) {
    switch (load_status) {
    case NOT_LOADED:
        return "not loaded";
    case LOADING:
        return "loading";
    case LOADED:
        return "loaded";
    case FAILED:
        return "failed";
    }

    LOG_ERROR("unknown load status " + std::to_string(load_status) + "!");
}
