/** \brief Test cases for TranslationResolver
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
#define BOOST_TEST_MODULE TranslationResolver
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include "IniFile.h"
#include "JsonTranslationLoader.h"
#include "TranslationResolver.h"


namespace {


// Serves in-memory tables.  While the gate is closed, every load blocks.
class FakeLoader : public TranslationLoader {
    std::mutex mutex_;
    std::condition_variable gate_opened_;
    bool gate_open_;
    std::map<std::string, std::shared_ptr<const TranslationTable>> id_to_table_map_;
    std::set<std::string> failing_ids_;
    std::atomic<unsigned> load_count_;
public:
    explicit FakeLoader(const bool gate_open): gate_open_(gate_open), load_count_(0) { }

    void addTable(const std::shared_ptr<const TranslationTable> &table) {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        id_to_table_map_[table->getTranslationId()] = table;
    }

    void setFailing(const std::string &translation_id, const bool fail) {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        if (fail)
            failing_ids_.emplace(translation_id);
        else
            failing_ids_.erase(translation_id);
    }

    void openGate() {
        std::unique_lock<std::mutex> mutex_locker(mutex_);
        gate_open_ = true;
        mutex_locker.unlock();
        gate_opened_.notify_all();
    }

    unsigned getLoadCount() const { return load_count_; }

    std::shared_ptr<const TranslationTable> load(const TranslationInfo &translation_info) override {
        ++load_count_;

        std::unique_lock<std::mutex> mutex_locker(mutex_);
        gate_opened_.wait(mutex_locker, [this]() { return gate_open_; });
        if (failing_ids_.find(translation_info.id_) != failing_ids_.end())
            throw std::runtime_error("cannot read \"" + translation_info.file_ + "\"");

        const auto id_and_table(id_to_table_map_.find(translation_info.id_));
        if (id_and_table == id_to_table_map_.end())
            throw std::runtime_error("no table for \"" + translation_info.id_ + "\"");
        return id_and_table->second;
    }
};


// Verse texts look like "KJV Psalms 3:1".
void AddChapter(TranslationTable * const table, const std::string &prefix, const std::string &book_id, const std::string &book_name,
                const unsigned chapter, const unsigned verse_count)
{
    for (unsigned verse(1); verse <= verse_count; ++verse)
        table->addVerse(book_id, chapter, verse, prefix + " " + book_name + " " + std::to_string(chapter) + ":" + std::to_string(verse));
}


std::shared_ptr<FakeLoader> MakeLoader(const bool gate_open = true) {
    auto loader(std::make_shared<FakeLoader>(gate_open));

    // Psalm 3 has a one verse superscription in Hebrew numbering.
    auto kjv(std::make_shared<TranslationTable>("kjv"));
    AddChapter(kjv.get(), "KJV", "genesis", "Genesis", 1, 2);
    AddChapter(kjv.get(), "KJV", "psalms", "Psalms", 3, 8);
    AddChapter(kjv.get(), "KJV", "psalms", "Psalms", 23, 6);
    AddChapter(kjv.get(), "KJV", "john", "John", 1, 2);
    loader->addTable(kjv);

    auto esv(std::make_shared<TranslationTable>("esv"));
    AddChapter(esv.get(), "ESV", "psalms", "Psalms", 3, 7);
    AddChapter(esv.get(), "ESV", "psalms", "Psalms", 23, 6);
    loader->addTable(esv);

    auto jps(std::make_shared<TranslationTable>("jps"));
    AddChapter(jps.get(), "JPS", "genesis", "Genesis", 1, 2);
    AddChapter(jps.get(), "JPS", "psalms", "Psalms", 3, 9);
    AddChapter(jps.get(), "JPS", "psalms", "Psalms", 23, 7);
    loader->addTable(jps);

    auto hebrew(std::make_shared<TranslationTable>("hebrew-ot"));
    AddChapter(hebrew.get(), "HEB", "genesis", "Genesis", 1, 2);
    AddChapter(hebrew.get(), "HEB", "psalms", "Psalms", 3, 9);
    AddChapter(hebrew.get(), "HEB", "psalms", "Psalms", 23, 6);
    loader->addTable(hebrew);

    auto greek(std::make_shared<TranslationTable>("greek-nt"));
    AddChapter(greek.get(), "GRK", "john", "John", 1, 2);
    loader->addTable(greek);

    return loader;
}


TranslationRegistry MakeRegistry(const unsigned load_timeout = ResolverSettings::DEFAULT_LOAD_TIMEOUT) {
    ResolverSettings settings;
    settings.data_directory_ = "/nonexistent";
    settings.load_timeout_ = load_timeout;
    return TranslationRegistry(settings, {
        { "kjv", "King James Version", "KJV", "kjv.json", Versification::ENGLISH },
        { "esv", "English Standard Version", "ESV", "esv.json", Versification::ENGLISH },
        { "jps", "JPS Tanakh 1917", "JPS", "jps.json", Versification::MASORETIC },
        { "hebrew-ot", "Hebrew Old Testament", "WLC", "hebrew.json", Versification::MASORETIC },
        { "greek-nt", "Greek New Testament", "GNT", "greek.json", Versification::ENGLISH },
    });
}


const std::chrono::seconds MAX_WAIT(10);


void WaitForLoads(TranslationResolver * const resolver, const std::vector<std::string> &translation_ids) {
    for (const auto &translation_id : translation_ids)
        resolver->waitForLoad(translation_id, MAX_WAIT);
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(UnknownTranslation) {
    TranslationResolver resolver(MakeRegistry(), MakeLoader());
    BOOST_CHECK_EQUAL(resolver.resolveVerse("nab", "Genesis", 1, 1).status_, VerseLookup::UNKNOWN_TRANSLATION);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("nab", "Genesis", 1, 1, 0).status_, VerseLookup::UNKNOWN_TRANSLATION);
    BOOST_CHECK_EQUAL(resolver.getChapterVerses("nab", "Genesis", 1).status_, VerseLookup::UNKNOWN_TRANSLATION);
    BOOST_CHECK_EQUAL(resolver.requestLoad("nab"), TranslationResolver::FAILED);
    BOOST_CHECK_EQUAL(resolver.getLoadStatus("nab"), TranslationResolver::FAILED);
    BOOST_CHECK(not resolver.getLoadError("nab").empty());
}


BOOST_AUTO_TEST_CASE(LoadOnFirstUse) {
    const auto loader(MakeLoader());
    TranslationResolver resolver(MakeRegistry(), loader);
    BOOST_CHECK_EQUAL(resolver.getLoadStatus("kjv"), TranslationResolver::NOT_LOADED);

    // The first request only starts the load.
    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Genesis", 1, 1).status_, VerseLookup::LOADING);
    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", MAX_WAIT), TranslationResolver::LOADED);

    const VerseLookup verse_lookup(resolver.resolveVerse("kjv", "Genesis", 1, 1));
    BOOST_CHECK_EQUAL(verse_lookup.status_, VerseLookup::FOUND);
    BOOST_CHECK_EQUAL(verse_lookup.text_, "KJV Genesis 1:1");
    BOOST_CHECK(not verse_lookup.superscription_);

    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Genesis", 1, 3).status_, VerseLookup::VERSE_NOT_FOUND);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Exodus", 1, 1).status_, VerseLookup::VERSE_NOT_FOUND);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Genesis", 1, 0).status_, VerseLookup::VERSE_NOT_FOUND);
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 1u);
    BOOST_CHECK_EQUAL(resolver.getLoadError("kjv"), "");
}


BOOST_AUTO_TEST_CASE(ConcurrentRequestsShareOneLoad) {
    const auto loader(MakeLoader(/* gate_open = */ false));
    TranslationResolver resolver(MakeRegistry(), loader);

    std::atomic<unsigned> unexpected_status_count(0);
    std::vector<std::thread> requesters(8);
    for (auto &requester : requesters) {
        requester = std::thread([&resolver, &unexpected_status_count]() {
            for (unsigned i(0); i < 10; ++i) {
                if (resolver.resolveVerse("kjv", "Psalms", 3, 1).status_ != VerseLookup::LOADING)
                    ++unexpected_status_count;
                if (resolver.requestLoad("kjv") != TranslationResolver::LOADING)
                    ++unexpected_status_count;
            }
        });
    }
    for (auto &requester : requesters)
        requester.join();

    BOOST_CHECK_EQUAL(unexpected_status_count.load(), 0u);
    BOOST_CHECK_EQUAL(resolver.getLoadStatus("kjv"), TranslationResolver::LOADING);

    loader->openGate();
    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", MAX_WAIT), TranslationResolver::LOADED);
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 1u);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Psalms", 3, 1).text_, "KJV Psalms 3:1");
}


BOOST_AUTO_TEST_CASE(FailedLoadIsOnlyRetriedOnRequest) {
    const auto loader(MakeLoader());
    loader->setFailing("esv", true);
    TranslationResolver resolver(MakeRegistry(), loader);

    BOOST_CHECK_EQUAL(resolver.waitForLoad("esv", MAX_WAIT), TranslationResolver::FAILED);
    BOOST_CHECK(resolver.getLoadError("esv").find("cannot read") != std::string::npos);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("esv", "Psalms", 3, 1).status_, VerseLookup::LOAD_FAILED);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("esv", "Psalms", 3, 2).status_, VerseLookup::LOAD_FAILED);
    BOOST_CHECK_EQUAL(resolver.requestLoad("esv"), TranslationResolver::FAILED);
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 1u);

    loader->setFailing("esv", false);
    BOOST_CHECK_EQUAL(resolver.retryLoad("esv"), TranslationResolver::LOADING);
    BOOST_CHECK_EQUAL(resolver.waitForLoad("esv", MAX_WAIT), TranslationResolver::LOADED);
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 2u);
    BOOST_CHECK_EQUAL(resolver.getLoadError("esv"), "");
    BOOST_CHECK_EQUAL(resolver.resolveVerse("esv", "Psalms", 3, 1).text_, "ESV Psalms 3:1");

    // Retrying a successful load is a no-op.
    BOOST_CHECK_EQUAL(resolver.retryLoad("esv"), TranslationResolver::LOADED);
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 2u);
}


BOOST_AUTO_TEST_CASE(RepeatedRetriesReuseOneLoadThread) {
    const auto loader(MakeLoader());
    loader->setFailing("esv", true);
    TranslationResolver resolver(MakeRegistry(), loader);

    const unsigned RETRY_COUNT(300);
    BOOST_CHECK_EQUAL(resolver.waitForLoad("esv", MAX_WAIT), TranslationResolver::FAILED);
    for (unsigned retry(0); retry < RETRY_COUNT; ++retry) {
        resolver.retryLoad("esv");
        BOOST_REQUIRE_EQUAL(resolver.waitForLoad("esv", MAX_WAIT), TranslationResolver::FAILED);
        BOOST_REQUIRE_LE(resolver.getUnjoinedLoadThreadCount(), 1u);
    }
    BOOST_CHECK_EQUAL(loader->getLoadCount(), RETRY_COUNT + 1);

    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", MAX_WAIT), TranslationResolver::LOADED);
    BOOST_CHECK_LE(resolver.getUnjoinedLoadThreadCount(), 2u);

    loader->setFailing("esv", false);
    BOOST_CHECK_EQUAL(resolver.retryLoad("esv"), TranslationResolver::LOADING);
    BOOST_CHECK_EQUAL(resolver.waitForLoad("esv", MAX_WAIT), TranslationResolver::LOADED);
    BOOST_CHECK_LE(resolver.getUnjoinedLoadThreadCount(), 2u);
}


BOOST_AUTO_TEST_CASE(LoadTimeoutAndLateSuccess) {
    const auto loader(MakeLoader(/* gate_open = */ false));
    TranslationResolver resolver(MakeRegistry(/* load_timeout = */ 1), loader);

    BOOST_CHECK_EQUAL(resolver.requestLoad("kjv"), TranslationResolver::LOADING);
    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", std::chrono::seconds(5)), TranslationResolver::FAILED);
    BOOST_CHECK(resolver.getLoadError("kjv").find("timed out") != std::string::npos);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Genesis", 1, 1).status_, VerseLookup::LOAD_FAILED);

    // The load keeps running and its result is used once it arrives.
    loader->openGate();
    const auto give_up_time(std::chrono::steady_clock::now() + MAX_WAIT);
    while (resolver.getLoadStatus("kjv") != TranslationResolver::LOADED and std::chrono::steady_clock::now() < give_up_time)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    BOOST_CHECK_EQUAL(resolver.getLoadStatus("kjv"), TranslationResolver::LOADED);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("kjv", "Genesis", 1, 1).text_, "KJV Genesis 1:1");
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 1u);
}


BOOST_AUTO_TEST_CASE(RetryWhileTimedOutLoadIsRunning) {
    const auto loader(MakeLoader(/* gate_open = */ false));
    TranslationResolver resolver(MakeRegistry(/* load_timeout = */ 1), loader);

    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", std::chrono::seconds(5)), TranslationResolver::FAILED);
    BOOST_CHECK_EQUAL(resolver.retryLoad("kjv"), TranslationResolver::LOADING);

    loader->openGate();
    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", MAX_WAIT), TranslationResolver::LOADED);
    BOOST_CHECK_EQUAL(loader->getLoadCount(), 1u);
}


BOOST_AUTO_TEST_CASE(WaitForLoadGivesUp) {
    const auto loader(MakeLoader(/* gate_open = */ false));
    TranslationResolver resolver(MakeRegistry(), loader);

    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", std::chrono::milliseconds(50)), TranslationResolver::LOADING);
    loader->openGate();
    BOOST_CHECK_EQUAL(resolver.waitForLoad("kjv", MAX_WAIT), TranslationResolver::LOADED);
}


BOOST_AUTO_TEST_CASE(MasoreticNumberingWithExplicitOffset) {
    TranslationResolver resolver(MakeRegistry(), MakeLoader());
    WaitForLoads(&resolver, { "kjv", "jps" });

    // Logical Psalm 23:1 is stored as verse 2 in a Masoretic numbered translation.
    const VerseLookup jps_verse(resolver.resolveVerse("jps", "Psalms", 23, 1, 1));
    BOOST_CHECK_EQUAL(jps_verse.status_, VerseLookup::FOUND);
    BOOST_CHECK_EQUAL(jps_verse.text_, "JPS Psalms 23:2");
    BOOST_REQUIRE(jps_verse.superscription_);
    BOOST_CHECK_EQUAL(*jps_verse.superscription_, "JPS Psalms 23:1");

    const VerseLookup kjv_verse(resolver.resolveVerse("kjv", "Psalms", 23, 1, 1));
    BOOST_CHECK_EQUAL(kjv_verse.text_, "KJV Psalms 23:1");
    BOOST_CHECK(not kjv_verse.superscription_);

    const VerseLookup second_verse(resolver.resolveVerse("jps", "Psalms", 23, 2, 1));
    BOOST_CHECK_EQUAL(second_verse.text_, "JPS Psalms 23:3");
    BOOST_CHECK(not second_verse.superscription_);

    const VerseLookup two_verse_superscription(resolver.resolveVerse("jps", "Psalms", 3, 1, 2));
    BOOST_CHECK_EQUAL(two_verse_superscription.text_, "JPS Psalms 3:3");
    BOOST_REQUIRE(two_verse_superscription.superscription_);
    BOOST_CHECK_EQUAL(*two_verse_superscription.superscription_, "JPS Psalms 3:1 JPS Psalms 3:2");
}


BOOST_AUTO_TEST_CASE(MasoreticNumberingWithComputedOffset) {
    TranslationResolver resolver(MakeRegistry(), MakeLoader());

    // Needs the Hebrew source and the reference translation, neither of which has been loaded yet.
    BOOST_CHECK_EQUAL(resolver.resolveVerse("jps", "Psalms", 3, 1).status_, VerseLookup::LOADING);
    WaitForLoads(&resolver, { "kjv", "jps", "hebrew-ot" });

    const VerseLookup first_verse(resolver.resolveVerse("jps", "Psalms", 3, 1));
    BOOST_CHECK_EQUAL(first_verse.text_, "JPS Psalms 3:2");
    BOOST_REQUIRE(first_verse.superscription_);
    BOOST_CHECK_EQUAL(*first_verse.superscription_, "JPS Psalms 3:1");
    BOOST_CHECK_EQUAL(resolver.resolveVerse("jps", "Psalms", 3, 8).text_, "JPS Psalms 3:9");

    // Equal verse counts, no offset:
    BOOST_CHECK_EQUAL(resolver.resolveVerse("jps", "Psalms", 23, 1).text_, "JPS Psalms 23:1");

    // Not a psalm:
    BOOST_CHECK_EQUAL(resolver.resolveVerse("jps", "Genesis", 1, 1).text_, "JPS Genesis 1:1");

    // English numbered translations ignore the offset.
    BOOST_CHECK_EQUAL(resolver.resolveVerse("esv", "Psalms", 3, 1).status_, VerseLookup::LOADING);
    WaitForLoads(&resolver, { "esv" });
    BOOST_CHECK_EQUAL(resolver.resolveVerse("esv", "Psalms", 3, 1).text_, "ESV Psalms 3:1");
}


BOOST_AUTO_TEST_CASE(OffsetWithoutHebrewSource) {
    const auto loader(MakeLoader());
    loader->setFailing("hebrew-ot", true);
    TranslationResolver resolver(MakeRegistry(), loader);
    WaitForLoads(&resolver, { "kjv", "jps", "hebrew-ot" });

    const VerseLookup verse_lookup(resolver.resolveVerse("jps", "Psalms", 3, 1));
    BOOST_CHECK_EQUAL(verse_lookup.text_, "JPS Psalms 3:1");
    BOOST_CHECK(not verse_lookup.superscription_);
}


BOOST_AUTO_TEST_CASE(ChapterAlignmentWithSuperscription) {
    TranslationResolver resolver(MakeRegistry(), MakeLoader());
    BOOST_CHECK_EQUAL(resolver.getChapterVerses("jps", "Psalms", 3).status_, VerseLookup::LOADING);
    WaitForLoads(&resolver, { "kjv", "jps", "hebrew-ot" });

    const AlignedChapter chapter(resolver.getChapterVerses("jps", "Psalms", 3));
    BOOST_CHECK_EQUAL(chapter.status_, VerseLookup::FOUND);
    BOOST_CHECK_EQUAL(chapter.offset_, 1u);
    BOOST_REQUIRE_EQUAL(chapter.verses_.size(), 8u);

    const AlignedVerse &first_verse(chapter.verses_.front());
    BOOST_CHECK_EQUAL(first_verse.verse_, 1u);
    BOOST_CHECK_EQUAL(first_verse.original_text_, "HEB Psalms 3:2");
    BOOST_CHECK_EQUAL(first_verse.translation_text_, "JPS Psalms 3:2");
    BOOST_REQUIRE(first_verse.superscription_);
    BOOST_CHECK_EQUAL(*first_verse.superscription_, "HEB Psalms 3:1");
    BOOST_REQUIRE(first_verse.translation_superscription_);
    BOOST_CHECK_EQUAL(*first_verse.translation_superscription_, "JPS Psalms 3:1");

    const AlignedVerse &last_verse(chapter.verses_.back());
    BOOST_CHECK_EQUAL(last_verse.verse_, 8u);
    BOOST_CHECK_EQUAL(last_verse.original_text_, "HEB Psalms 3:9");
    BOOST_CHECK_EQUAL(last_verse.translation_text_, "JPS Psalms 3:9");
    BOOST_CHECK(not last_verse.superscription_);
    BOOST_CHECK(not last_verse.translation_superscription_);
}


BOOST_AUTO_TEST_CASE(ChapterAlignmentFallsBackToReference) {
    TranslationResolver resolver(MakeRegistry(), MakeLoader());
    WaitForLoads(&resolver, { "kjv", "esv", "hebrew-ot" });

    const AlignedChapter chapter(resolver.getChapterVerses("esv", "Psalms", 3));
    BOOST_REQUIRE_EQUAL(chapter.verses_.size(), 8u);
    BOOST_CHECK_EQUAL(chapter.verses_[0].translation_text_, "ESV Psalms 3:1");
    BOOST_CHECK_EQUAL(chapter.verses_[0].original_text_, "HEB Psalms 3:2");
    BOOST_CHECK(chapter.verses_[0].superscription_);
    BOOST_CHECK(not chapter.verses_[0].translation_superscription_);
    BOOST_CHECK_EQUAL(chapter.verses_[7].translation_text_, "KJV Psalms 3:8");
}


BOOST_AUTO_TEST_CASE(NewTestamentChapter) {
    TranslationResolver resolver(MakeRegistry(), MakeLoader());
    WaitForLoads(&resolver, { "kjv", "greek-nt" });

    const AlignedChapter chapter(resolver.getChapterVerses("kjv", "John", 1));
    BOOST_CHECK_EQUAL(chapter.status_, VerseLookup::FOUND);
    BOOST_CHECK_EQUAL(chapter.offset_, 0u);
    BOOST_REQUIRE_EQUAL(chapter.verses_.size(), 2u);
    BOOST_CHECK_EQUAL(chapter.verses_[1].original_text_, "GRK John 1:2");
    BOOST_CHECK_EQUAL(chapter.verses_[1].translation_text_, "KJV John 1:2");
    BOOST_CHECK(not chapter.verses_[0].superscription_);
}


BOOST_AUTO_TEST_CASE(ChapterFailures) {
    const auto loader(MakeLoader());
    loader->setFailing("hebrew-ot", true);
    loader->setFailing("esv", true);
    TranslationResolver resolver(MakeRegistry(), loader);
    WaitForLoads(&resolver, { "kjv", "esv", "hebrew-ot" });

    BOOST_CHECK_EQUAL(resolver.getChapterVerses("kjv", "Genesis", 50).status_, VerseLookup::VERSE_NOT_FOUND);
    BOOST_CHECK_EQUAL(resolver.getChapterVerses("esv", "Psalms", 3).status_, VerseLookup::LOAD_FAILED);

    // Without the Hebrew source there are neither original texts nor an offset.
    const AlignedChapter chapter(resolver.getChapterVerses("kjv", "Psalms", 3));
    BOOST_CHECK_EQUAL(chapter.status_, VerseLookup::FOUND);
    BOOST_CHECK_EQUAL(chapter.offset_, 0u);
    BOOST_REQUIRE_EQUAL(chapter.verses_.size(), 8u);
    BOOST_CHECK_EQUAL(chapter.verses_[0].original_text_, "");
    BOOST_CHECK_EQUAL(chapter.verses_[0].translation_text_, "KJV Psalms 3:1");
    BOOST_CHECK(not chapter.verses_[0].superscription_);
}


BOOST_AUTO_TEST_CASE(LoadStatusNames) {
    BOOST_CHECK_EQUAL(TranslationResolver::LoadStatusToString(TranslationResolver::NOT_LOADED), "not loaded");
    BOOST_CHECK_EQUAL(TranslationResolver::LoadStatusToString(TranslationResolver::FAILED), "failed");
}


BOOST_AUTO_TEST_CASE(FromConfigFile) {
    const TranslationRegistry registry{ IniFile("data/translations.conf") };
    TranslationResolver resolver(registry, std::make_shared<JsonTranslationLoader>(registry.getSettings().data_directory_));

    BOOST_CHECK_EQUAL(resolver.waitForLoad("web", MAX_WAIT), TranslationResolver::LOADED);
    BOOST_CHECK_EQUAL(resolver.resolveVerse("web", "1 Samuel", 3, 4).text_, "Then the LORD called Samuel, and he said, Here I am!");

    // The JPS file is not part of the test data.
    BOOST_CHECK_EQUAL(resolver.waitForLoad("jps", MAX_WAIT), TranslationResolver::FAILED);
    BOOST_CHECK(resolver.getLoadError("jps").find("jps-bible.json") != std::string::npos);
}
