/**
 * Unit tests for the TTL stores, the per-video merge cache and the
 * per-line segmentation cache.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "ai_hints.hpp"
#include "merge_cache.hpp"
#include "thai_segmenter.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Store whose reads fail and whose writes throw
class BrokenStore : public thai::TtlStore {
public:
    thai::StoreResult get(const std::string&) override {
        thai::StoreResult r;
        r.error = "backend unavailable";
        return r;
    }
    void set(const std::string&, const json&, int64_t) override {
        throw std::runtime_error("backend unavailable");
    }
};

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

class CacheTest : public thai_test::TestHarness {
private:
    thai_test::VocabWordBreaker breaker;
    thai::SegmenterConfig config;

public:
    CacheTest() {
        config.enable_dictionary_bonus = false;
    }

    void testMemoryStoreExpiry() {
        runTest("Memory store drops expired entries", []() {
            thai_test::ManualClock clock;
            thai::MemoryTtlStore store(clock.clock());
            store.set("k", json{{"v", 1}}, 10);

            auto fresh = store.get("k");
            clock.advance(11s);
            auto stale = store.get("k");
            auto missing = store.get("other");

            return fresh.success && fresh.data && (*fresh.data)["v"] == 1
                && stale.success && !stale.data
                && missing.success && !missing.data
                && store.size() == 0;
        });
    }

    void testJsonFileStoreRoundTrip() {
        runTest("JSON file store survives a reload and skips expired entries", []() {
            std::string path = tempPath("thai_segmenter_cache_test.json");
            std::remove(path.c_str());

            thai_test::ManualClock clock;
            {
                thai::JsonFileTtlStore store(path, clock.clock());
                store.set("long", json{{"tokens", {"ผม", "กิน"}}}, 3600);
                store.set("short", json{{"tokens", {"ข้าว"}}}, 5);
            }

            clock.advance(10s);
            thai::JsonFileTtlStore reloaded(path, clock.clock());
            auto longer = reloaded.get("long");
            auto shorter = reloaded.get("short");
            std::remove(path.c_str());

            return longer.data && (*longer.data)["tokens"].size() == 2
                && !shorter.data
                && reloaded.size() == 1;
        });
    }

    void testJsonFileStoreSkipsBadEntries() {
        runTest("JSON file store skips malformed entries", []() {
            std::string path = tempPath("thai_segmenter_cache_bad_test.json");
            {
                std::ofstream out(path, std::ios::trunc);
                out << R"({
                    "bad": {"value": {"tokens": ["ผม"]}, "expiry": "tomorrow"},
                    "noValue": {"expiry": 99999999999999},
                    "good": {"value": {"tokens": ["ผม", "กิน"]}, "expiry": 99999999999999, "timestamp": 1}
                })";
            }
            thai_test::ManualClock clock;
            thai::JsonFileTtlStore store(path, clock.clock());
            std::remove(path.c_str());

            auto good = store.get("good");
            auto bad = store.get("bad");
            return store.size() == 1 && good.data && !bad.data && bad.success;
        });
    }

    void testHugeTtlDoesNotOverflow() {
        runTest("Oversized TTL still yields a live entry", []() {
            thai_test::ManualClock clock;
            thai::MemoryTtlStore store(clock.clock());
            store.set("k", json{{"v", 1}}, INT64_MAX / 10);
            clock.advance(std::chrono::hours(24 * 365));
            auto r = store.get("k");
            return r.data && (*r.data)["v"] == 1;
        });
    }

    void testLineHash() {
        runTest("Line hash matches the stored key scheme", []() {
            return thai::line_hash("abc") == "7aigaz"
                && thai::line_hash("ผมกินข้าว") == "1ar50sg"
                && thai::line_hash("") == "ztntfp"
                && thai::merges_key("v1") == "thai_merges_v1"
                && thai::line_key("v1", "7aigaz") == "thai_seg_line_v1_7aigaz";
        });
    }

    void testHydrationIsDeferred() {
        runTest("Cold video hydrates on a later call", [this]() {
            thai::MemoryTtlStore store;
            store.set(thai::merges_key("v1"), json{{"phrases", {"กินข้าว"}}, {"ts", 0}}, 3600);
            thai::TaskQueue queue;
            thai::ThaiSegmenter engine(config, breaker, store, queue);

            auto cold = engine.segment("ผมกินข้าว", "v1");
            size_t queued = queue.pending();
            // A second cold call does not queue another read
            engine.segment("ผมกินข้าว", "v1");
            bool deduplicated = queue.pending() == queued;

            queue.run_pending();
            auto warm = engine.segment("ผมกินข้าว", "v1");

            return vectorsEqual(cold, {"ผม", "กิน", "ข้าว"})
                && queued == 1 && deduplicated
                && vectorsEqual(warm, {"ผม", "กินข้าว"});
        });
    }

    void testMergeSetIsMonotonic() {
        runTest("Hydration unions with merges added meanwhile", [this]() {
            thai::MemoryTtlStore store;
            store.set(thai::merges_key("v1"), json{{"phrases", {"ที่บ้าน"}}}, 3600);
            thai::TaskQueue queue;
            thai::MergeCache cache(config, store, queue);

            cache.merges_for("v1");
            cache.add_merges("v1", {"กินข้าว"});
            queue.run_pending();

            const thai::MergeSet& merges = cache.merges_for("v1");
            auto stored = store.get(thai::merges_key("v1"));
            return merges.contains("กินข้าว") && merges.contains("ที่บ้าน")
                && stored.data && (*stored.data)["phrases"].size() == 2
                && stored.data->contains("ts");
        });
    }

    void testHintOnColdVideoKeepsStoredMerges() {
        runTest("Hints after a restart extend the stored merges", [this]() {
            thai::MemoryTtlStore store;
            store.set(thai::merges_key("v1"), json{{"phrases", {"ที่บ้าน", "กินข้าว"}}}, 3600);
            thai::TaskQueue queue;
            thai::ThaiSegmenter engine(config, breaker, store, queue);

            engine.set_ai_merge_hints(thai::AiHintBatch{"v1", {{"ผมกิน", std::nullopt}}});
            queue.run_pending();

            auto stored = store.get(thai::merges_key("v1"));
            const thai::MergeSet* merges = engine.merge_cache().find("v1");
            auto spans = engine.segment("ผมกินข้าวที่บ้าน", "v1");

            return stored.data && (*stored.data)["phrases"].size() == 3
                && merges && merges->contains("ผมกิน")
                && merges->contains("ที่บ้าน") && merges->contains("กินข้าว")
                && spans.size() == 3 && spans.back() == "ที่บ้าน";
        });
    }

    void testPersistAfterEviction() {
        runTest("Persisting an evicted video unions with the store", [this]() {
            thai::SegmenterConfig small = config;
            small.max_cached_videos = 1;
            thai::MemoryTtlStore store;
            thai::TaskQueue queue;
            thai::MergeCache cache(small, store, queue);

            cache.add_merges("v1", {"กินข้าว"});
            queue.run_pending();
            cache.add_merges("v2", {"ที่บ้าน"});
            // v1 comes back cold and gets a new phrase; v2 is evicted with a write queued
            cache.add_merges("v1", {"ผมกิน"});
            cache.add_merges("v2", {"ขอบคุณ"});
            queue.run_pending();

            auto v1 = store.get(thai::merges_key("v1"));
            auto v2 = store.get(thai::merges_key("v2"));
            return v1.data && (*v1.data)["phrases"].size() == 2
                && v2.data && (*v2.data)["phrases"].size() == 2;
        });
    }

    void testQueuedWorkOutlivesEngine() {
        runTest("Tasks left on the queue run safely after the engine is gone", [this]() {
            thai::MemoryTtlStore store;
            store.set(thai::merges_key("v2"), json{{"phrases", {"กินข้าว"}}}, 3600);
            store.set(thai::line_key("v1", thai::line_hash("ผมกินข้าว")),
                      json{{"tokens", {"ผม", "กินข้าว"}}}, 3600);
            thai::TaskQueue queue;
            thai::FileHintProvider provider;
            provider.load_json(json{{"merges", {"ที่บ้าน"}}});

            std::optional<std::vector<std::string>> line;
            {
                thai::ThaiSegmenter engine(config, breaker, store, queue, nullptr, &provider);
                engine.segment("ผมกินข้าว", "v2");
                engine.set_ai_merge_hints(thai::AiHintBatch{"v3", {{"ผมกิน", std::nullopt}}});
                engine.request_merge_hints("v3", {"ผมกิน"});
                engine.improve_line_segmentation("v1", "ผมกินข้าว", {}, {},
                    [&](std::optional<std::vector<std::string>> tokens) { line = std::move(tokens); });
            }
            size_t queued = queue.pending();
            size_t ran = queue.run_pending();

            // Writes and lookups still finish; nothing lands in a destroyed engine
            auto v3 = store.get(thai::merges_key("v3"));
            return queued > 0 && ran == queued && queue.failed() == 0
                && provider.calls() == 0
                && v3.data && (*v3.data)["phrases"].size() == 1
                && line && vectorsEqual(*line, {"ผม", "กินข้าว"});
        });
    }

    void testAddMergesCapped() {
        runTest("Merge set never exceeds its cap", [this]() {
            thai::SegmenterConfig small = config;
            small.max_merges_per_video = 100;
            thai::MemoryTtlStore store;
            thai::TaskQueue queue;
            thai::MergeCache cache(small, store, queue);

            std::vector<std::string> phrases;
            for (int i = 0; i < 250; ++i) phrases.push_back("p" + std::to_string(i));
            size_t added = cache.add_merges("v1", phrases);
            size_t again = cache.add_merges("v1", {"p0", "extra"});
            return added == 100 && again == 0 && cache.merges_for("v1").size() == 100;
        });
    }

    void testEviction() {
        runTest("Oldest video is evicted past maxCachedVideos", [this]() {
            thai::SegmenterConfig small = config;
            small.max_cached_videos = 2;
            thai::MemoryTtlStore store;
            thai::TaskQueue queue;
            thai::MergeCache cache(small, store, queue);

            cache.add_merges("v1", {"กินข้าว"});
            cache.add_merges("v2", {"กินข้าว"});
            cache.add_merges("v3", {"กินข้าว"});
            return !cache.has_video("v1") && cache.has_video("v2") && cache.has_video("v3")
                && cache.video_count() == 2;
        });
    }

    void testStoreFailuresDegrade() {
        runTest("Store failures are logged and treated as misses", [this]() {
            BrokenStore store;
            thai::TaskQueue queue;
            thai::ThaiSegmenter engine(config, breaker, store, queue);

            engine.segment("ผมกินข้าว", "v1");
            engine.set_ai_merge_hints(thai::AiHintBatch{"v1", {{"กินข้าว", std::nullopt}}});
            queue.run_pending();

            // The persist task threw inside the queue; memory still holds the merge
            return queue.failed() == 1
                && vectorsEqual(engine.segment("ผมกินข้าว", "v1"), {"ผม", "กินข้าว"});
        });
    }

    void testStoreLineSegmentation() {
        runTest("Line segmentation stored, validated and persisted", [this]() {
            thai::MemoryTtlStore store;
            thai::TaskQueue queue;
            thai::ThaiSegmenter engine(config, breaker, store, queue);

            bool rejected = !engine.store_line_segmentation("v1", "ผมกินข้าว", {"ผม", "กิน"});
            bool accepted = engine.store_line_segmentation("v1", " ผมกินข้าว ", {"ผมกิน", "ข้าว"});
            auto cached = engine.cached_line_segmentation("v1", "ผมกินข้าว");
            queue.run_pending();

            auto stored = store.get(thai::line_key("v1", thai::line_hash("ผมกินข้าว")));
            return rejected && accepted
                && cached && vectorsEqual(*cached, {"ผมกิน", "ข้าว"})
                && stored.data && (*stored.data)["tokens"].size() == 2
                && !engine.cached_line_segmentation("", "ผมกินข้าว");
        });
    }

    void testLineCacheFromStore() {
        runTest("Improved line loads from the store on a later drain", [this]() {
            thai::MemoryTtlStore store;
            store.set(thai::line_key("v1", thai::line_hash("ผมกินข้าว")),
                      json{{"tokens", {"ผม", "กินข้าว"}}}, 3600);
            thai::TaskQueue queue;
            thai::NullAiHintProvider provider;
            thai::ThaiSegmenter engine(config, breaker, store, queue, nullptr, &provider);

            std::optional<std::vector<std::string>> result;
            bool called = false;
            engine.improve_line_segmentation("v1", "ผมกินข้าว", {"ผม", "กิน", "ข้าว"}, {"ผม", "กิน", "ข้าว"},
                [&](std::optional<std::vector<std::string>> tokens) {
                    called = true;
                    result = std::move(tokens);
                });
            bool deferred = !called;
            queue.run_pending();

            auto memory = engine.cached_line_segmentation("v1", "ผมกินข้าว");
            return deferred && called && result && vectorsEqual(*result, {"ผม", "กินข้าว"})
                && memory && vectorsEqual(*memory, {"ผม", "กินข้าว"});
        });
    }

    void runAll() {
        std::cout << "\nRunning Cache Tests..." << std::endl;
        std::cout << "================================" << std::endl;

        testMemoryStoreExpiry();
        testJsonFileStoreRoundTrip();
        testJsonFileStoreSkipsBadEntries();
        testHugeTtlDoesNotOverflow();
        testLineHash();
        testHydrationIsDeferred();
        testMergeSetIsMonotonic();
        testHintOnColdVideoKeepsStoredMerges();
        testPersistAfterEviction();
        testQueuedWorkOutlivesEngine();
        testAddMergesCapped();
        testEviction();
        testStoreFailuresDegrade();
        testStoreLineSegmentation();
        testLineCacheFromStore();

        printResults();
    }
};

int main() {
    CacheTest tests;
    tests.runAll();
    return tests.getFailCount() > 0 ? 1 : 0;
}
