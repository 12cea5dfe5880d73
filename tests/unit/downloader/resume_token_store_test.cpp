#include <gtest/gtest.h>
#include <ferry/core/uuid.h>
#include <ferry/downloader/resume_token_store.hpp>

#include "test_support.h"

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ferry::downloader;
using namespace ferry::downloader::test;

namespace {

ResumeToken bytes_of(std::string_view s) {
    ResumeToken out(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
        out[i] = static_cast<std::byte>(s[i]);
    return out;
}

} // namespace

TEST(ResumeTokenStoreTest, SaveLoadExistsRemove) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path / "resume");
    const auto id = ferry::core::generateUUID();
    const auto token = make_token();

    auto saved = store.save(id, token);
    ASSERT_TRUE(saved.ok()) << saved.error().message;
    EXPECT_EQ(saved.value(), store.pathFor(id));
    EXPECT_EQ(saved.value().extension(), ".resume");
    EXPECT_TRUE(store.exists(id));
    EXPECT_EQ(store.count(), 1u);
    EXPECT_EQ(store.totalSize(), token.size());

    auto loaded = store.load(id);
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded.value(), token);

    EXPECT_TRUE(store.remove(id));
    EXPECT_FALSE(store.exists(id));
    EXPECT_FALSE(store.remove(id));
}

TEST(ResumeTokenStoreTest, SaveOverwritesPreviousToken) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    const auto id = ferry::core::generateUUID();
    ASSERT_TRUE(store.save(id, make_token("first")).ok());
    ASSERT_TRUE(store.save(id, make_token("second")).ok());
    EXPECT_EQ(store.load(id).value(), make_token("second"));
    EXPECT_EQ(store.count(), 1u);
}

TEST(ResumeTokenStoreTest, RejectsUnsafeIdsAndEmptyTokens) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    EXPECT_EQ(store.save("../escape", make_token()).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.save("", make_token()).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.save("ok", ResumeToken{}).error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(store.load("a/b").ok());
}

TEST(ResumeTokenStoreTest, LoadMissingTokenFails) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    EXPECT_FALSE(store.load(ferry::core::generateUUID()).ok());
}

TEST(ResumeTokenStoreTest, EnvelopeSniffing) {
    EXPECT_TRUE(ResumeTokenStore::isValidToken(bytes_of("bplist00\x01\x02")));
    EXPECT_TRUE(ResumeTokenStore::isValidToken(
        bytes_of("<?xml version=\"1.0\"?><!DOCTYPE plist><plist></plist>")));
    EXPECT_FALSE(ResumeTokenStore::isValidToken(bytes_of("bplist")));
    EXPECT_FALSE(ResumeTokenStore::isValidToken(bytes_of("garbage-bytes-here")));
    EXPECT_FALSE(ResumeTokenStore::isValidToken(ResumeToken{}));
}

TEST(ResumeTokenStoreTest, LoadValidatedDeletesCorruptToken) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    const auto id = ferry::core::generateUUID();
    ASSERT_TRUE(store.save(id, bytes_of("definitely not a plist")).ok());

    auto r = store.loadValidated(id);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::CorruptData);
    EXPECT_FALSE(store.exists(id));
}

TEST(ResumeTokenStoreTest, CleanupOrphanedKeepsOnlyKnownUuids) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    const auto keep = ferry::core::generateUUID();
    const auto drop = ferry::core::generateUUID();
    ASSERT_TRUE(store.save(keep, make_token()).ok());
    ASSERT_TRUE(store.save(drop, make_token()).ok());
    ASSERT_TRUE(store.save("not-a-uuid", make_token()).ok());
    write_file(tmp.path / "notes.txt", "ignored");

    EXPECT_EQ(store.cleanupOrphaned({keep, "not-a-uuid"}), 2u);
    EXPECT_TRUE(store.exists(keep));
    EXPECT_FALSE(store.exists(drop));
    EXPECT_FALSE(store.exists("not-a-uuid"));
    EXPECT_TRUE(fs::exists(tmp.path / "notes.txt"));
}

TEST(ResumeTokenStoreTest, CleanupOlderThanUsesModificationTime) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    const auto fresh = ferry::core::generateUUID();
    const auto stale = ferry::core::generateUUID();
    ASSERT_TRUE(store.save(fresh, make_token()).ok());
    ASSERT_TRUE(store.save(stale, make_token()).ok());
    fs::last_write_time(store.pathFor(stale),
                        fs::file_time_type::clock::now() - std::chrono::hours(24 * 8));

    EXPECT_EQ(store.cleanupOlderThan(ResumeTokenStore::kDefaultMaxAge), 1u);
    EXPECT_TRUE(store.exists(fresh));
    EXPECT_FALSE(store.exists(stale));
}

TEST(ResumeTokenStoreTest, RemoveManyRemoveAllAndListing) {
    TempDir tmp;
    ResumeTokenStore store(tmp.path);
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(ferry::core::generateUUID());
        ASSERT_TRUE(store.save(ids.back(), make_token()).ok());
    }
    auto listed = store.allTaskIds();
    auto sorted = ids;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(listed, sorted);

    EXPECT_EQ(store.removeMany({ids[0], "missing"}), 1u);
    EXPECT_EQ(store.removeAll(), 2u);
    EXPECT_EQ(store.count(), 0u);
    EXPECT_NE(store.diagnosticInfo().find("count=0"), std::string::npos);
}
