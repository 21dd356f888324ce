#include "exception.hpp"
#include "fake_object_store.hpp"
#include "local_handler.hpp"
#include "s3_handler.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace objxfer;
namespace fs = std::filesystem;

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "objxfer_test_transfer" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "staging");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void CreateFile(const fs::path& relative_path, const std::string& content = "test content") {
        fs::path full_path = test_dir / relative_path;
        fs::create_directories(full_path.parent_path());
        std::ofstream file(full_path);
        file << content;
    }

    std::string ReadFile(const fs::path& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    // Creates an s3 handler on a fake store, the store stays owned by the handler
    std::unique_ptr<s3_handler> CreateHandler(const std::string& bucket, const std::string& directory,
                                              bool owner_full_control = true) {
        transfer_spec spec;
        spec.bucket = bucket;
        spec.directory = directory;
        spec.protocol.bucket_owner_full_control = owner_full_control;

        auto fake = std::make_unique<fake_object_store>();
        store = fake.get();
        return std::make_unique<s3_handler>(spec, std::move(fake), log);
    }

    fs::path test_dir;
    fake_object_store* store = nullptr;
    logger log{"test", "transfer-test", "T"};
};

TEST_F(TransferTest, Upload) {
    auto handler = CreateHandler("bucket", "out");
    CreateFile("staging/a.txt", "alpha");
    CreateFile("staging/b.txt", "beta");

    EXPECT_EQ(handler->push_files_from_worker(test_dir / "staging"), 0);

    ASSERT_TRUE(store->exists("bucket", "out/a.txt"));
    ASSERT_TRUE(store->exists("bucket", "out/b.txt"));
    EXPECT_EQ(store->buckets["bucket"]["out/a.txt"].data, "alpha");
    EXPECT_EQ(store->buckets["bucket"]["out/b.txt"].data, "beta");
}

TEST_F(TransferTest, UploadEmptyDirectory) {
    auto handler = CreateHandler("bucket", "");
    CreateFile("staging/a.txt");

    EXPECT_EQ(handler->push_files_from_worker(test_dir / "staging"), 0);
    EXPECT_TRUE(store->exists("bucket", "a.txt"));
}

TEST_F(TransferTest, UploadSkipsHiddenFilesAndDirectories) {
    auto handler = CreateHandler("bucket", "out/");
    CreateFile("staging/a.txt");
    CreateFile("staging/.hidden");
    CreateFile("staging/sub/nested.txt");

    EXPECT_EQ(handler->push_files_from_worker(test_dir / "staging"), 0);
    ASSERT_EQ(store->calls.size(), 1u);
    EXPECT_EQ(store->calls[0], "upload a.txt -> bucket/out/a.txt");
}

TEST_F(TransferTest, UploadContinuesAfterFailure) {
    auto handler = CreateHandler("bucket", "out");
    for (int i = 1; i <= 5; ++i) {
        CreateFile("staging/file" + std::to_string(i) + ".txt");
    }
    store->fail_keys.insert("out/file3.txt");

    EXPECT_EQ(handler->push_files_from_worker(test_dir / "staging"), 1);

    EXPECT_EQ(store->local_io, 5);
    EXPECT_TRUE(store->exists("bucket", "out/file1.txt"));
    EXPECT_TRUE(store->exists("bucket", "out/file2.txt"));
    EXPECT_FALSE(store->exists("bucket", "out/file3.txt"));
    EXPECT_TRUE(store->exists("bucket", "out/file4.txt"));
    EXPECT_TRUE(store->exists("bucket", "out/file5.txt"));
}

TEST_F(TransferTest, UploadOwnerFullControl) {
    auto handler = CreateHandler("bucket", "out");
    CreateFile("staging/a.txt");

    EXPECT_EQ(handler->push_files_from_worker(test_dir / "staging"), 0);
    ASSERT_EQ(store->uploads.size(), 1u);
    ASSERT_TRUE(store->uploads[0].acl.has_value());
    EXPECT_EQ(*store->uploads[0].acl, "bucket-owner-full-control");
}

TEST_F(TransferTest, UploadWithoutOwnerFullControl) {
    auto handler = CreateHandler("bucket", "out", false);
    CreateFile("staging/a.txt");

    EXPECT_EQ(handler->push_files_from_worker(test_dir / "staging"), 0);
    ASSERT_EQ(store->uploads.size(), 1u);
    EXPECT_FALSE(store->uploads[0].acl.has_value());
}

TEST_F(TransferTest, UploadMissingStagingDirectory) {
    auto handler = CreateHandler("bucket", "out");
    EXPECT_THROW(handler->push_files_from_worker(test_dir / "missing"), objxfer::exception);
}

TEST_F(TransferTest, Download) {
    auto handler = CreateHandler("bucket", "in");
    store->put("bucket", "in/a.txt", "alpha");
    store->put("bucket", "in/deep/b.txt", "beta");

    EXPECT_EQ(handler->pull_files_to_worker({"in/a.txt", "in/deep/b.txt"}, test_dir / "staging"), 0);

    EXPECT_EQ(ReadFile(test_dir / "staging" / "a.txt"), "alpha");
    EXPECT_EQ(ReadFile(test_dir / "staging" / "b.txt"), "beta");
}

TEST_F(TransferTest, DownloadContinuesAfterFailure) {
    auto handler = CreateHandler("bucket", "in");
    store->put("bucket", "in/a.txt");
    store->put("bucket", "in/c.txt");

    EXPECT_EQ(handler->pull_files_to_worker({"in/a.txt", "in/b.txt", "in/c.txt"}, test_dir / "staging"), 1);

    EXPECT_EQ(store->local_io, 3);
    EXPECT_TRUE(fs::exists(test_dir / "staging" / "a.txt"));
    EXPECT_FALSE(fs::exists(test_dir / "staging" / "b.txt"));
    EXPECT_TRUE(fs::exists(test_dir / "staging" / "c.txt"));
}

TEST_F(TransferTest, CopyBetweenBuckets) {
    auto source = CreateHandler("source", "in");
    fake_object_store* source_store = store;
    source_store->put("source", "in/a.txt", "alpha");
    source_store->put("source", "in/b.txt", "beta");

    transfer_spec dest_spec;
    dest_spec.bucket = "dest";
    dest_spec.directory = "out";
    s3_handler destination(dest_spec, std::make_unique<fake_object_store>(), log);

    EXPECT_TRUE(source->supports_native_copy(destination));
    EXPECT_EQ(source->transfer_files({"in/a.txt", "in/b.txt"}, destination), 0);

    EXPECT_EQ(source_store->local_io, 0);
    EXPECT_EQ(source_store->buckets["dest"]["out/a.txt"].data, "alpha");
    EXPECT_EQ(source_store->buckets["dest"]["out/b.txt"].data, "beta");
    EXPECT_TRUE(source_store->exists("source", "in/a.txt"));

    ASSERT_EQ(source_store->calls.size(), 2u);
    EXPECT_EQ(source_store->calls[0], "copy source/in/a.txt -> dest/out/a.txt");
    EXPECT_EQ(source_store->calls[1], "copy source/in/b.txt -> dest/out/b.txt");
}

TEST_F(TransferTest, CopyContinuesAfterFailure) {
    auto source = CreateHandler("source", "in");
    fake_object_store* source_store = store;
    source_store->put("source", "in/a.txt");
    source_store->put("source", "in/b.txt");
    source_store->put("source", "in/c.txt");
    source_store->fail_keys.insert("in/b.txt");

    transfer_spec dest_spec;
    dest_spec.bucket = "dest";
    s3_handler destination(dest_spec, std::make_unique<fake_object_store>(), log);

    EXPECT_EQ(source->transfer_files({"in/a.txt", "in/b.txt", "in/c.txt"}, destination), 1);
    EXPECT_TRUE(source_store->exists("dest", "a.txt"));
    EXPECT_FALSE(source_store->exists("dest", "b.txt"));
    EXPECT_TRUE(source_store->exists("dest", "c.txt"));
}

TEST_F(TransferTest, CopyToLocalIsUnsupported) {
    auto source = CreateHandler("source", "in");
    store->put("source", "in/a.txt");

    transfer_spec dest_spec;
    dest_spec.backend = "local";
    dest_spec.directory = (test_dir / "staging").string();
    local_handler destination(dest_spec, log);

    EXPECT_FALSE(source->supports_native_copy(destination));
    EXPECT_THROW(source->transfer_files({"in/a.txt"}, destination), unsupported_operation);
    EXPECT_TRUE(store->calls.empty());
}

TEST_F(TransferTest, MoveToFinalLocationIsUnsupported) {
    auto handler = CreateHandler("bucket", "out");
    EXPECT_THROW(handler->move_files_to_final_location({"out/a.txt"}), unsupported_operation);
}

TEST_F(TransferTest, Tidy) {
    auto handler = CreateHandler("bucket", "out");
    handler->tidy();
    EXPECT_TRUE(store->closed);

    // Second call is a no-op
    handler->tidy();

    EXPECT_THROW(handler->list_files("out/"), objxfer::exception);
    EXPECT_THROW(handler->pull_files_to_worker({"out/a.txt"}, test_dir / "staging"), objxfer::exception);
}

TEST_F(TransferTest, ListFiles) {
    auto handler = CreateHandler("bucket", "in");
    store->put("bucket", "in/a.csv");
    store->put("bucket", "in/b.txt");

    auto files = handler->list_files("in/", ".*\\.csv");
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 1u);
    EXPECT_EQ(files->begin()->first, "in/a.csv");

    EXPECT_FALSE(handler->list_files("missing/").has_value());
}

TEST_F(TransferTest, HandlerRequiresBucket) {
    transfer_spec spec;
    EXPECT_THROW((s3_handler(spec, std::make_unique<fake_object_store>(), log)), config_error);
}
