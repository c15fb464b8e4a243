#include <gtest/gtest.h>
#include "beamdrop/core/error.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/storage/collection_builder.hpp"
#include "beamdrop/storage/collection_exporter.hpp"
#include "beamdrop/storage/fs_store.hpp"
#include "test_support.hpp"

using namespace beamdrop::storage;
using beamdrop::core::ErrorCode;
using beamdrop::core::ItemError;
using beamdrop::core::TransferError;
using beamdrop::testing::TempDirectory;
using beamdrop::testing::read_file;
using beamdrop::testing::write_file;

namespace {

// Lists directories normally except the one named locked, which fails.
std::vector<std::filesystem::directory_entry> list_with_locked(const std::filesystem::path& directory,
                                                               std::error_code& ec) {
    if (directory.filename() == "locked") {
        ec = std::make_error_code(std::errc::permission_denied);
        return {};
    }
    return list_directory(directory, ec);
}

// Real store that cannot stage one particular file.
class FaultyStore : public Store {
public:
    enum class Fault {
        ReportsError,
        EndsWithoutResult
    };
    
    FaultyStore(Store& inner, std::string failing_file, Fault fault)
        : inner_(inner), failing_file_(std::move(failing_file)), fault_(fault) {}
    
    void add_path(const std::filesystem::path& path, ImportMode mode,
                  BlobFormat format, const AddProgressHandler& progress) override {
        if (path.filename() != failing_file_) {
            inner_.add_path(path, mode, format, progress);
            return;
        }
        progress(AddSize{std::filesystem::file_size(path)});
        if (fault_ == Fault::ReportsError) {
            progress(AddError{"device removed"});
        }
    }
    
    TempTag add_bytes(std::span<const std::uint8_t> data, BlobFormat format) override {
        ++bytes_added;
        return inner_.add_bytes(data, format);
    }
    
    void export_blob(const Hash& hash, const std::filesystem::path& target,
                     ExportMode mode, const BlobExportHandler& progress) override {
        inner_.export_blob(hash, target, mode, progress);
    }
    
    bool has(const Hash& hash) const override { return inner_.has(hash); }
    std::optional<std::uint64_t> size(const Hash& hash) const override { return inner_.size(hash); }
    std::unique_ptr<BlobReader> reader(const Hash& hash) const override { return inner_.reader(hash); }
    LocalInfo local(const HashAndFormat& root) const override { return inner_.local(root); }
    std::unique_ptr<PartialBlobWriter> begin_partial(const Hash& hash) override { return inner_.begin_partial(hash); }
    TempTag temp_tag(const HashAndFormat& value) override { return inner_.temp_tag(value); }
    std::size_t gc() override { return inner_.gc(); }
    void shutdown() override { inner_.shutdown(); }
    
    int bytes_added = 0;

private:
    Store& inner_;
    std::string failing_file_;
    Fault fault_;
};

}

class CollectionTest : public ::testing::Test {
protected:
    ImportResult import_path(const std::filesystem::path& path, WalkPolicy policy = {}) {
        CollectionBuilder builder(policy);
        return builder.import(path, store_, [this](const ImportProgress& progress) {
            progress_.push_back(progress);
        });
    }
    
    TempDirectory dir_{"beamdrop_collection"};
    FsStore store_{dir_ / "store"};
    std::vector<ImportProgress> progress_;
};

TEST_F(CollectionTest, SingleEmptyFile) {
    write_file(dir_ / "src" / "a.txt", "");
    
    auto result = import_path(dir_ / "src" / "a.txt");
    ASSERT_EQ(result.collection.size(), 1u);
    EXPECT_EQ(result.collection[0].first, "a.txt");
    EXPECT_EQ(result.collection[0].second, beamdrop::crypto::hash_utils::empty_hash());
    EXPECT_EQ(result.total_size, 0u);
    EXPECT_EQ(result.tag.format(), BlobFormat::HashSeq);
    
    ASSERT_EQ(progress_.size(), 1u);
    EXPECT_EQ(progress_[0].total_files, 1u);
    EXPECT_EQ(progress_[0].done_files, 0u);
}

TEST_F(CollectionTest, DirectoryNamesIncludeTopLevelFolder) {
    write_file(dir_ / "src" / "d" / "x.txt", "xx");
    write_file(dir_ / "src" / "d" / "sub" / "y.txt", "yyy");
    
    auto result = import_path(dir_ / "src" / "d");
    ASSERT_EQ(result.collection.size(), 2u);
    EXPECT_EQ(result.collection[0].first, "d/sub/y.txt");
    EXPECT_EQ(result.collection[1].first, "d/x.txt");
    EXPECT_EQ(result.total_size, 5u);
    
    ASSERT_EQ(progress_.size(), 2u);
    EXPECT_EQ(progress_[1].done_files, 1u);
    EXPECT_EQ(progress_[1].total_size, 5u);
}

TEST_F(CollectionTest, ManyFilesAreSortedAndPinned) {
    for (int i = 9; i >= 0; --i) {
        write_file(dir_ / "src" / "batch" / ("file" + std::to_string(i) + ".bin"),
                   beamdrop::testing::random_content(1000 + i, i));
    }
    
    auto result = import_path(dir_ / "src" / "batch");
    ASSERT_EQ(result.collection.size(), 10u);
    for (std::size_t i = 1; i < result.collection.size(); ++i) {
        EXPECT_LT(result.collection[i - 1].first, result.collection[i].first);
    }
    
    // Only the collection tag is held, and it keeps everything alive
    EXPECT_EQ(store_.gc(), 0u);
    EXPECT_TRUE(store_.local(result.tag.hash_and_format()).complete);
}

TEST_F(CollectionTest, EmptyDirectoryGivesEmptyCollection) {
    std::filesystem::create_directories(dir_ / "src" / "empty");
    
    auto result = import_path(dir_ / "src" / "empty");
    EXPECT_TRUE(result.collection.empty());
    EXPECT_TRUE(progress_.empty());
    EXPECT_TRUE(Collection::load(store_, result.tag.hash()).empty());
}

TEST_F(CollectionTest, MissingPathIsNotFound) {
    try {
        import_path(dir_ / "nowhere");
        FAIL() << "expected NotFound";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(CollectionTest, ProgressHandlerCanAbort) {
    write_file(dir_ / "src" / "d" / "one.txt", "1");
    write_file(dir_ / "src" / "d" / "two.txt", "2");
    
    CollectionBuilder builder;
    EXPECT_THROW(builder.import(dir_ / "src" / "d", store_, [](const ImportProgress& progress) {
        if (progress.done_files == 1) {
            throw TransferError(ErrorCode::ChannelClosed, "consumer gone");
        }
    }), TransferError);
}

TEST_F(CollectionTest, UnreadableDirectoryIsSkippedWhenTolerated) {
    write_file(dir_ / "src" / "d" / "ok.txt", "fine");
    write_file(dir_ / "src" / "d" / "locked" / "secret.txt", "hidden");
    
    WalkPolicy policy;
    policy.lister = list_with_locked;
    auto result = import_path(dir_ / "src" / "d", policy);
    
    EXPECT_EQ(result.skipped_entries, 1u);
    ASSERT_EQ(result.collection.size(), 1u);
    EXPECT_EQ(result.collection[0].first, "d/ok.txt");
    EXPECT_EQ(result.total_size, 4u);
}

TEST_F(CollectionTest, UnreadableDirectoryFailsWhenNotTolerated) {
    write_file(dir_ / "src" / "d" / "ok.txt", "fine");
    write_file(dir_ / "src" / "d" / "locked" / "secret.txt", "hidden");
    
    WalkPolicy policy;
    policy.tolerate_entry_errors = false;
    policy.lister = list_with_locked;
    try {
        import_path(dir_ / "src" / "d", policy);
        FAIL() << "expected WalkError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::WalkError);
        EXPECT_NE(std::string(e.what()).find("locked"), std::string::npos);
    }
    EXPECT_TRUE(progress_.empty());
}

TEST_F(CollectionTest, UnreadableRootAlwaysFails) {
    write_file(dir_ / "src" / "locked" / "a.txt", "a");
    
    WalkPolicy policy;
    policy.lister = list_with_locked;
    try {
        import_path(dir_ / "src" / "locked", policy);
        FAIL() << "expected WalkError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::WalkError);
    }
}

TEST_F(CollectionTest, StoreErrorAbortsImport) {
    write_file(dir_ / "src" / "d" / "first.txt", "one");
    write_file(dir_ / "src" / "d" / "second.txt", "two");
    FaultyStore faulty(store_, "second.txt", FaultyStore::Fault::ReportsError);
    
    CollectionBuilder builder;
    try {
        builder.import(dir_ / "src" / "d", faulty, [](const ImportProgress&) {});
        FAIL() << "expected ImportError";
    } catch (const ItemError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ImportError);
        EXPECT_EQ(e.name(), "d/second.txt");
        EXPECT_EQ(e.cause(), "device removed");
    }
    
    // No collection was published, and nothing stays pinned
    EXPECT_EQ(faulty.bytes_added, 0);
    store_.gc();
    EXPECT_FALSE(store_.has(beamdrop::crypto::hash_utils::hash_string("one")));
}

TEST_F(CollectionTest, StoreEndingWithoutResultAbortsImport) {
    write_file(dir_ / "src" / "d" / "only.txt", "solo");
    FaultyStore faulty(store_, "only.txt", FaultyStore::Fault::EndsWithoutResult);
    
    CollectionBuilder builder;
    try {
        builder.import(dir_ / "src" / "d", faulty, [](const ImportProgress&) {});
        FAIL() << "expected ImportError";
    } catch (const ItemError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ImportError);
        EXPECT_EQ(e.name(), "d/only.txt");
    }
    EXPECT_EQ(faulty.bytes_added, 0);
}

TEST_F(CollectionTest, LoadReturnsStoredCollection) {
    write_file(dir_ / "src" / "d" / "x.txt", "xx");
    write_file(dir_ / "src" / "d" / "sub" / "y.txt", "yyy");
    auto result = import_path(dir_ / "src" / "d");
    
    auto loaded = Collection::load(store_, result.tag.hash());
    EXPECT_EQ(loaded.entries(), result.collection.entries());
}

TEST_F(CollectionTest, LoadRejectsTraversalNames) {
    auto payload = store_.add_bytes(std::vector<std::uint8_t>{'x'}, BlobFormat::Raw);
    Collection hostile({{"../escape.txt", payload.hash()}});
    auto tag = hostile.store(store_);
    
    try {
        Collection::load(store_, tag.hash());
        FAIL() << "expected StoreError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::StoreError);
    }
}

TEST_F(CollectionTest, DecodeRejectsMismatchedCounts) {
    Collection collection({{"a.txt", beamdrop::crypto::hash_utils::empty_hash()}});
    auto metadata = collection.encode_metadata();
    std::vector<Hash> none;
    EXPECT_THROW(Collection::decode(metadata, none), TransferError);
    
    metadata[0] = 'X';
    std::vector<Hash> one = {beamdrop::crypto::hash_utils::empty_hash()};
    EXPECT_THROW(Collection::decode(metadata, one), TransferError);
}

TEST_F(CollectionTest, ExportRecreatesTree) {
    write_file(dir_ / "src" / "d" / "x.txt", "xx");
    write_file(dir_ / "src" / "d" / "sub" / "y.txt", "yyy");
    auto result = import_path(dir_ / "src" / "d");
    
    std::vector<ExportProgress> seen;
    CollectionExporter exporter;
    exporter.export_collection(store_, result.collection, dir_ / "out",
                               [&](const ExportProgress& progress) { seen.push_back(progress); });
    
    EXPECT_EQ(read_file(dir_ / "out" / "d" / "x.txt"), "xx");
    EXPECT_EQ(read_file(dir_ / "out" / "d" / "sub" / "y.txt"), "yyy");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].total_files, 2u);
    EXPECT_EQ(seen[1].done_files, 1u);
}

TEST_F(CollectionTest, ExportRefusesExistingTarget) {
    write_file(dir_ / "src" / "report.txt", "fresh");
    auto result = import_path(dir_ / "src" / "report.txt");
    write_file(dir_ / "out" / "report.txt", "original");
    
    CollectionExporter exporter;
    try {
        exporter.export_collection(store_, result.collection, dir_ / "out", [](const ExportProgress&) {});
        FAIL() << "expected DestinationExists";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DestinationExists);
    }
    EXPECT_EQ(read_file(dir_ / "out" / "report.txt"), "original");
}

TEST_F(CollectionTest, ExportNamesTheFailingEntry) {
    auto missing = beamdrop::crypto::hash_utils::hash_string("never stored");
    Collection collection({{"lost.bin", missing}});
    
    CollectionExporter exporter;
    try {
        exporter.export_collection(store_, collection, dir_ / "out", [](const ExportProgress&) {});
        FAIL() << "expected ExportError";
    } catch (const ItemError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ExportError);
        EXPECT_EQ(e.name(), "lost.bin");
    }
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out" / "lost.bin"));
}
