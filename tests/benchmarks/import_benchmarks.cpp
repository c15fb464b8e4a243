#include <benchmark/benchmark.h>
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/storage/collection_builder.hpp"
#include "beamdrop/storage/fs_store.hpp"
#include "beamdrop/storage/path_codec.hpp"
#include "test_support.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace beamdrop::storage;
using beamdrop::crypto::ContentHasher;

class ImportBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        dir_ = std::make_unique<beamdrop::testing::TempDirectory>("beamdrop_bench");
        file_size_ = static_cast<std::size_t>(state.range(0));
        
        // Ten files below a nested folder
        for (int i = 0; i < 10; ++i) {
            beamdrop::testing::write_file(dir_->path() / "src" / "album" / ("part" + std::to_string(i)) / "data.bin",
                                          beamdrop::testing::random_content(file_size_, static_cast<unsigned>(i)));
        }
    }
    
    void TearDown(const ::benchmark::State&) override {
        dir_.reset();
    }
    
protected:
    std::unique_ptr<beamdrop::testing::TempDirectory> dir_;
    std::size_t file_size_ = 0;
};

BENCHMARK_DEFINE_F(ImportBenchmarkFixture, CollectionImport)(benchmark::State& state) {
    CollectionBuilder builder;
    int round = 0;
    for (auto _ : state) {
        FsStore store(dir_->path() / ("store" + std::to_string(round++)));
        auto result = builder.import(dir_->path() / "src" / "album", store, [](const ImportProgress&) {});
        benchmark::DoNotOptimize(result.total_size);
        store.shutdown();
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(file_size_) * 10);
}
BENCHMARK_REGISTER_F(ImportBenchmarkFixture, CollectionImport)->Arg(64 * 1024)->Arg(4 * 1024 * 1024);

static void BM_ContentHash(benchmark::State& state) {
    auto content = beamdrop::testing::random_content(static_cast<std::size_t>(state.range(0)));
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(content.data()), content.size());
    
    for (auto _ : state) {
        benchmark::DoNotOptimize(ContentHasher::hash(data));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ContentHash)->Arg(1024)->Arg(1024 * 1024)->Arg(16 * 1024 * 1024);

static void BM_PathEncode(benchmark::State& state) {
    std::filesystem::path path = "photos/2024/summer trip/день 3/IMG_0042.jpg";
    for (auto _ : state) {
        benchmark::DoNotOptimize(path_codec::encode(path, true));
    }
}
BENCHMARK(BM_PathEncode);

static void BM_PathDecode(benchmark::State& state) {
    std::filesystem::path root = "/srv/incoming";
    std::string name = "photos/2024/summer trip/IMG_0042.jpg";
    for (auto _ : state) {
        benchmark::DoNotOptimize(path_codec::decode(root, name));
    }
}
BENCHMARK(BM_PathDecode);

static void BM_CollectionMetadata(benchmark::State& state) {
    Collection collection;
    for (int64_t i = 0; i < state.range(0); ++i) {
        collection.push("dir/file" + std::to_string(i) + ".txt",
                        beamdrop::crypto::hash_utils::hash_string(std::to_string(i)));
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(collection.encode_metadata());
    }
}
BENCHMARK(BM_CollectionMetadata)->Arg(10)->Arg(10000);
