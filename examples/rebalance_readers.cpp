/**
 * Reader rebalancing example
 *
 * This example demonstrates:
 * - Tracking live per-shard positions while records are consumed
 * - Snapshotting the reader group into one ReaderCheckpoint
 * - Splitting it across workers and persisting each worker's share
 * - Resuming a worker from its stored checkpoint
 */

#include <shardmark/checkpoint/reader_checkpoint.hpp>
#include <shardmark/checkpoint/shard_reader.hpp>
#include <shardmark/checkpoint/store.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace shardmark::checkpoint;

    const std::int64_t workers = argc > 1 ? std::atoll(argv[1]) : 3;
    StoreOptions store{.dir = std::filesystem::temp_directory_path() / "shardmark_example", .durable = false};
    if (auto env = load_store_options_from_env()) store = *env;

    // One tracker per shard, as the reading loops would hold them.
    std::vector<std::shared_ptr<ShardRecordsIterator>> readers;
    std::vector<std::shared_ptr<ShardPositionTracker>> trackers;
    for (int i = 0; i < 10; ++i) {
        auto start = ShardCheckpoint::trim_horizon("clickstream", "shardId-00000000000" + std::to_string(i));
        if (!start) {
            std::cerr << "bad position: " << start.error().message << "\n";
            return 1;
        }
        auto t = std::make_shared<ShardPositionTracker>(*start);
        trackers.push_back(t);
        readers.push_back(t);
    }

    // Consume a few records on every shard.
    for (std::size_t i = 0; i < trackers.size(); ++i) {
        for (int r = 0; r < 3; ++r) {
            RecordPosition rec{std::to_string(100 * (i + 1) + r), 0, 0};
            if (auto a = trackers[i]->advance(rec); !a) {
                std::cerr << "advance failed: " << a.error().message << "\n";
                return 1;
            }
        }
    }

    auto snapshot = ReaderCheckpoint::from_live_readers(readers);
    if (!snapshot) {
        std::cerr << "snapshot failed: " << snapshot.error().message << "\n";
        return 1;
    }
    std::cout << "snapshot: " << snapshot->to_string() << "\n";

    auto parts = snapshot->split_into(workers);
    if (!parts) {
        std::cerr << "split failed: " << parts.error().message << "\n";
        return 1;
    }

    for (std::size_t w = 0; w < parts->size(); ++w) {
        PersistingCheckpointMark mark((*parts)[w], "worker-" + std::to_string(w), store);
        if (auto ack = mark.acknowledge(); !ack) {
            std::cerr << "commit failed: " << ack.error().message << "\n";
            return 1;
        }
        std::cout << "worker-" << w << " owns " << (*parts)[w].size() << " shards\n";
    }

    auto resumed = load_checkpoint(store, "worker-0");
    if (!resumed) {
        std::cerr << "resume failed: " << resumed.error().message << "\n";
        return 1;
    }
    std::cout << "worker-0 resumes at " << resumed->to_string() << "\n";
    return 0;
}
