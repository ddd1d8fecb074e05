#include <strongbox/common/critical.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>

#include <string>

namespace strongbox::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open ledger store at '{}': {}", path,
                  status.ToString());
    strongbox::common::critical("failed to open RocksDB ledger store");
  }
  spdlog::info("Opened ledger store at '{}'", path);
  store.database.reset(database);
  return store;
}

}  // namespace strongbox::storage
