#include <rocksdb/slice_transform.h>
#include <quartermaster/storage/rocksdb/storage.hpp>
#include <memory>
#include <string>

using namespace quartermaster::schema;

namespace quartermaster::storage {

namespace {

constexpr double kMemtablePrefixBloomRatio = 0.1;

/// Maps `AST|0000000003` to `AST|`. Keys without a separator have no prefix.
class collection_prefix_transform final
    : public ROCKSDB_NAMESPACE::SliceTransform {
 public:
  const char* Name() const override {
    return "quartermaster.CollectionPrefix";
  }

  ROCKSDB_NAMESPACE::Slice Transform(
      const ROCKSDB_NAMESPACE::Slice& key) const override {
    const auto view = std::string_view{key.data(), key.size()};
    return ROCKSDB_NAMESPACE::Slice{key.data(),
                                    view.find(kCollectionSeparator) + 1};
  }

  bool InDomain(const ROCKSDB_NAMESPACE::Slice& key) const override {
    const auto view = std::string_view{key.data(), key.size()};
    return view.find(kCollectionSeparator) != std::string_view::npos;
  }
};

}  // namespace

operation_result_t open_ledger_storage(const std::string_view path,
                                       rocksdb_storage_t& storage) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeForSmallDb();
  options.prefix_extractor =
      std::make_shared<collection_prefix_transform>();
  options.memtable_prefix_bloom_size_ratio = kMemtablePrefixBloomRatio;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open ledger database at {}: {}", path,
                  status.ToString());
    storage.database.reset();
    return make_failure(kPersistenceCodespace,
                        error_code_t::storage_unavailable,
                        "failed to open ledger database", status.ToString());
  }
  spdlog::debug("Opened ledger database at {}", path);
  storage.database.reset(database);
  return make_success(kPersistenceCodespace, path);
}

}  // namespace quartermaster::storage
