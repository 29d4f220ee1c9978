/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <boost/assert.hpp>

#include "storage/database_error.hpp"
#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "utils/mkdirs.hpp"

namespace conductor::storage {
  namespace fs = std::filesystem;

  RocksDb::RocksDb() : logger_(log::createLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;
    // commitment records must survive a crash right after `put` returns
    wo_.sync = true;
  }

  RocksDb::~RocksDb() {
    for (auto *handle : column_family_handles_) {
      db_->DestroyColumnFamilyHandle(handle);
    }
    if (db_ != nullptr) {
      auto status = db_->Close();
      if (not status.ok()) {
        SL_ERROR(logger_, "Can't close database: {}", status.ToString());
      }
    }
    delete db_;
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDb::create(
      const fs::path &path, rocksdb::Options options) {
    auto log = log::createLogger("RocksDB", "storage");

    if (auto res = mkdirs(path); res.has_error()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               path.native(),
               res.error().message());
      return DatabaseError::IO_ERROR;
    }
    if (not fs::is_directory(path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               path.native());
      return DatabaseError::IO_ERROR;
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (auto i = 0; i < Space::kTotal; ++i) {
      column_family_descriptors.emplace_back(spaceName(static_cast<Space>(i)),
                                             rocksdb::ColumnFamilyOptions{});
    }

    options.create_if_missing = true;
    options.create_missing_column_families = true;

    auto rocks_db = std::shared_ptr<RocksDb>(new RocksDb);
    auto status = rocksdb::DB::Open(options,
                                    path.native(),
                                    column_family_descriptors,
                                    &rocks_db->column_family_handles_,
                                    &rocks_db->db_);
    if (not status.ok()) {
      SL_ERROR(log,
               "Can't open database in {}: {}",
               path.native(),
               status.ToString());
      return status_as_error(status);
    }

    for (auto *handle : rocks_db->column_family_handles_) {
      auto space = spaceByName(handle->GetName());
      BOOST_ASSERT(space.has_value());
      rocks_db->spaces_[*space] = std::make_shared<RocksDbSpace>(
          rocks_db->weak_from_this(), *space, rocks_db->logger_);
    }
    SL_DEBUG(log, "Database opened in {}", path.native());
    return rocks_db;
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    auto it = spaces_.find(space);
    BOOST_ASSERT(it != spaces_.end());
    return it->second;
  }

  rocksdb::ColumnFamilyHandle *RocksDb::getCFHandle(Space space) {
    BOOST_ASSERT_MSG(static_cast<size_t>(space) < column_family_handles_.size(),
                     "All spaces should have an associated column family");
    return column_family_handles_[static_cast<size_t>(space)];
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             Space space,
                             log::Logger logger)
      : storage_{std::move(storage)},
        space_{space},
        logger_{std::move(logger)} {}

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return DatabaseError::STORAGE_GONE;
    }
    return rocks;
  }

  outcome::result<bool> RocksDbSpace::contains(const BufferView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(
        rocks->ro_, rocks->getCFHandle(space_), make_slice(key), &value);
    if (status.ok()) {
      return true;
    }

    if (status.IsNotFound()) {
      return false;
    }

    return status_as_error(status);
  }

  outcome::result<Buffer> RocksDbSpace::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (value.has_value()) {
      return std::move(value.value());
    }
    return DatabaseError::NOT_FOUND;
  }

  outcome::result<std::optional<Buffer>> RocksDbSpace::tryGet(
      const BufferView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(
        rocks->ro_, rocks->getCFHandle(space_), make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(make_buffer(value));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status);
  }

  outcome::result<void> RocksDbSpace::put(const BufferView &key,
                                          Buffer value) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Put(rocks->wo_,
                                  rocks->getCFHandle(space_),
                                  make_slice(key),
                                  make_slice(value));
    if (status.ok()) {
      return outcome::success();
    }

    SL_ERROR(logger_, "Can't write to database: {}", status.ToString());
    return status_as_error(status);
  }

  outcome::result<void> RocksDbSpace::remove(const BufferView &key) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Delete(
        rocks->wo_, rocks->getCFHandle(space_), make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status);
  }
}  // namespace conductor::storage
