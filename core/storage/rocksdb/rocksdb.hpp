/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>

#include <rocksdb/db.h>

#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"

namespace conductor::storage {

  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb> {
   public:
    ~RocksDb() override;

    RocksDb(const RocksDb &) = delete;
    RocksDb(RocksDb &&) = delete;
    RocksDb &operator=(const RocksDb &) = delete;
    RocksDb &operator=(RocksDb &&) = delete;

    /**
     * @brief Factory method to create an instance of RocksDb class.
     * @param path filesystem path where database is going to be
     * @param options rocksdb options, such as caching, logging, etc.
     * @return instance of RocksDB
     */
    static outcome::result<std::shared_ptr<RocksDb>> create(
        const std::filesystem::path &path,
        rocksdb::Options options = rocksdb::Options());

    std::shared_ptr<BufferStorage> getSpace(Space space) override;

    friend class RocksDbSpace;

   private:
    RocksDb();

    rocksdb::ColumnFamilyHandle *getCFHandle(Space space);

    rocksdb::DB *db_{};
    std::vector<rocksdb::ColumnFamilyHandle *> column_family_handles_;
    std::map<Space, std::shared_ptr<class RocksDbSpace>> spaces_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 Space space,
                 log::Logger logger);

    outcome::result<bool> contains(const BufferView &key) const override;

    outcome::result<Buffer> get(const BufferView &key) const override;

    outcome::result<std::optional<Buffer>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key, Buffer value) override;

    outcome::result<void> remove(const BufferView &key) override;

   private:
    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    std::weak_ptr<RocksDb> storage_;
    Space space_;
    log::Logger logger_;
  };
}  // namespace conductor::storage
