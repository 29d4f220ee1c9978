/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/reconstruct.hpp"

#include <list>

#include "da/blob_codec.hpp"

namespace conductor::da {

  primitives::FilteredSequencerBlock toFilteredBlock(
      primitives::SubmittedMetadata metadata) {
    return primitives::FilteredSequencerBlock{
        .block_hash = metadata.block_hash,
        .header = std::move(metadata.header),
        .rollup_transactions = std::nullopt,
        .all_rollup_ids = std::move(metadata.rollup_ids),
        .rollup_transactions_proof =
            std::move(metadata.rollup_transactions_proof),
        .rollup_ids_proof = std::move(metadata.rollup_ids_proof),
    };
  }

  BlockReconstructor::BlockReconstructor(
      std::shared_ptr<const normalizer::BlockNormalizer> normalizer,
      std::string sequencer_chain_id)
      : normalizer_{std::move(normalizer)},
        sequencer_chain_id_{std::move(sequencer_chain_id)},
        log_{log::createLogger("BlockReconstructor", "celestia")} {
    BOOST_ASSERT(normalizer_ != nullptr);
  }

  std::vector<primitives::SubmittedMetadata>
  BlockReconstructor::decodeHeaders(const std::vector<common::Buffer> &blobs,
                                    size_t &rejected) const {
    std::vector<primitives::SubmittedMetadata> headers;
    for (auto &raw : blobs) {
      auto blob = decodeBlob(raw);
      if (blob.has_error()) {
        SL_DEBUG(log_, "Undecodable header blob: {}", blob.error().message());
        ++rejected;
        continue;
      }
      auto *metadata = std::get_if<primitives::SubmittedMetadata>(&blob.value());
      if (metadata == nullptr) {
        SL_DEBUG(log_, "Rollup data found in the sequencer namespace");
        ++rejected;
        continue;
      }
      if (metadata->header.chain_id != sequencer_chain_id_) {
        SL_TRACE(log_,
                 "Ignoring header blob of chain '{}'",
                 metadata->header.chain_id);
        continue;
      }
      headers.emplace_back(std::move(*metadata));
    }
    return headers;
  }

  std::vector<primitives::SubmittedRollupData>
  BlockReconstructor::decodeRollupData(const std::vector<common::Buffer> &blobs,
                                       size_t &rejected) const {
    std::vector<primitives::SubmittedRollupData> datas;
    for (auto &raw : blobs) {
      auto blob = decodeBlob(raw);
      if (blob.has_error()) {
        SL_DEBUG(log_, "Undecodable rollup blob: {}", blob.error().message());
        ++rejected;
        continue;
      }
      auto *data = std::get_if<primitives::SubmittedRollupData>(&blob.value());
      if (data == nullptr or data->rollup_id != normalizer_->rollupId()) {
        SL_DEBUG(log_, "Foreign blob found in the rollup namespace");
        ++rejected;
        continue;
      }
      datas.emplace_back(std::move(*data));
    }
    return datas;
  }

  Reconstruction BlockReconstructor::reconstruct(
      primitives::CelestiaHeight celestia_height,
      const std::vector<common::Buffer> &header_blobs,
      const std::vector<common::Buffer> &rollup_blobs) const {
    Reconstruction result{.celestia_height = celestia_height};

    // verified header blobs, in arrival order
    std::list<primitives::FilteredSequencerBlock> headers;
    for (auto &metadata : decodeHeaders(header_blobs, result.rejected_blobs)) {
      auto block = toFilteredBlock(std::move(metadata));
      if (auto res = normalizer_->checkCommitments(block); res.has_error()) {
        SL_WARN(log_,
                "Dropping header blob {} at DA height {}: {}",
                block.block_hash,
                celestia_height,
                res.error().message());
        ++result.rejected_blobs;
        continue;
      }
      auto same = std::find_if(headers.begin(), headers.end(), [&](auto &h) {
        return h.block_hash == block.block_hash
           and h.height() == block.height();
      });
      if (same != headers.end()) {
        SL_WARN(log_,
                "More than one header blob for block {} at height {}; "
                "dropping previous",
                block.block_hash,
                block.height());
        headers.erase(same);
      }
      headers.emplace_back(std::move(block));
    }

    for (auto &data : decodeRollupData(rollup_blobs, result.rejected_blobs)) {
      primitives::RollupTransactions rollup{
          .rollup_id = data.rollup_id,
          .transactions = std::move(data.transactions),
          .proof = std::move(data.proof),
      };
      bool any_same_hash = false;
      auto match = std::find_if(headers.begin(), headers.end(), [&](auto &h) {
        if (h.block_hash != data.sequencer_block_hash) {
          return false;
        }
        any_same_hash = true;
        auto candidate = h;
        candidate.rollup_transactions = rollup;
        return normalizer_->checkRollupTransactions(candidate).has_value();
      });
      if (match == headers.end()) {
        SL_INFO(log_,
                "Dropping rollup blob for block {}: {}",
                data.sequencer_block_hash,
                any_same_hash
                    ? "its proof leads to no header blob with that hash"
                    : "no header blob with that hash");
        ++result.unmatched_rollup_blobs;
        continue;
      }
      const auto block_hash = match->block_hash;
      auto block = std::move(*match);
      block.rollup_transactions = std::move(rollup);
      // header blobs of other heights cannot share the block hash
      headers.remove_if(
          [&](auto &h) { return h.block_hash == block_hash; });
      result.blocks.emplace_back(std::move(block));
    }

    for (auto &block : headers) {
      const auto &ids = block.all_rollup_ids;
      if (std::find(ids.begin(), ids.end(), normalizer_->rollupId())
          != ids.end()) {
        SL_WARN(log_,
                "Header blob {} at height {} lists the rollup but no rollup "
                "blob matches it; dropping",
                block.block_hash,
                block.height());
        ++result.censored;
        continue;
      }
      result.blocks.emplace_back(std::move(block));
    }

    std::sort(result.blocks.begin(),
              result.blocks.end(),
              [](auto &l, auto &r) { return l.height() < r.height(); });
    return result;
  }

}  // namespace conductor::da
