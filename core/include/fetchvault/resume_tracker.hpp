/**
 * fetchvault - Resume checkpoints for interrupted transfers.
 *
 * Checkpoint metadata lives in the "partials" collection; the received bytes
 * are appended to a per-job blob file. Chunks must arrive in order: each one
 * starts exactly where the previous one ended, so the stored prefix is always
 * contiguous from offset zero.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "fetchvault/records.hpp"
#include "fetchvault/store.hpp"

namespace fetchvault
{

    struct ResumeState
    {
        PartialTransfer checkpoint;
        std::vector<std::byte> bytes;
    };

    class ResumeTracker
    {
    public:
        explicit ResumeTracker(Store &store);

        // Appends data at offset. Throws OutOfOrderChunk (state untouched) unless
        // offset equals the bytes already stored for the job.
        PartialTransfer checkpoint(const std::string &id, std::uint64_t offset, std::span<const std::byte> data,
                                   std::optional<std::uint64_t> total_bytes = std::nullopt);

        // Creates or refreshes the checkpoint metadata for an interrupted job.
        PartialTransfer record_interruption(const QueueItem &item);

        std::uint64_t resume_offset(const std::string &id);

        std::optional<PartialTransfer> find(const std::string &id) const;

        // Reads back and verifies the stored prefix. A corrupt checkpoint is
        // invalidated and reported as absent.
        std::optional<ResumeState> load(const std::string &id);

        void invalidate(const std::string &id);
        void discard(const std::string &id);

    private:
        PartialTransfer seed(const std::string &id) const;
        void append_blob(const PartialTransfer &state, std::uint64_t offset, std::span<const std::byte> data);
        bool remove_checkpoint(const std::string &id);

        Store &store_;
    };

} // namespace fetchvault
