#include "fetchvault/resume_tracker.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "fetchvault/crypto.hpp"

namespace fetchvault
{

    namespace
    {
        std::uint64_t blob_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            return ec ? 0 : static_cast<std::uint64_t>(size);
        }
    } // namespace

    ResumeTracker::ResumeTracker(Store &store)
        : store_(store)
    {
    }

    PartialTransfer ResumeTracker::checkpoint(const std::string &id, std::uint64_t offset,
                                              std::span<const std::byte> data,
                                              std::optional<std::uint64_t> total_bytes)
    {
        const auto existing = find(id);
        auto state = existing ? *existing : seed(id);
        if (offset != state.downloaded_bytes)
        {
            throw StoreError(ErrorCode::OutOfOrderChunk,
                             "chunk for " + id + " starts at " + std::to_string(offset) + ", expected " +
                                 std::to_string(state.downloaded_bytes));
        }
        if (total_bytes)
        {
            state.total_bytes = total_bytes;
        }
        const auto length = static_cast<std::uint64_t>(data.size());
        if (state.total_bytes && offset + length > *state.total_bytes)
        {
            throw StoreError(ErrorCode::InvalidArgument,
                             "chunk for " + id + " ends at " + std::to_string(offset + length) +
                                 " beyond total " + std::to_string(*state.total_bytes));
        }
        if (length == 0)
        {
            return state;
        }

        append_blob(state, offset, data);

        state.chunks.push_back(ChunkRange{offset, length, crypto::hash_bytes(data)});
        state.downloaded_bytes += length;
        state.last_updated = now();
        try
        {
            store_.partials().put(state);
        }
        catch (const StoreError &ex)
        {
            // A chunk whose metadata never landed takes the whole checkpoint with it.
            spdlog::warn("Checkpoint metadata for {} not written ({}); discarding it", id, ex.what());
            std::error_code ec;
            std::filesystem::remove(store_.blob_path(id), ec);
            try
            {
                store_.partials().remove(id);
            }
            catch (const StoreError &cleanup)
            {
                spdlog::error("Stale checkpoint metadata for {} left behind: {}", id, cleanup.what());
            }
            throw;
        }
        spdlog::debug("Checkpoint {} +{} bytes -> {}", id, length, state.downloaded_bytes);
        return state;
    }

    PartialTransfer ResumeTracker::record_interruption(const QueueItem &item)
    {
        const auto existing = find(item.id);
        auto state = existing ? *existing : seed(item.id);
        state.source_id = item.source_id;
        state.title = item.title;
        state.quality = item.quality;
        state.format = item.format;
        state.transfer_format_id = item.transfer_format_id;
        state.kind = item.kind;
        if (item.total_bytes)
        {
            state.total_bytes = item.total_bytes;
        }
        state.last_updated = now();
        store_.partials().put(state);
        spdlog::info("Saved resume point for {} at {} bytes", item.id, state.downloaded_bytes);
        return state;
    }

    std::uint64_t ResumeTracker::resume_offset(const std::string &id)
    {
        const auto state = find(id);
        if (!state)
        {
            return 0;
        }
        if (!chunks_contiguous(*state) || blob_size(store_.blob_path(id)) < state->downloaded_bytes)
        {
            spdlog::warn("Checkpoint for {} is incomplete on disk; restarting from zero", id);
            invalidate(id);
            return 0;
        }
        return state->downloaded_bytes;
    }

    std::optional<PartialTransfer> ResumeTracker::find(const std::string &id) const
    {
        return store_.partials().find(id);
    }

    std::optional<ResumeState> ResumeTracker::load(const std::string &id)
    {
        auto state = find(id);
        if (!state)
        {
            return std::nullopt;
        }
        ResumeState result{*state, {}};
        if (!chunks_contiguous(*state))
        {
            spdlog::warn("Checkpoint for {} has a gap; discarding it", id);
            invalidate(id);
            return std::nullopt;
        }
        result.bytes.resize(static_cast<std::size_t>(state->downloaded_bytes));
        if (!result.bytes.empty())
        {
            std::ifstream in(store_.blob_path(id), std::ios::binary);
            in.read(reinterpret_cast<char *>(result.bytes.data()), static_cast<std::streamsize>(result.bytes.size()));
            if (!in || static_cast<std::size_t>(in.gcount()) != result.bytes.size())
            {
                spdlog::warn("Checkpoint blob for {} is short; discarding it", id);
                invalidate(id);
                return std::nullopt;
            }
        }
        const std::span<const std::byte> all(result.bytes);
        for (const auto &chunk : state->chunks)
        {
            const auto slice = all.subspan(static_cast<std::size_t>(chunk.offset), static_cast<std::size_t>(chunk.length));
            if (crypto::hash_bytes(slice) != chunk.digest)
            {
                spdlog::warn("Checkpoint for {} failed digest check at offset {}; discarding it", id, chunk.offset);
                invalidate(id);
                return std::nullopt;
            }
        }
        return result;
    }

    void ResumeTracker::invalidate(const std::string &id)
    {
        if (remove_checkpoint(id))
        {
            spdlog::warn("Invalidated checkpoint for {}", id);
        }
    }

    void ResumeTracker::discard(const std::string &id)
    {
        if (remove_checkpoint(id))
        {
            spdlog::debug("Discarded checkpoint for {}", id);
        }
    }

    PartialTransfer ResumeTracker::seed(const std::string &id) const
    {
        const auto item = store_.queue().find(id);
        if (!item)
        {
            throw StoreError(ErrorCode::NotFound, "no queued job " + id + " to checkpoint");
        }
        PartialTransfer state{};
        state.id = item->id;
        state.source_id = item->source_id;
        state.title = item->title;
        state.quality = item->quality;
        state.format = item->format;
        state.transfer_format_id = item->transfer_format_id;
        state.kind = item->kind;
        state.total_bytes = item->total_bytes;
        state.last_updated = now();
        return state;
    }

    void ResumeTracker::append_blob(const PartialTransfer &state, std::uint64_t offset,
                                    std::span<const std::byte> data)
    {
        const auto path = store_.blob_path(state.id);
        const auto on_disk = blob_size(path);
        if (on_disk < offset)
        {
            spdlog::warn("Checkpoint blob for {} holds {} of {} bytes; discarding it", state.id, on_disk, offset);
            invalidate(state.id);
            throw StoreError(ErrorCode::OutOfOrderChunk,
                             "stored bytes for " + state.id + " are missing; restart the transfer from offset 0");
        }

        std::error_code ec;
        if (!std::filesystem::exists(path))
        {
            std::ofstream create(path, std::ios::binary | std::ios::trunc);
        }
        else if (on_disk > offset)
        {
            // Tail left behind by a write whose metadata never landed.
            std::filesystem::resize_file(path, offset, ec);
        }

        bool written = false;
        if (!ec)
        {
            std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
            if (file.is_open())
            {
                file.seekp(static_cast<std::streamoff>(offset));
                file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                file.flush();
                written = static_cast<bool>(file);
            }
        }
        if (!written)
        {
            invalidate(state.id);
            throw StoreError(ErrorCode::IoError, "failed to store chunk for " + state.id);
        }
    }

    bool ResumeTracker::remove_checkpoint(const std::string &id)
    {
        const bool removed = store_.partials().remove(id);
        std::error_code ec;
        std::filesystem::remove(store_.blob_path(id), ec);
        return removed;
    }

} // namespace fetchvault
