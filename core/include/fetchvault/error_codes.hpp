/**
 * fetchvault - Error codes shared by the store, queue and resume layers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fetchvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        StoreUnavailable = 1,
        DuplicateJob = 2,
        OutOfOrderChunk = 3,
        NotFound = 4,
        AlreadyExists = 5,
        InvalidState = 6,
        InvalidArgument = 7,
        InvalidPayload = 8,
        IoError = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

} // namespace fetchvault
