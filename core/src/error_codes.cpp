#include "fetchvault/error_codes.hpp"

#include <array>

namespace fetchvault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::StoreUnavailable, "store_unavailable"},
            {ErrorCode::DuplicateJob, "duplicate_job"},
            {ErrorCode::OutOfOrderChunk, "out_of_order_chunk"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::InvalidState, "invalid_state"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace fetchvault
