#pragma once

#include <stdexcept>
#include <string>

#include "fetchvault/error_codes.hpp"

namespace fetchvault
{

    class StoreError : public std::runtime_error
    {
    public:
        StoreError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace fetchvault
