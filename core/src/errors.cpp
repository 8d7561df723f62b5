#include "fetchvault/errors.hpp"

namespace fetchvault
{

    StoreError::StoreError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code)
    {
    }

} // namespace fetchvault
