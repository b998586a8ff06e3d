#pragma once

#include <atomic>
#include <memory>

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    // Shared flag checked between transfer chunks. Copies observe the same flag.
    class CancellationToken
    {
    public:
        CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const noexcept { flag_->store(true); }
        bool cancelled() const noexcept { return flag_->load(); }

        void throw_if_cancelled() const
        {
            if (cancelled())
            {
                throw Error(ErrorCode::Cancelled, "Transfer cancelled");
            }
        }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

} // namespace firestarter::client
