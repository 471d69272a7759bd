// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/provider.hpp>
#include <surge/media/media_delegate.hpp>
#include <memory>
#include <string>
#include <vector>

namespace surge::media {

// Hands streaming-site URLs to a media delegate. Not resumable: a resumed
// task discards its partial output and starts over.
class StreamingDelegateProvider final : public core::Provider {
public:
    StreamingDelegateProvider(std::shared_ptr<MediaDelegate> delegate,
                              std::vector<std::string> hosts);

    [[nodiscard]] std::string_view name() const noexcept override { return "media"; }

    // True for hosts in the list, subdomains included
    [[nodiscard]] bool can_handle(const core::Url& url) const noexcept override;

    [[nodiscard]] std::error_code resolve(core::Task& task, const core::CancelToken& token) noexcept override;

    [[nodiscard]] std::error_code download(core::Task& task,
                                           const core::CancelToken& token,
                                           const core::TransferHooks& hooks) noexcept override;

    [[nodiscard]] bool resumable() const noexcept override { return false; }

    void discard(core::Task& task) noexcept override;

private:
    std::shared_ptr<MediaDelegate> delegate_;
    std::vector<std::string> hosts_;
};

} // namespace surge::media
