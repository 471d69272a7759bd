// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/chunk.hpp>
#include <surge/core/http_session.hpp>
#include <surge/core/provider.hpp>
#include <surge/disk/file_writer.hpp>
#include <memory>

namespace surge::core {

// Plain HTTP(S) with parallel Range requests when the server allows them.
// Writes into <final>.part; the scheduler renames it once verified.
class RangedHttpProvider final : public Provider {
public:
    RangedHttpProvider(std::shared_ptr<HttpTransport> transport, RetryPolicy policy = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "http"; }
    [[nodiscard]] bool can_handle(const Url& url) const noexcept override { return url.is_http(); }

    [[nodiscard]] std::error_code resolve(Task& task, const CancelToken& token) noexcept override;

    [[nodiscard]] std::error_code download(Task& task,
                                           const CancelToken& token,
                                           const TransferHooks& hooks) noexcept override;

    [[nodiscard]] bool resumable() const noexcept override { return true; }

    void discard(Task& task) noexcept override;

private:
    std::error_code download_chunked(Task& task,
                                     const CancelToken& token,
                                     const TransferHooks& hooks,
                                     disk::FileWriter& writer,
                                     std::uint32_t workers);

    std::error_code download_single(Task& task,
                                    const CancelToken& token,
                                    const TransferHooks& hooks,
                                    disk::FileWriter& writer);

    [[nodiscard]] HttpRequest request_for(const Task& task) const;

    std::shared_ptr<HttpTransport> transport_;
    RetryPolicy policy_;
};

// Filename a resolution response implies: Content-Disposition, else the last
// path segment of the resolved URL, else file_<unix seconds>.
// Path separators never survive.
[[nodiscard]] std::string derive_filename(const HttpResponse& response, std::string_view resolved_url);

// Strip directory components and reject "." and ".."
[[nodiscard]] std::string sanitize_filename(std::string_view name);

// Fill final and temp paths from destination and filename
void assign_artifact_paths(Task& task);

} // namespace surge::core
