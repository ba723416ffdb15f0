#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/fields.hpp>
#include <chrono>
#include <memory>

#include "Clock.hpp"
#include "IObjectSource.hpp"
#include "config.hpp"
#include "types.hpp"

namespace ferry {

/**
 * @brief Object-store reads over signed HTTP: HEAD for metadata, ranged GET
 * for bytes.
 *
 * @details
 * Each request runs on a fresh connection owned by a private io_context, so
 * a source is confined to the worker that opened it. Operations are driven
 * to completion with `use_future` on the calling thread, which keeps the
 * engine synchronous while still honouring socket timeouts.
 *
 * **Errors:** 404 -> SourceNotFound, 401/403 -> AuthenticationRejected,
 * other statuses and socket failures -> SourceUnreadable.
 */
/**
 * @brief Reads size and ETag from the headers of a HEAD response.
 * @throws FerryError(SourceUnreadable) when Content-Length is missing or not a number.
 */
ObjectMetadata ParseObjectMetadata(const http::fields& headers);

class S3ObjectSource final : public IObjectSource {
   public:
    S3ObjectSource(S3Config cfg, Credentials credentials, std::shared_ptr<Clock> clock,
                   std::chrono::seconds io_timeout);

    ObjectMetadata Stat(const SourceLocation& location) override;

    std::unique_ptr<IObjectReader> OpenRange(const SourceLocation& location,
                                             std::uint64_t offset,
                                             std::uint64_t length) override;

   private:
    S3Config cfg_;
    Credentials credentials_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds io_timeout_;
};

class S3SourceFactory final : public IObjectSourceFactory {
   public:
    S3SourceFactory(S3Config cfg, std::shared_ptr<Clock> clock, std::chrono::seconds io_timeout);

    std::unique_ptr<IObjectSource> Open(const Credentials& credentials) override;

   private:
    S3Config cfg_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds io_timeout_;
};

}  // namespace ferry
