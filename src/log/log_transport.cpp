// llmlink log: HttpLogTransport implementation
#include "log/log_transport.hpp"

#include <utility>

#include "ll_types.hpp"

namespace ll {

HttpLogTransport::HttpLogTransport(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)) {
    opts_.timeout = timeout;
}

void HttpLogTransport::send(const LogRecord& record) {
    if (closed_) return;
    nlohmann::json body = record;
    HttpResponse resp =
        client_.post(url_, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                     "application/json", opts_);
    if (!resp.transport_ok()) throw LinkError(LinkErrc::Network, "log POST failed: " + resp.error);
    if (!resp.is_success())
        throw LinkError(LinkErrc::HttpStatus, "log POST returned HTTP " + std::to_string(resp.status));
}

void HttpLogTransport::close() { closed_ = true; }

}  // namespace ll
