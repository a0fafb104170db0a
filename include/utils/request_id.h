// request_id.h - request and W3C trace identifiers (hex)
#pragma once

#include <string>

namespace cqr {

// 16 hex characters.
std::string generate_request_id();

// traceparent for this hop: keeps the trace id of an incoming
// "00-<32 hex>-<16 hex>-<flags>" header, otherwise starts a new trace.
std::string next_traceparent(const std::string& incoming);

}  // namespace cqr
