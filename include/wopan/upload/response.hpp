#pragma once

#include "wopan/core/error.hpp"
#include "wopan/transport/gateway.hpp"
#include "wopan/upload/types.hpp"

namespace wopan::upload {

/**
 * @brief Classify one HTTP exchange of a chunk request
 *
 * - non-2xx status or a body that is not a JSON object: TransientTransport
 * - `code` other than "0000": ApplicationProtocol
 * - otherwise the decoded response, with `fid` taken from `data.fid`
 */
Expected<RemoteResponse> interpret_response(const transport::TransportResponse& response);

} // namespace wopan::upload
