// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "wire_interface.hpp"

namespace evselink {

/// \brief libcurl easy-handle HTTP client. One handle per request; safe to call from several
/// threads at once (the discovery fan-out does).
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();

    HttpResult perform(const HttpRequest& request) override;
};

} // namespace evselink
