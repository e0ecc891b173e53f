// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <map>
#include <string>

namespace sonix {

/// HTTP GET, returns the response body. Throws SonixError on transport failure
/// or an HTTP status >= 400. timeout_sec bounds the whole transfer.
std::string http_get(const std::string& url,
                     const std::map<std::string, std::string>& headers = {},
                     long timeout_sec = 300L);

/// Header map carrying "Authorization: Bearer <token>", empty for an empty token.
std::map<std::string, std::string> bearer_headers(const std::string& token);

} // namespace sonix
