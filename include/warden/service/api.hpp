#pragma once

#include <warden/http/router.hpp>
#include <warden/service/key_server.hpp>

namespace warden::service {

/// Routes of the public HTTP API bound to `server`:
///
/// - POST /v1/fetch_key
/// - GET  /v1/service
/// - POST /auth/session_token
/// - POST /auth/encrypted_session_token
/// - GET  /auth/session
/// - GET  /health
warden::http::router make_router(key_server& server, request_metrics& metrics);

}  // namespace warden::service
