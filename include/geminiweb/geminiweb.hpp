/**
 * @file geminiweb.hpp
 * @brief Main header for geminiweb
 *
 * C++ client for the Gemini web app (gemini.google.com).
 * Provides cookie authentication with background refresh, content
 * generation with images, gems and multi-turn chat sessions.
 */

#ifndef GEMINIWEB_HPP
#define GEMINIWEB_HPP

#include "geminiweb/types.hpp"
#include "geminiweb/errors.hpp"
#include "geminiweb/logging.hpp"
#include "geminiweb/http.hpp"
#include "geminiweb/images.hpp"
#include "geminiweb/auth.hpp"
#include "geminiweb/session.hpp"
#include "geminiweb/client.hpp"

namespace geminiweb {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace geminiweb

#endif // GEMINIWEB_HPP
