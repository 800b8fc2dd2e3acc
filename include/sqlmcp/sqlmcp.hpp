#pragma once

/// Umbrella header for the sqlmcp SQL tool server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool_registry.hpp"
#include "backend.hpp"
#include "client_context.hpp"
#include "router.hpp"
#include "dispatcher.hpp"
#include "stream_session.hpp"
#include "session_manager.hpp"
#include "metrics.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "timestamp.hpp"
#include "server.hpp"
#include "transport/event_sink.hpp"
#include "transport/http_server.hpp"
