#pragma once

/// Umbrella header for the foundry assistant library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "protocol_types.hpp"
#include "logging.hpp"
#include "cancellation.hpp"
#include "channel.hpp"
#include "worker_pool.hpp"
#include "schema.hpp"
#include "tool_registry.hpp"
#include "project_catalog.hpp"
#include "builtin_tools.hpp"
#include "server_connection.hpp"
#include "server_manager.hpp"
#include "tool_router.hpp"
#include "sse.hpp"
#include "completion_client.hpp"
#include "anthropic_client.hpp"
#include "session_store.hpp"
#include "stream_encoder.hpp"
#include "conversation_engine.hpp"
#include "config.hpp"
#include "chat_server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/subprocess.hpp"
