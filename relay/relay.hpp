#pragma once

#include "cli.hpp"
#include "core.hpp"
#include "log.hpp"
#include "tracing.hpp"

#include "rpc/chain.hpp"
#include "rpc/client.hpp"
#include "rpc/config.hpp"
#include "rpc/context.hpp"
#include "rpc/headers.hpp"
#include "rpc/service-provider.hpp"
#include "rpc/status.hpp"
