// include/logwire/logwire.hpp
// Umbrella header.

#pragma once

#include "backoff.hpp"
#include "client.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "message.hpp"
#include "types.hpp"
