#pragma once

// objio - Aggregate Header
// Include this for streams, temp files, transports and the store

#include "objio/error.hpp"
#include "objio/io.hpp"
#include "objio/object.hpp"
#include "objio/uri.hpp"
#include "objio/transport.hpp"
#include "objio/stream.hpp"
#include "objio/temp_file.hpp"
#include "objio/store.hpp"

// Transport implementations
#include "objio/transports/local.hpp"
#include "objio/transports/http.hpp"
