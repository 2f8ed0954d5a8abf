#pragma once

// Main rangefs header - includes everything needed

#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "object.hpp"
#include "chunk.hpp"
#include "chunk_store.hpp"
#include "memory_chunk_store.hpp"
#include "disk_chunk_store.hpp"
#include "object_store.hpp"
#include "remote_client.hpp"
#include "http_client.hpp"
#include "file_client.hpp"
#include "stream_buffer.hpp"
#include "range_copy.hpp"
#include "cache.hpp"

namespace rangefs {

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace rangefs
