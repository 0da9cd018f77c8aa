#pragma once

#include <cstdio>

namespace wagerledger {
namespace common {

// Forces buffered writes of `file` to stable storage. Throws std::system_error.
// Call std::fflush first; this does not drain the stdio buffer.
void fsync_file(std::FILE* file);

}  // namespace common
}  // namespace wagerledger
