#include "wagerledger/common/file_sync.hpp"

#include <cerrno>
#include <system_error>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace wagerledger {
namespace common {

void fsync_file(std::FILE* file) {
#if defined(_WIN32)
  const auto handle = reinterpret_cast<HANDLE>(_get_osfhandle(_fileno(file)));
  if (::FlushFileBuffers(handle) == 0) {
    throw std::system_error(static_cast<int>(GetLastError()), std::system_category(), "FlushFileBuffers failed");
  }
#else
  if (::fsync(fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
#endif
}

}  // namespace common
}  // namespace wagerledger
