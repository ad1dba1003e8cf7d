#pragma once

// Platform detection and portable aliases for conduit's system layer.
//
// Detection macros:
//   CONDUIT_LINUX : defined on Linux
//   CONDUIT_MACOS : defined on macOS / Darwin
//   CONDUIT_POSIX : defined on any supported POSIX system
//
// Portable types / constants:
//   NativeHandle             : the OS descriptor type
//   kInvalidHandle           : sentinel value representing an invalid descriptor
//   kDirectTransferSupported : whether descriptor-to-descriptor primitives
//                               (sendfile, copy_file_range, splice) are available
//
// Portable error constants (namespace conduit::error):
//   kWouldBlock, kInterrupted, kNotSupported, kCrossDevice

#ifdef __linux__
#define CONDUIT_LINUX
#define CONDUIT_POSIX
#elifdef __APPLE__
#define CONDUIT_MACOS
#define CONDUIT_POSIX
#else
#error "Unsupported platform: conduit currently supports Linux and macOS"
#endif

#include <unistd.h>  // close

#include <cerrno>   // errno, EAGAIN, EINTR, …
#include <cstring>  // std::strerror

namespace conduit {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

#ifdef CONDUIT_LINUX
inline constexpr bool kDirectTransferSupported = true;
#else
inline constexpr bool kDirectTransferSupported = false;
#endif

// Human-readable description for an errno value.
// The returned pointer is valid at least until the next call from the same thread.
inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

inline int CloseNativeHandle(NativeHandle fd) noexcept { return ::close(fd); }

namespace error {
inline constexpr int kWouldBlock = EAGAIN;
inline constexpr int kInterrupted = EINTR;
inline constexpr int kNotSupported = EOPNOTSUPP;
inline constexpr int kCrossDevice = EXDEV;
}  // namespace error

}  // namespace conduit
