#pragma once

#include <sys/types.h>  // off_t

#include <cstddef>
#include <cstdint>

#include "conduit/platform.hpp"

namespace conduit {

// Thin, non-throwing wrappers over the kernel descriptor-to-descriptor primitives.
// All of them return the number of bytes moved (>= 0) or -1 on error (errno set).
// They do not retry on EINTR; callers decide.
// On platforms without these primitives they fail with ENOSYS.

// Transfers up to `count` bytes from `inFd` (at `offset`, regular file) to `outFd`.
// `offset` is advanced by the number of bytes sent; the file offset of `inFd` is untouched.
// Writes at the current file offset of `outFd`.
int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept;

// Copies up to `count` bytes between two regular files at explicit offsets.
// Both offsets are advanced by the number of bytes copied; no file offset is modified.
// Fails with EXDEV, EINVAL, EOPNOTSUPP or ENOSYS when the kernel or file system cannot
// perform the copy, in which case Sendfile is the usual fallback.
int64_t CopyFileRange(NativeHandle inFd, off_t& inOffset, NativeHandle outFd, off_t& outOffset,
                      std::size_t count) noexcept;

// Moves up to `count` bytes between two descriptors, one of which must be a pipe.
// A null offset means "use and advance the descriptor's own file offset" (mandatory for pipes).
// Returns 0 when the input reached end of data.
int64_t Splice(NativeHandle inFd, off_t* inOffset, NativeHandle outFd, off_t* outOffset,
               std::size_t count) noexcept;

}  // namespace conduit
