#pragma once

#include <stdexcept>
#include <string>

// Failure of a single sync operation. Never fatal: the loop that started the
// operation logs it and moves on.
class SyncError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Connect refused/reset, timeout, peer closed early.
class NetworkError : public SyncError {
public:
  using SyncError::SyncError;
};

// Unexpected token, bad arguments, malformed listing, short block, hash mismatch.
class ProtocolError : public SyncError {
public:
  using SyncError::SyncError;
};

// Open/read/write/rename failure in the shared directory.
class FilesystemError : public SyncError {
public:
  using SyncError::SyncError;
};
