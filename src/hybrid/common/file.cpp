// This file is part of HYBRID.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <hybrid/common/file.h>
#include <hybrid/common/defer.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace hybrid {

namespace fs = std::filesystem;

Result<std::string> read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Error::format("unable to open {}", path.string());
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return Error::format("unable to read {}", path.string());
  }
  return ss.str();
}

Result<void> write_file_atomic(const fs::path& path, std::string_view contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return Error::format("unable to create {}: {}", path.parent_path().string(), ec.message());
    }
  }

  auto tmp = path;
  tmp += ".tmp";
  auto fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    return Error::format("unable to open {}: {}", tmp.string(), std::strerror(errno));
  }
  bool closed = false;
  hybrid_defer([&]() {
    if (!closed) {
      ::close(fd);
      ::unlink(tmp.c_str());
    }
  });

  auto data = contents.data();
  auto left = contents.size();
  while (left > 0) {
    auto n = ::write(fd, data, left);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Error::format("unable to write {}: {}", tmp.string(), std::strerror(errno));
    }
    data += n;
    left -= n;
  }
  if (::fsync(fd) != 0) {
    return Error::format("unable to sync {}: {}", tmp.string(), std::strerror(errno));
  }
  closed = true;
  if (::close(fd) != 0) {
    ::unlink(tmp.c_str());
    return Error::format("unable to close {}: {}", tmp.string(), std::strerror(errno));
  }
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    auto err = Error::format("unable to rename {} to {}: {}", tmp.string(), path.string(), std::strerror(errno));
    ::unlink(tmp.c_str());
    return err;
  }

  // the rename is durable only once the directory entry is flushed
  auto dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
  auto dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    return Error::format("unable to open {}: {}", dir.string(), std::strerror(errno));
  }
  auto synced = ::fsync(dir_fd);
  auto sync_errno = errno;
  ::close(dir_fd);
  if (synced != 0) {
    return Error::format("unable to sync {}: {}", dir.string(), std::strerror(sync_errno));
  }
  return success();
}

} // namespace hybrid
