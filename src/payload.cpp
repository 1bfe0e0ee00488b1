#include <format>
#include <system_error>
#include <utility>

#include <catx/payload.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace catx {

namespace {

std::string lastSystemError() {
#ifdef _WIN32
  return std::system_category().message(static_cast<int>(GetLastError()));
#else
  return std::generic_category().message(errno);
#endif
}

#ifndef _WIN32
// Closes the descriptor once the mapping holds its own reference
struct FdGuard {
  int fd;
  ~FdGuard() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
};
#endif

} // namespace

PayloadMap::~PayloadMap() {
  release();
}

PayloadMap::PayloadMap(PayloadMap &&other) noexcept
    : path_(std::move(other.path_)), data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0))
#ifdef _WIN32
      ,
      file_(std::exchange(other.file_, nullptr)), mapping_(std::exchange(other.mapping_, nullptr))
#endif
{
}

PayloadMap &PayloadMap::operator=(PayloadMap &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
#ifdef _WIN32
    file_ = std::exchange(other.file_, nullptr);
    mapping_ = std::exchange(other.mapping_, nullptr);
#endif
  }
  return *this;
}

std::optional<PayloadMap> PayloadMap::open(const std::filesystem::path &path, Error *outError) {
  PayloadMap payload;
  payload.path_ = path;

  auto fail = [&](std::string_view step) {
    setError(outError, ErrorCode::IoError,
             std::format("Cannot {} payload {}: {}", step, path.string(), lastSystemError()));
    return std::nullopt;
  };

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_FLAG_RANDOM_ACCESS, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    return fail("open");
  }
  payload.file_ = file;

  LARGE_INTEGER length;
  if (!GetFileSizeEx(file, &length)) {
    return fail("stat");
  }
  if (length.QuadPart == 0) {
    return payload;
  }

  payload.mapping_ = CreateFileMappingW(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!payload.mapping_) {
    return fail("map");
  }
  void *view = MapViewOfFile(static_cast<HANDLE>(payload.mapping_), FILE_MAP_READ, 0, 0, 0);
  if (!view) {
    return fail("map");
  }
  payload.data_ = static_cast<const uint8_t *>(view);
  payload.size_ = static_cast<size_t>(length.QuadPart);
#else
  FdGuard fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
  if (fd.fd < 0) {
    return fail("open");
  }

  struct stat st;
  if (::fstat(fd.fd, &st) < 0) {
    return fail("stat");
  }
  if (st.st_size == 0) {
    return payload;
  }

  size_t length = static_cast<size_t>(st.st_size);
  void *view = ::mmap(nullptr, length, PROT_READ, MAP_PRIVATE, fd.fd, 0);
  if (view == MAP_FAILED) {
    return fail("map");
  }
  // Entries are read in catalog order, not file order
  ::madvise(view, length, MADV_RANDOM);

  payload.data_ = static_cast<const uint8_t *>(view);
  payload.size_ = length;
#endif

  return payload;
}

std::optional<std::span<const uint8_t>> PayloadMap::slice(uint64_t offset, uint64_t size,
                                                          Error *outError) const {
  if (offset > size_ || size > size_ - offset) {
    setError(outError, ErrorCode::CorruptPayload,
             std::format("Range offset={} size={} runs past the end of payload {} ({} bytes)",
                         offset, size, path_.string(), size_));
    return std::nullopt;
  }
  if (size == 0) {
    return std::span<const uint8_t>();
  }
  return bytes().subspan(static_cast<size_t>(offset), static_cast<size_t>(size));
}

void PayloadMap::release() noexcept {
#ifdef _WIN32
  if (data_) {
    UnmapViewOfFile(data_);
  }
  if (mapping_) {
    CloseHandle(static_cast<HANDLE>(mapping_));
  }
  if (file_) {
    CloseHandle(static_cast<HANDLE>(file_));
  }
  mapping_ = nullptr;
  file_ = nullptr;
#else
  if (data_) {
    ::munmap(const_cast<uint8_t *>(data_), size_);
  }
#endif
  data_ = nullptr;
  size_ = 0;
}

} // namespace catx
