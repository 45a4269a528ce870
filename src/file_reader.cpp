#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include "posix_fd.hpp"

bool mmap_read_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);

  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    char c = data[i];
    if (c == '\r') {
      out.push_back('\n');
      if (i + 1 < n && data[i + 1] == '\n') ++i;
      continue;
    }
    out.push_back(c);
  }

  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
