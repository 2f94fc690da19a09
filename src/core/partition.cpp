#include "core/partition.hpp"

#include <iomanip>
#include <sstream>

namespace fsp {

std::string JoinPath(const std::string& directory, const std::string& name) {
  if (directory.empty() || directory.back() == '/') return directory + name;
  return directory + "/" + name;
}

std::string FramePath(const std::string& directory, std::uint64_t index, const std::string& extension, int index_width) {
  std::ostringstream oss;
  oss << std::setw(index_width) << std::setfill('0') << (index + 1) << '.' << extension;
  return JoinPath(directory, oss.str());
}

} // namespace fsp
