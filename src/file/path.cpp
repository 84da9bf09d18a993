#include "file/path.hpp"
#include "file/file_error.hpp"
#include "utils/bytes.hpp"
#include <sstream>
#include <vector>

namespace podfs {
namespace file {

namespace {

std::vector<std::string> split_segments(const std::string& path) {
  if (path.empty() || path.front() != '/' || !utils::is_utf8(path)) {
    throw InvalidPath(path);
  }

  std::vector<std::string> segments;
  std::stringstream ss(path);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (segment.empty()) {
      continue;
    }
    if (segment == "." || segment == "..") {
      throw InvalidPath(path);
    }
    segments.push_back(segment);
  }
  return segments;
}

std::string join_segments(const std::vector<std::string>& segments, size_t count) {
  std::string result;
  for (size_t i = 0; i < count; ++i) {
    result += "/" + segments[i];
  }
  return result.empty() ? "/" : result;
}

} // namespace

PathInfo extract_path_info(const std::string& full_path) {
  auto segments = split_segments(full_path);
  if (segments.empty()) {
    throw InvalidPath(full_path);
  }
  return PathInfo{join_segments(segments, segments.size() - 1), segments.back()};
}

std::string normalize_directory(const std::string& dir_path) {
  auto segments = split_segments(dir_path);
  return join_segments(segments, segments.size());
}

std::string combine(const std::string& dir_path, const std::string& name) {
  if (dir_path.empty() || dir_path.back() != '/') {
    return dir_path + "/" + name;
  }
  return dir_path + name;
}

void assert_file_name(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." || name == ".." ||
      !utils::is_utf8(name)) {
    throw InvalidPath(name);
  }
}

void assert_pod_name(const std::string& pod_name) {
  if (pod_name.empty() || pod_name.find('/') != std::string::npos || !utils::is_utf8(pod_name)) {
    throw InvalidPodName(pod_name);
  }
}

} // namespace file
} // namespace podfs
