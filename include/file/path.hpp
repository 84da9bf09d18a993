#ifndef PODFS_FILE_PATH_HPP
#define PODFS_FILE_PATH_HPP

#include <string>

namespace podfs {
namespace file {

// Parent directory and leaf name of a normalized full path
struct PathInfo {
  std::string path;
  std::string filename;
};

// Splits an absolute path into (parent, leaf). Repeated separators collapse,
// a trailing separator is ignored. Throws InvalidPath for relative paths,
// '.'/'..' segments, a missing leaf name or bytes that are not UTF-8.
PathInfo extract_path_info(const std::string& full_path);

// Normalizes a directory path ("/" for the root), throws InvalidPath
std::string normalize_directory(const std::string& dir_path);

// Joins a directory and a leaf name with exactly one separator
std::string combine(const std::string& dir_path, const std::string& name);

// Throws InvalidPath unless name is a single UTF-8 path segment
void assert_file_name(const std::string& name);

// Throws InvalidPodName for empty names, names containing a separator or non-UTF-8 names
void assert_pod_name(const std::string& pod_name);

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_PATH_HPP
