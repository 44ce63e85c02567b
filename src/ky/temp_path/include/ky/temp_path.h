#ifndef RANGECACHE_SRC_KY_TEMP_PATH_TEMP_PATH_H
#define RANGECACHE_SRC_KY_TEMP_PATH_TEMP_PATH_H

#include <filesystem>
#include <string>
#include <vector>

namespace ky {

/***
 * A uniquely named directory that is removed (unless `keep` is set) when the
 * object goes out of scope.
 */
class TempPath final {
  std::filesystem::path path_;
  bool keep_;

public:
  TempPath();

  TempPath(const std::filesystem::path &parent_path, bool keep);

  TempPath(const TempPath &) = delete;
  TempPath &operator=(const TempPath &) = delete;

  ~TempPath();

  [[nodiscard]] std::filesystem::path GetPath() const;

  std::filesystem::path WriteFile(
      const std::string &name,
      const std::vector<char> &contents) const;
};

}  // namespace ky

#endif  // RANGECACHE_SRC_KY_TEMP_PATH_TEMP_PATH_H
