#ifndef __RESTART_CHECK_FILE_COMPARE_HH__
#define __RESTART_CHECK_FILE_COMPARE_HH__

#include <string>

namespace restart_check {

enum class CompareResult { Identical, Different, Error };

const char *ToString(CompareResult result);

// Decides whether the file now on disk matches the one a process still has
// open.
struct FileComparator {
  virtual ~FileComparator() = default;

  // current_path: the candidate file on disk
  // original_path: a path through which the still-open original is reachable
  //                (/proc/<pid>/exe, /proc/<pid>/map_files/...)
  virtual CompareResult Compare(const std::string &current_path,
                                const std::string &original_path) = 0;
};

/**
 * @brief Byte-for-byte comparison through read-only shared mappings
 *
 * Both files are opened read-only and their sizes compared first; only files
 * of equal size are mapped and compared with memcmp. Every descriptor and
 * mapping is released before Compare() returns, on every path.
 *
 * Any open, stat or mmap failure is an Error and is logged with the offending
 * path and the system error text; the caller decides how to treat it.
 */
class MmapFileComparator : public FileComparator {
public:
  CompareResult Compare(const std::string &current_path,
                        const std::string &original_path) override;
};

} // namespace restart_check

#endif
