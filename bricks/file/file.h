/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Cordon Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/


#ifndef CORDON_BRICKS_FILE_FILE_H
#define CORDON_BRICKS_FILE_FILE_H

#include "../../port.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include <errno.h>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include "exceptions.h"

namespace cordon {

// The filesystem calls of the pipeline: whole-file reads and writes, and flat directories of data files.
struct FileSystem {
  static constexpr char PathSeparatingSlash = '/';

  static inline std::string ReadFileAsString(const std::string& file_name) {
    std::ifstream fi(file_name, std::ifstream::binary);
    if (!fi.good()) {
      CORDON_THROW(CannotReadFileException(file_name));
    }
    std::string contents;
    char buffer[1 << 16];
    while (fi.read(buffer, sizeof(buffer)) || fi.gcount()) {
      contents.append(buffer, static_cast<size_t>(fi.gcount()));
    }
    if (fi.bad()) {
      CORDON_THROW(CannotReadFileException(file_name));
    }
    return contents;
  }

  // `file_name` is `const char*`, so that swapping the two arguments does not compile.
  static inline void WriteStringToFile(const std::string& contents, const char* file_name) {
    std::ofstream fo(file_name, std::ofstream::trunc | std::ofstream::binary);
    fo.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    fo.flush();
    if (!fo.good()) {
      CORDON_THROW(CannotWriteFileException(file_name));
    }
  }

  // Writes into `<file_name>.tmp`, then renames it over `file_name`.
  // A concurrent reader of `file_name` observes either the old or the new contents, never a partial write.
  static inline void WriteStringToFileAtomically(const std::string& contents, const std::string& file_name) {
    const std::string tmp_file_name = file_name + ".tmp";
    WriteStringToFile(contents, tmp_file_name.c_str());
    RenameFile(tmp_file_name, file_name);
  }

  static inline std::string JoinPath(const std::string& directory, const std::string& name) {
    if (name.empty()) {
      CORDON_THROW(FileException("Cannot join `" + directory + "` with an empty name."));
    }
    if (directory.empty() || name.front() == PathSeparatingSlash) {
      return name;
    }
    if (directory.back() == PathSeparatingSlash) {
      return directory + name;
    }
    return directory + PathSeparatingSlash + name;
  }

  static inline bool Exists(const std::string& path) {
    struct stat info;
    return ::stat(path.c_str(), &info) == 0;
  }

  static inline bool IsDir(const std::string& path) {
    struct stat info;
    if (::stat(path.c_str(), &info)) {
      CORDON_THROW(FileException(path));
    }
    return S_ISDIR(info.st_mode);
  }

  enum class MkDirParameters { ThrowExceptionOnError, Silent };
  static inline void MkDir(const std::string& directory,
                           MkDirParameters parameters = MkDirParameters::ThrowExceptionOnError) {
    if (::mkdir(directory.c_str(), 0755) && parameters == MkDirParameters::ThrowExceptionOnError) {
      CORDON_THROW(MkDirException(directory));
    }
  }

  static inline void RenameFile(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str())) {
      CORDON_THROW(FileException(from + " -> " + to));
    }
  }

  // The regular files of `directory`, sorted, so that every consumer processes them in the same order on every run.
  static inline std::vector<std::string> ListFilesSorted(const std::string& directory) {
    std::vector<std::string> names;
    const int error = ListFiles(directory, names);
    if (error == ENOENT) {
      CORDON_THROW(DirDoesNotExistException(directory));
    } else if (error == ENOTDIR) {
      CORDON_THROW(PathNotDirException(directory));
    } else if (error) {
      CORDON_THROW(FileException(directory));
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  enum class RmFileParameters { ThrowExceptionOnError, Silent };
  static inline void RmFile(const std::string& file_name,
                            RmFileParameters parameters = RmFileParameters::ThrowExceptionOnError) {
    if (::remove(file_name.c_str()) && parameters == RmFileParameters::ThrowExceptionOnError) {
      CORDON_THROW(FileException(file_name));
    }
  }

  enum class RmDirParameters { ThrowExceptionOnError, Silent };
  enum class RmDirRecursive { No, Yes };
  // With `RmDirRecursive::Yes` the files of `directory` go first. Only one level deep: data directories never nest.
  static inline void RmDir(const std::string& directory,
                           RmDirParameters parameters = RmDirParameters::ThrowExceptionOnError,
                           RmDirRecursive recursive = RmDirRecursive::No) {
    const bool silent = parameters == RmDirParameters::Silent;
    if (recursive == RmDirRecursive::Yes) {
      std::vector<std::string> names;
      if (ListFiles(directory, names) == 0) {
        for (const std::string& name : names) {
          RmFile(JoinPath(directory, name),
                 silent ? RmFileParameters::Silent : RmFileParameters::ThrowExceptionOnError);
        }
      } else if (!silent) {
        CORDON_THROW(FileException(directory));
      }
    }
    if (::rmdir(directory.c_str()) && !silent) {
      CORDON_THROW(FileException(directory));
    }
  }

  // A scratch directory, emptied both on construction and on destruction. The destructor never throws.
  class ScopedTmpDir final {
   public:
    explicit ScopedTmpDir(const std::string& directory) : directory_(directory) {
      RmDir(directory_, RmDirParameters::Silent, RmDirRecursive::Yes);
      MkDir(directory_, MkDirParameters::Silent);
    }
    ~ScopedTmpDir() { RmDir(directory_, RmDirParameters::Silent, RmDirRecursive::Yes); }
    const std::string& Path() const { return directory_; }

   private:
    std::string directory_;
  };

 private:
  // Appends the names of the regular files of `directory` to `names`. Returns `errno` of the failed call, or zero.
  static inline int ListFiles(const std::string& directory, std::vector<std::string>& names) {
    DIR* dir = ::opendir(directory.c_str());
    if (!dir) {
      return errno;
    }
    while (const struct dirent* entry = ::readdir(dir)) {
      const char* const name = entry->d_name;
      if (!*name || !::strcmp(name, ".") || !::strcmp(name, "..")) {
        continue;
      }
      struct stat info;
      const std::string path = JoinPath(directory, name);
      if (::stat(path.c_str(), &info) == 0 && !S_ISDIR(info.st_mode)) {
        names.push_back(name);
      }
    }
    ::closedir(dir);
    return 0;
  }
};

}  // namespace cordon

#endif  // CORDON_BRICKS_FILE_FILE_H
