#pragma once

#include <string>

namespace swisspair::core::util {

class AtomicFileWriter {
public:
    // Writes to "<path>.tmp" and renames it over the target, creating the
    // parent directory when needed.
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

bool ReadTextFile(const std::string& path, std::string& contents, std::string* error);

}  // namespace swisspair::core::util
