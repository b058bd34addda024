#include "swisspair/core/util/AtomicFileWriter.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace swisspair::core::util {

namespace {

bool Fail(const std::string& message, std::string* error) {
    std::cerr << "[io] " << message << '\n';
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return Fail("Failed to create directory for " + path + ": " + ec.message(), error);
        }
    }

    const std::string temp_path = path + ".tmp";
    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Fail("Failed to open temp file: " + temp_path, error);
    }
    output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    output.flush();
    if (!output) {
        return Fail("Failed to write temp file: " + temp_path, error);
    }
    output.close();

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return Fail("rename failed for " + path, error);
    }
    return true;
}

bool ReadTextFile(const std::string& path, std::string& contents, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        if (error) {
            *error = "Failed to read " + path;
        }
        return false;
    }
    contents = buffer.str();
    return true;
}

}  // namespace swisspair::core::util
