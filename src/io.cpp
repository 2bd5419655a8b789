#include "corvo/io.hpp"
#include "corvo/error.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace corvo {

std::string read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) throw FileNotFoundError("File '" + path + "' was not found");
    if (fs::is_directory(path, ec)) throw FileAccessError("'" + path + "' is a directory, not a file");

    std::ifstream f(path, std::ios::binary);
    if (!f) throw FileAccessError("File '" + path + "' could not be opened for reading");

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw FileAccessError("Reading '" + path + "' failed");

    std::string content = ss.str();
    spdlog::debug("read {} bytes from '{}'", content.size(), path);
    return content;
}

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw FileAccessError("File '" + path + "' could not be opened for writing");

    f << content;
    f.flush();
    if (!f) throw FileAccessError("Writing '" + path + "' failed");
    spdlog::debug("wrote {} bytes to '{}'", content.size(), path);
}

} // namespace corvo
