#include "file_utils.h"

#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

bool ReadTextFile(const std::filesystem::path& path, std::string* out, std::string* error) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open file: " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (out) {
    *out = buffer.str();
  }
  return true;
}

bool WriteTextFile(const std::filesystem::path& path, const std::string& text, std::string* error) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error) {
        *error = "failed to create output directory: " + ec.message();
      }
      return false;
    }
  }
  std::ofstream out(path);
  if (!out.is_open()) {
    if (error) {
      *error = "failed to write file: " + path.string();
    }
    return false;
  }
  out << text;
  if (!out.good()) {
    if (error) {
      *error = "failed to write file: " + path.string();
    }
    return false;
  }
  return true;
}

bool MoveFileReplacing(const std::filesystem::path& src,
                       const std::filesystem::path& dst,
                       std::string* error) {
  std::error_code ec;
  if (std::filesystem::exists(dst, ec)) {
    std::filesystem::remove(dst, ec);
    if (ec) {
      if (error) {
        *error = "failed to replace " + dst.string() + ": " + ec.message();
      }
      return false;
    }
  }
  std::filesystem::rename(src, dst, ec);
  if (!ec) {
    return true;
  }
  ec.clear();
  std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error) {
      *error = "failed to move " + src.string() + " -> " + dst.string() + ": " + ec.message();
    }
    return false;
  }
  std::filesystem::remove(src, ec);
  if (ec) {
    if (error) {
      *error = "moved copy but failed to remove " + src.string() + ": " + ec.message();
    }
    return false;
  }
  return true;
}

bool RemoveFileIfExists(const std::filesystem::path& path, std::string* error) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    if (error) {
      *error = "failed to remove " + path.string() + ": " + ec.message();
    }
    return false;
  }
  return true;
}

std::string GenerateRandomTag(size_t length) {
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(kAlphabet[dist(gen)]);
  }
  return out;
}
