#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "proto/reassembler.hpp"

namespace app
{

// Final path component of a remote-supplied name; "object.bin" when nothing
// usable is left.
std::string safe_file_name(const std::string &name);

// Writes `obj` into `dir` as its safe name, or name.1 .. name.<max_copies - 1>
// when taken. An existing file is never opened for writing; nullopt when every
// candidate exists or the write fails.
std::optional<std::filesystem::path> save_object(const std::filesystem::path &dir,
                                                 const chunk::Object         &obj,
                                                 int                          max_copies = 1000);

}  // namespace app
