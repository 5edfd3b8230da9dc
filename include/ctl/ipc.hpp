#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Handles one command line; the returned text (may be empty) is written back
// to the client before the connection is closed.
using LineHandler = std::function<std::string(const std::string &)>;

// Blocks serving one line per connection until a "QUIT" line arrives.
bool        start_server(const std::string &sock_path, const LineHandler &on_line);
bool        send_line(const std::string &sock_path, const std::string &line,
                      std::string *reply = nullptr);
std::string expand_user(const std::string &path);

}  // namespace ipc
