#include <cstdio>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkrelayctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  send <file>        split and send a file\n"
                         "  pending            list incomplete transfers\n"
                         "  ready              list completed transfers awaiting accept\n"
                         "  accept <key>       merge and save a completed transfer\n"
                         "  discard <key>      drop a completed transfer\n"
                         "  sweep              evict stale transfers now\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::fputs(reply.c_str(), stdout);
    return reply.rfind("ERR", 0) == 0 ? exitc::failure : exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto with_key = [&](const char *verb) -> int {
        if (args.size() != 2 || args[1].empty())
        {
            print_usage();
            return exitc::bad_args;
        }
        return send_line(std::string(verb) + " " + args[1]);
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"send",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             // the daemon has its own cwd
             std::error_code ec;
             auto            abs = std::filesystem::absolute(args[1], ec);
             if (ec || !std::filesystem::is_regular_file(abs, ec))
             {
                 std::fprintf(stderr, "error: not a regular file: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line("SEND " + abs.string());
         }},
        {"pending", [&]() -> int { return send_line("PENDING"); }},
        {"ready", [&]() -> int { return send_line("READY"); }},
        {"accept", [&]() -> int { return with_key("ACCEPT"); }},
        {"discard", [&]() -> int { return with_key("DISCARD"); }},
        {"sweep", [&]() -> int { return send_line("SWEEP"); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    chunkrelay::init_log_from_env();
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // Environment override first, then CLI --sock overrides env
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
