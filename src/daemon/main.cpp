#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "app/held_transfers.hpp"
#include "app/object_source.hpp"
#include "app/object_store.hpp"
#include "app/transfer_service.hpp"
#include "ctl/ipc.hpp"
#include "proto/assembly_cache.hpp"
#include "transport/loopback_transport.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

static app::TransferService *g_xfer = nullptr;
static std::string           g_out_dir;

// Completed transfers waiting for ACCEPT (auto merge off)
static app::HeldTransfers g_held;

static void on_object(const chunk::MergeResult &r)
{
    if (!r.object)
        return;  // failure already logged by the service
    (void)app::save_object(g_out_dir, *r.object);
}

static std::string cmd_send(const std::string &path)
{
    auto src = app::FileSource::open(path);
    if (!src)
        return "ERR cannot open " + path;

    const std::string name = fs::path(path).filename().string();
    auto progress = [](std::uint32_t done, std::uint32_t total) {
        LOG_INFO("[XFER] progress %u/%u (%u%%)", done, total, done * 100 / total);
    };
    auto rep = g_xfer->send_object(*src, name, progress);
    if (rep.ok())
        return "OK sent " + name + " in " + std::to_string(rep.total) + " parts";

    std::string msg = std::string("ERR ") + app::send_errc_name(rep.error);
    if (rep.failed_index)
        msg += " at chunk " + std::to_string(*rep.failed_index);
    if (!rep.transport_error.detail.empty())
        msg += ": " + rep.transport_error.detail;
    return msg;
}

static std::string cmd_pending()
{
    const auto entries = g_xfer->cache().pending();
    if (entries.empty())
        return "OK no pending transfers";
    std::ostringstream os;
    os << "OK " << entries.size() << " pending";
    for (const auto &p : entries)
        os << "\n" << p.object_key << " " << p.received << "/" << p.total << " idle "
           << p.idle.count() << "ms";
    return os.str();
}

static void on_ready(std::vector<chunk::ChunkRecord> records)
{
    if (records.empty())
        return;
    LOG_SYSTEM("[XFER] %s ready (%zu parts), waiting for ACCEPT",
               records.front().meta.object_key.c_str(), records.size());
    g_held.put(std::move(records));
}

static std::string cmd_ready()
{
    const auto held = g_held.list();
    if (held.empty())
        return "OK nothing to accept";
    std::ostringstream os;
    os << "OK " << held.size() << " ready";
    for (const auto &h : held)
        os << "\n" << h.object_key << " " << h.object_size << " bytes";
    return os.str();
}

// ACCEPT merges and saves, DISCARD drops. Either way the entry is consumed.
static std::string cmd_take_ready(const std::string &key, bool accept)
{
    auto records = g_held.take(key);
    if (!records)
        return "ERR no ready transfer " + key;
    if (!accept)
    {
        g_xfer->discard(*records);
        return "OK discarded " + key;
    }

    auto r = g_xfer->merge(std::move(*records));
    if (!r.object)
        return std::string("ERR ") + chunk::merge_errc_name(r.error) + ": " + r.detail;
    auto saved = app::save_object(g_out_dir, *r.object);
    if (!saved)
        return "ERR cannot save " + r.object->name;
    return r.ok() ? "OK saved " + saved->string()
                  : "OK saved " + saved->string() + " (warning: " + r.detail + ")";
}

static std::string on_line(const std::string &line)
{
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK bye";
    }
    if (!g_xfer)
        return "ERR service not ready";

    if (line.rfind("SEND ", 0) == 0)
    {
        auto path = line.substr(5);
        auto l    = path.find_first_not_of(" \t\r");
        auto r    = path.find_last_not_of(" \t\r");
        if (l == std::string::npos)
        {
            LOG_WARN("CMD: SEND ignored (empty path)");
            return "ERR empty path";
        }
        path = path.substr(l, r - l + 1);
        LOG_INFO("CMD: SEND %s", path.c_str());
        return cmd_send(path);
    }
    if (line == "PENDING")
        return cmd_pending();
    if (line == "READY")
        return cmd_ready();
    if (line.rfind("ACCEPT ", 0) == 0)
        return cmd_take_ready(line.substr(7), true);
    if (line.rfind("DISCARD ", 0) == 0)
        return cmd_take_ready(line.substr(8), false);
    if (line == "SWEEP")
    {
        auto evicted = g_xfer->sweep_now();
        return "OK evicted " + std::to_string(evicted.size());
    }
    LOG_WARN("CMD: unknown '%s'", line.c_str());
    return "ERR unknown command";
}

int main()
{
    chunkrelay::init_log_from_env();

    const config::Config cfg = config::load_config_from_env();
    if (!config::validate(cfg))
        return 1;
    g_out_dir = ipc::expand_user(cfg.out_dir);

    LOG_SYSTEM("Config: chunk_size=%zu limit=%zu expiry=%lldms max_object=%llu out=%s",
               cfg.chunk_size, cfg.attachment_limit, (long long)cfg.expiry_window.count(),
               (unsigned long long)cfg.max_object_size, g_out_dir.c_str());

    transport::LoopbackTransport tx;
    chunk::AssemblyCache         cache;
    app::TransferService         xfer(tx, cache, app::options_from_config(cfg));
    xfer.set_on_object(&on_object);
    xfer.set_on_ready(&on_ready);
    // held transfers nobody accepted age out with the same window
    xfer.set_on_sweep([&xfer, window = cfg.expiry_window] {
        for (const auto &records : g_held.expire(window))
            xfer.discard(records);
    });

    if (!xfer.start())
    {
        LOG_ERROR("TransferService start failed");
        return 1;
    }
    g_xfer = &xfer;

    // IPC server
    std::string sock = ipc::expand_user(constants::ctl_sock_path());
    const bool  ok   = ipc::start_server(sock, &on_line);
    g_xfer           = nullptr;
    xfer.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    return 0;
}
