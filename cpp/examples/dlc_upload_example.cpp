/**
 * @file dlc_upload_example.cpp
 * @brief Example: upload a DLC package into a slot, load it, activate it and fire it.
 *
 * Runs entirely in-process against a SimulatedDevice, so no toy or Bluetooth adapter is
 * needed. Swap the SimulatedDevice for a real Transport to drive hardware.
 *
 * Usage:
 *   dlc_upload_example [--config <file>] [--slot <n>] [--chunk <bytes>] [--ack] [<dlc file>]
 *
 * Without a file argument a 1600-byte generated payload is uploaded.
 *
 * Key concepts shown:
 *  - LinkConfig layered loading and LifecycleGuard with the Logger module.
 *  - DlcController upload with a progress callback (runs on the dispatcher thread).
 *  - Slot lifecycle: load → activate → trigger_action, and the slot listener.
 *  - Recording the device in the KnownDeviceCache.
 */
#include "pll_dlc.hpp"
#include "dlc/simulated_device.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace plushlink;
using namespace plushlink::dlc;
using namespace plushlink::utils;

namespace
{

constexpr const char *kSimulatedAddress = "00:11:22:33:44:55";
constexpr size_t kGeneratedPayloadBytes = 1600;

struct Args
{
    std::string config;
    int slot{2};
    std::optional<size_t> chunk;
    bool ack{false};
    std::string file;
};

void usage(const char *prog)
{
    std::cerr << "Usage: " << prog
              << " [--config <file>] [--slot <n>] [--chunk <bytes>] [--ack] [<dlc file>]\n";
}

bool parse_args(int argc, char *argv[], Args &out)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
            out.config = argv[++i];
        else if (arg == "--slot" && i + 1 < argc)
            out.slot = std::atoi(argv[++i]);
        else if (arg == "--chunk" && i + 1 < argc)
            out.chunk = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        else if (arg == "--ack")
            out.ack = true;
        else if (!arg.empty() && arg[0] != '-' && out.file.empty())
            out.file = arg;
        else
            return false;
    }
    return true;
}

bool read_payload(const std::string &path, Bytes &out)
{
    if (path.empty())
    {
        out.resize(kGeneratedPayloadBytes);
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = static_cast<uint8_t>(i * 31 + 7);
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

void print_slots(const SlotSnapshot &slots)
{
    for (size_t i = 0; i < slots.size(); ++i)
        std::cout << "  slot " << i << ": " << to_string(slots[i]) << "\n";
}

} // namespace

int main(int argc, char *argv[])
{
    Args args;
    if (!parse_args(argc, argv, args))
    {
        usage(argv[0]);
        return 2;
    }

    LinkConfig cfg;
    try
    {
        cfg = LinkConfig::load(args.config);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 1;
    }

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule()));
    if (!cfg.apply_logging())
        std::cerr << "warning: logging to the console only\n";
    LOGGER_INFO("{} starting (pid {})", plushlink::platform::get_executable_name(),
                plushlink::platform::get_pid());

    Bytes payload;
    if (!read_payload(args.file, payload))
    {
        LOGGER_ERROR("cannot read DLC file '{}'", args.file);
        return 1;
    }

    DlcOptions options = cfg.dlc_options();
    SimulatedDeviceOptions dev_opts;
    dev_opts.slot_count = options.slot_count;
    dev_opts.protocol = options.protocol;
    dev_opts.max_write_size = std::max<size_t>(20, args.chunk.value_or(0));
    SimulatedDevice device(dev_opts);

    DlcController controller(device, options);
    controller.set_slot_listener(
        [](const SlotSnapshot &slots)
        {
            std::cout << "slot table changed:\n";
            print_slots(slots);
        });

    if (auto init = controller.initialize(); init.is_error())
        LOGGER_WARN("initial status query failed: {}", to_string(init.error()));

    UploadParams params;
    params.chunk_size = args.chunk;
    params.ack_mode = args.ack;
    params.progress = [](size_t sent, size_t total)
    { std::cout << "  progress: " << sent << " / " << total << " bytes\n"; };

    std::cout << "uploading " << payload.size() << " bytes to slot " << args.slot << "\n";
    auto report = controller.upload(args.slot, payload, params);
    controller.flush_callbacks();
    if (report.is_error())
    {
        std::cerr << "upload failed: " << to_string(report.error()) << " (code "
                  << report.error_code() << ")\n";
        return 1;
    }
    const UploadReport &r = report.content();
    std::cout << "uploaded " << r.total_bytes << " bytes in " << r.chunks_sent
              << " chunk(s) of " << r.chunk_size << " in " << r.elapsed.count() << " ms\n";

    if (auto st = controller.load(args.slot); st.is_error())
    {
        std::cerr << "load failed: " << to_string(st.error()) << "\n";
        return 1;
    }
    if (auto st = controller.activate(args.slot); st.is_error())
    {
        std::cerr << "activate failed: " << to_string(st.error()) << "\n";
        return 1;
    }
    if (auto st = controller.trigger_action(1, 0, 0); st.is_error())
        std::cerr << "trigger failed: " << to_string(st.error()) << "\n";

    std::cout << "final slot table:\n";
    print_slots(controller.slot_status());

    KnownDeviceCache cache(cfg.cache_path, cfg.cache_debounce);
    cache.add_or_update(kSimulatedAddress, DeviceUpdate{.device_name = "Simulated"});
    if (!cache.flush())
        LOGGER_WARN("could not write the known-device cache to '{}'", cfg.cache_path.string());

    return 0;
}
