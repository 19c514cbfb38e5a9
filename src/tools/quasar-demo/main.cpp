//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `quasar-demo` driver. It boots a simulated kernel, launches
// a child process over its standard stream, then runs a client and a server
// process that talk through a negotiated portal.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `quasar-demo` walkthrough.
/// @details Limits and the log level come from QUASAR_* environment
///          variables; see support/config.hpp.

#include "quasar/quasar.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

using namespace quasar;

namespace
{

void usage()
{
    std::cerr << "Usage: quasar-demo [a b]\n"
              << "  Adds two unsigned integers through a portal (default 40 2).\n"
              << "\nEnvironment:\n"
              << "  QUASAR_LOG_LEVEL        debug|info|warn|error|off\n"
              << "  QUASAR_MAX_FRAME_BYTES  largest accepted frame\n"
              << "  QUASAR_MAX_OUTSTANDING  calls in flight per portal\n";
}

/// @brief Launch a child and hand it a line over its standard stream.
int runLaunch(ipc::Kernel &kernel, ipc::ProcessId shell)
{
    auto launched = kernel.launch(shell, "echo");
    if (launched.is_err())
    {
        std::cerr << "launch failed: " << launched.error() << "\n";
        return 1;
    }
    const ipc::Launch child = launched.value();

    const std::string_view line = "hello from shell\n";
    auto written = kernel.write(shell,
                                child.stdinProducer,
                                std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(line.data()),
                                                              line.size()),
                                ipc::SyncMode::attempt());
    if (written.is_err())
    {
        std::cerr << "write failed: " << written.error() << "\n";
        return 1;
    }

    auto stdinHandle = kernel.standardStream(child.child);
    if (stdinHandle.is_err())
    {
        std::cerr << "no standard stream: " << stdinHandle.error() << "\n";
        return 1;
    }

    std::array<std::uint8_t, 64> buf{};
    auto got = kernel.read(child.child, stdinHandle.value(), buf, ipc::SyncMode::attempt());
    if (got.is_err())
    {
        std::cerr << "read failed: " << got.error() << "\n";
        return 1;
    }
    std::cout << kernel.processName(child.child) << " received: "
              << std::string_view(reinterpret_cast<const char *>(buf.data()), got.value().bytes);

    auto ended = kernel.terminate(child.child);
    if (ended.is_err())
    {
        std::cerr << "terminate failed: " << ended.error() << "\n";
        return 1;
    }
    return 0;
}

/// @brief Cross-wire two processes with a stream in each direction.
support::Result<std::pair<ipc::Handle, ipc::Handle>> crossWire(ipc::Kernel &kernel,
                                                               ipc::ProcessId from,
                                                               ipc::ProcessId to)
{
    auto pair = kernel.createStream(from);
    if (pair.is_err())
        return support::Err(pair.error());
    auto moved = kernel.adopt(from, pair.value().consumer, to);
    if (moved.is_err())
        return support::Err(moved.error());
    return support::Result<std::pair<ipc::Handle, ipc::Handle>>::Ok({pair.value().producer, moved.value()});
}

sched::Task<support::Result<void>> serverMain(portal::Portal &server)
{
    sched::CancelToken token;
    auto negotiated = co_await server.negotiate(token);
    if (negotiated.is_err())
        co_return negotiated;
    co_return co_await server.serve(
        [](const portal::RouteCall &call) -> support::Result<portal::Value>
        {
            const std::uint64_t a = call.arg("a")->asUnsigned();
            const std::uint64_t b = call.arg("b")->asUnsigned();
            return support::Result<portal::Value>::Ok(portal::Value::u64(a + b));
        },
        token);
}

sched::Task<support::Result<std::uint64_t>> clientMain(portal::Portal &client, std::uint64_t a, std::uint64_t b)
{
    sched::CancelToken token;
    auto negotiated = co_await client.negotiate(token);
    if (negotiated.is_err())
        co_return support::Err(negotiated.error());

    auto call = client.peerSchema().call("add", {{"a", portal::Value::u64(a)}, {"b", portal::Value::u64(b)}});
    if (call.is_err())
        co_return support::Err(call.error());

    auto sum = co_await client.send(call.take(), token);
    if (sum.is_err())
        co_return support::Err(sum.error());
    co_return support::Result<std::uint64_t>::Ok(sum.value().asUnsigned());
}

int runPortal(ipc::Kernel &kernel, const support::Config &config, std::uint64_t a, std::uint64_t b)
{
    const ipc::ProcessId clientPid = kernel.spawnProcess("client");
    const ipc::ProcessId serverPid = kernel.spawnProcess("server");

    auto up = crossWire(kernel, clientPid, serverPid);
    auto down = crossWire(kernel, serverPid, clientPid);
    if (up.is_err() || down.is_err())
    {
        std::cerr << "stream setup failed\n";
        return 1;
    }

    auto serverSchema = portal::Schema::builder().route("add", {{"a", "u64"}, {"b", "u64"}}, "u64").build();
    if (serverSchema.is_err())
    {
        std::cerr << "schema rejected: " << serverSchema.error() << "\n";
        return 1;
    }

    sched::Executor executor;
    auto server = portal::Portal::connect(
        kernel, serverPid, down.value().first, up.value().second, serverSchema.take(), executor, config);
    auto client =
        portal::Portal::connect(kernel, clientPid, up.value().first, down.value().second, {}, executor, config);
    if (server.is_err() || client.is_err())
    {
        std::cerr << "portal setup failed\n";
        return 1;
    }

    bool served = false;
    executor.spawn(
        [](portal::Portal &p, bool &done) -> sched::Task<void>
        {
            auto r = co_await serverMain(p);
            if (r.is_err())
                log::error("demo", "server stopped: ", r.error());
            done = true;
        }(*server.value(), served));

    auto sum = executor.blockOn(clientMain(*client.value(), a, b));
    if (sum.is_err())
    {
        std::cerr << "call failed: " << sum.error() << "\n";
        return 1;
    }
    std::cout << a << " + " << b << " = " << sum.value() << "\n";

    auto closed = client.value()->close();
    if (closed.is_err())
        log::warn("demo", "close: ", closed.error());
    executor.runUntil([&] { return served; });
    return 0;
}

bool parseU64(std::string_view text, std::uint64_t &out)
{
    if (text.empty())
        return false;
    std::uint64_t v = 0;
    for (char c : text)
    {
        if (c < '0' || c > '9')
            return false;
        v = v * 10 + static_cast<std::uint64_t>(c - '0');
    }
    out = v;
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    std::uint64_t a = 40;
    std::uint64_t b = 2;
    if (argc == 3)
    {
        if (!parseU64(argv[1], a) || !parseU64(argv[2], b))
        {
            usage();
            return 1;
        }
    }
    else if (argc != 1)
    {
        usage();
        return 1;
    }

    const support::Config config = support::Config::fromEnvironment();
    config.apply();

    ipc::Kernel kernel(config);
    const ipc::ProcessId shell = kernel.spawnProcess("shell");

    if (int rc = runLaunch(kernel, shell))
        return rc;
    return runPortal(kernel, config, a, b);
}
