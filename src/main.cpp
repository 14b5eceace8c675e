#include <cstdlib>
#include <iostream>
#include <memory>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define CPPHTTPLIB_THREAD_POOL_COUNT 8
#include "api.hpp"
#include "config.hpp"
#include "shutdown_watcher.hpp"
#include "storage.hpp"

#include <httplib.h>

int main()
{
    try
    {
        const ServiceConfig cfg     = load_config_from_env();
        const sigset_t      signals = block_shutdown_signals();

        auto store = std::make_unique<InMemoryUserStore>();

        httplib::Server svr;
        configure_routes(svr, *store, cfg);

        bool ok = false;
        {
            ShutdownWatcher watcher(svr, signals);
            std::cout << "[userdesk] " << cfg.version << " listening on " << cfg.host << ":" << cfg.port
                      << std::endl;
            ok = svr.listen(cfg.host, cfg.port);
        }

        if (!ok)
        {
            std::cerr << "Fatal error: could not listen on " << cfg.host << ":" << cfg.port << '\n';
            return EXIT_FAILURE;
        }
        std::cout << "[userdesk] stopped" << std::endl;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Fatal error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "Fatal error: unknown exception\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
